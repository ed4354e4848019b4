// ==============================================================================
// ingest.cpp - Конвейер сборки файлов
// ==============================================================================
//
// Последовательная обработка, одна нить управления: статистика и позиция
// записи в Sink принадлежат этому модулю и не требуют синхронизации.
//
// ==============================================================================

#include "collector/ingest.hpp"

#include "collector/classifier.hpp"
#include "collector/encoding.hpp"
#include "collector/platform.hpp"
#include "collector/report.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace collector::ingest {

namespace {

enum class Outcome { Processed, SkippedLarge, SkippedBinary, Error };

/// Сравнимая форма пути: weakly_canonical(absolute), при ошибке - absolute
std::filesystem::path comparable_path(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(p, ec);
    if (ec) {
        return p.lexically_normal();
    }
    std::filesystem::path canon = std::filesystem::weakly_canonical(abs, ec);
    if (ec) {
        return abs.lexically_normal();
    }
    return canon;
}

/// Прочитать до n байт; ошибка чтения (не EOF) - исключение
std::string read_block(std::ifstream& in, std::size_t n, const std::filesystem::path& file) {
    std::string buf(n, '\0');
    in.read(buf.data(), static_cast<std::streamsize>(n));
    if (in.bad()) {
        throw std::runtime_error("failed to read file " + platform::path_to_utf8(file));
    }
    buf.resize(static_cast<std::size_t>(in.gcount()));
    return buf;
}

/// Потоковый декодер: каждый блок декодируется независимо.
/// Незавершённая UTF-8 последовательность на границе переносится в следующий
/// блок, только если остальная часть блока - корректный UTF-8.
class ChunkDecoder {
public:
    explicit ChunkDecoder(output::Sink& sink) : sink_(sink) {}

    void consume(std::string data) {
        if (!carry_.empty()) {
            data.insert(0, carry_);
            carry_.clear();
        }

        const std::size_t tail = content::incomplete_utf8_tail(data);
        if (tail > 0 &&
            content::is_valid_utf8(std::string_view(data).substr(0, data.size() - tail))) {
            carry_.assign(data, data.size() - tail, tail);
            data.resize(data.size() - tail);
        }
        emit(data);
    }

    void finish() {
        if (!carry_.empty()) {
            std::string rest;
            rest.swap(carry_);
            emit(rest);
        }
    }

    const std::string& encoding() const { return encoding_; }

private:
    void emit(std::string_view data) {
        if (data.empty()) {
            return;
        }
        content::DecodeResult decoded = content::decode(data);
        encoding_ = std::move(decoded.encoding);
        sink_.write(decoded.text);
    }

    output::Sink& sink_;
    std::string carry_;
    std::string encoding_ = "unknown";
};

Outcome ingest_one(const std::filesystem::path& file, output::Sink& sink, const IngestOptions& opt,
                   std::string& encoding, output::Writer& log) {
    const std::string display = platform::path_to_utf8(file);

    // 1. Размер: файл больше лимита не открывается
    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(file, ec);
    if (!ec && opt.max_size_bytes.has_value() && size > *opt.max_size_bytes) {
        log.debug("Skipped (too large " + report::human_size(size) + "): " + display);
        return Outcome::SkippedLarge;
    }

    // 2. Выборка
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        log.debug("Error reading (sample) " + display + ": cannot open file");
        return Outcome::Error;
    }
    std::string sample = read_block(in, kSampleBytes, file);

    // 3. Классификация
    if (content::looks_binary(sample)) {
        log.debug("Skipped (binary-like): " + display);
        return Outcome::SkippedBinary;
    }

    // 4. Заголовок + потоковое декодирование
    sink.write(format_file_header(file));

    ChunkDecoder decoder(sink);
    if (!sample.empty()) {
        decoder.consume(std::move(sample));
    }
    for (;;) {
        std::string chunk = read_block(in, kChunkBytes, file);
        if (chunk.empty()) {
            break;
        }
        decoder.consume(std::move(chunk));
    }
    decoder.finish();

    encoding = decoder.encoding();
    return Outcome::Processed;
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> gather_file_list(const std::vector<std::filesystem::path>& inputs,
                                                    const io::DiscoveryOptions& opt) {
    std::vector<std::filesystem::path> files;
    for (auto& p : io::discover_files(inputs, opt)) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(p, ec)) {
            files.push_back(std::move(p));
        }
    }
    return files;
}

std::vector<std::filesystem::path> exclude_output_file(std::vector<std::filesystem::path> files,
                                                       const std::filesystem::path& output_path) {
    const std::filesystem::path target = comparable_path(output_path);
    files.erase(std::remove_if(files.begin(), files.end(),
                               [&](const std::filesystem::path& p) {
                                   return comparable_path(p) == target;
                               }),
                files.end());
    return files;
}

std::string format_file_header(const std::filesystem::path& path) {
    std::string header = "\n\n";
    header += kHeaderSeparator;
    header += "\n";
    header += platform::path_to_utf8(path);
    header += "\n";
    return header;
}

std::string format_run_banner(std::string_view timestamp) {
    std::string banner = "# Collected files output generated on ";
    banner.append(timestamp);
    banner += "\n";
    return banner;
}

std::filesystem::path prepare_output_path(const std::optional<std::filesystem::path>& output,
                                          std::string_view file_stamp) {
    const std::string default_name = "collected_files_" + std::string(file_stamp) + ".txt";

    if (!output.has_value() || output->empty()) {
        return std::filesystem::current_path() / default_name;
    }

    const std::filesystem::path& out = *output;
    std::error_code ec;
    if (std::filesystem::is_directory(out, ec)) {
        return out / default_name;
    }

    const std::filesystem::path parent = out.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent);
    }
    return out;
}

RunStatistics ingest_files(const std::vector<std::filesystem::path>& files, output::Sink& sink,
                           const IngestOptions& opt, output::ProgressReporter& progress,
                           output::Writer& log) {
    RunStatistics stats;
    stats.total_files = files.size();

    for (const auto& file : files) {
        std::string encoding;
        Outcome outcome = Outcome::Error;

        try {
            outcome = ingest_one(file, sink, opt, encoding, log);
        } catch (const std::exception& e) {
            // Ошибка изолирована одним файлом
            log.debug("Error processing " + platform::path_to_utf8(file) + ": " + e.what());
            outcome = Outcome::Error;
        }

        switch (outcome) {
        case Outcome::Processed:
            ++stats.processed;
            if (opt.record_encodings) {
                stats.encodings.emplace_back(platform::path_to_utf8(file), encoding);
            }
            break;
        case Outcome::SkippedLarge:
            ++stats.skipped_large;
            break;
        case Outcome::SkippedBinary:
            ++stats.skipped_binary;
            break;
        case Outcome::Error:
            ++stats.errors;
            break;
        }

        progress.advance(1);
    }

    return stats;
}

}  // namespace collector::ingest
