// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// RapidJSON для JSON сериализации
// Только этот модуль пишет в stdout/stderr
// Байты первичны, избегаем std::endl
//
// ==============================================================================

#include "collector/output.hpp"

#include "collector/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <stdexcept>

namespace collector::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Очистка текущей строки терминала
constexpr const char* ANSI_CLEAR_LINE = "\r\x1b[2K";

std::string errno_message() {
    return std::strerror(errno);
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    progress_end();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    // Сообщение поверх прогресс-бара: стираем бар, печатаем, рисуем заново
    if (progress_active_) {
        write(Stream::Stderr, ANSI_CLEAR_LINE);
    }

    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);

    if (progress_active_) {
        render_progress();
    }
}

void Writer::info(std::string_view message) {
    // Подавляем информационные сообщения при --quiet
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки всегда печатаются, даже при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::progress_begin(std::string_view label, std::size_t total) {
    // Прогресс скрыт при verbose или quiet
    if (config_.verbose > 0 || config_.quiet) {
        return;
    }

    progress_label_ = std::string(label);
    progress_total_ = total;
    progress_current_ = 0;
    progress_active_ = true;
    render_progress();
}

void Writer::progress_tick(std::size_t current) {
    if (!progress_active_) {
        return;
    }

    progress_current_ = std::min(current, progress_total_);
    render_progress();
}

void Writer::progress_end() {
    if (!progress_active_) {
        return;
    }

    progress_active_ = false;
    write(Stream::Stderr, "\n");
    progress_label_.clear();
    flush();
}

void Writer::render_progress() {
    write(Stream::Stderr, "\r");
    write(Stream::Stderr, format_progress_bar(progress_label_, progress_current_, progress_total_));
    std::fflush(stderr);
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// ProgressReporter
// ----------------------------------------------------------------------------

TerminalProgress::TerminalProgress(Writer& writer, std::string_view label, std::size_t total)
    : writer_(writer) {
    writer_.progress_begin(label, total);
}

TerminalProgress::~TerminalProgress() {
    finish();
}

void TerminalProgress::advance(std::size_t n) {
    current_ += n;
    writer_.progress_tick(current_);
}

void TerminalProgress::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    writer_.progress_end();
}

PlainProgress::PlainProgress(Writer& writer, std::string_view label, std::size_t total)
    : writer_(writer), label_(label), total_(total) {}

void PlainProgress::advance(std::size_t n) {
    current_ += n;
    if (total_ == 0) {
        return;
    }
    const std::size_t decile = std::min<std::size_t>(current_ * 10 / total_, 10);
    if (decile > last_decile_) {
        last_decile_ = decile;
        report();
    }
}

void PlainProgress::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    // Финальная строка, если последний десяток ещё не напечатан
    if (last_decile_ < 10) {
        report();
    }
}

void PlainProgress::report() {
    writer_.info(label_ + ": " + std::to_string(current_) + "/" + std::to_string(total_));
}

std::unique_ptr<ProgressReporter> make_progress_reporter(Writer& writer, std::string_view label,
                                                         std::size_t total) {
    const OutputConfig& cfg = writer.config();
    if (cfg.quiet || cfg.verbose > 0) {
        return std::make_unique<NullProgress>();
    }
    if (platform::is_tty_stderr()) {
        return std::make_unique<TerminalProgress>(writer, label, total);
    }
    return std::make_unique<PlainProgress>(writer, label, total);
}

// ----------------------------------------------------------------------------
// FileSink
// ----------------------------------------------------------------------------

FileSink::FileSink(const std::filesystem::path& path, bool append) : path_(path) {
#ifdef _WIN32
    // Windows: использовать _wfopen для Unicode путей
    file_ = _wfopen(path.c_str(), append ? L"ab" : L"wb");
#else
    file_ = std::fopen(path.c_str(), append ? "ab" : "wb");
#endif

    if (file_ == nullptr) {
        throw std::runtime_error("Cannot open output file " + platform::path_to_utf8(path) +
                                 " for writing: " + errno_message());
    }
}

FileSink::~FileSink() {
    if (file_ != nullptr) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

void FileSink::write(std::string_view bytes) {
    if (file_ == nullptr) {
        throw std::runtime_error("write to closed output file " + platform::path_to_utf8(path_));
    }
    if (bytes.empty()) {
        return;
    }
    if (std::fwrite(bytes.data(), 1, bytes.size(), file_) != bytes.size()) {
        throw std::runtime_error("failed to write output file " + platform::path_to_utf8(path_) +
                                 " - " + errno_message());
    }
}

void FileSink::close() {
    if (file_ == nullptr) {
        return;
    }
    FILE* f = file_;
    file_ = nullptr;
    if (std::fclose(f) != 0) {
        throw std::runtime_error("failed to close output file " + platform::path_to_utf8(path_) +
                                 " - " + errno_message());
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    std::string result = "[+] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_error(std::string_view message) {
    std::string result = "[x] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_warning(std::string_view message) {
    std::string result = "[!] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_debug(std::string_view message) {
    std::string result = "[*] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_progress_bar(std::string_view label, std::size_t current, std::size_t total) {
    const std::size_t shown = std::min(current, total);
    const std::size_t filled = total == 0 ? BAR_WIDTH : shown * BAR_WIDTH / total;
    const std::size_t percent = total == 0 ? 100 : shown * 100 / total;

    std::string line(label);
    line += " [";
    for (std::size_t i = 0; i < BAR_WIDTH; ++i) {
        line += (i < filled) ? BAR_FILL : BAR_EMPTY;
    }
    line += "] ";

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%3zu%% ", percent);
    line += buf;
    line += std::to_string(shown) + "/" + std::to_string(total);
    return line;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    // Проверяем TTY через platform модуль
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    } else {
        return platform::is_tty_stderr();
    }
}

}  // namespace collector::output
