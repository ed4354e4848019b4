// ==============================================================================
// collect.cpp - Прогон сборки
// ==============================================================================

#include "collector/collect.hpp"

#include "collector/discovery.hpp"
#include "collector/ingest.hpp"
#include "collector/platform.hpp"
#include "collector/report.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace collector::app {

namespace {

// ----------------------------------------------------------------------------
// Подготовка входов
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> absolute_inputs(const std::vector<std::filesystem::path>& roots,
                                                   output::Writer& writer) {
    std::vector<std::filesystem::path> inputs;
    inputs.reserve(roots.size());
    for (const auto& root : roots) {
        std::error_code ec;
        std::filesystem::path abs = std::filesystem::absolute(root, ec);
        if (ec) {
            abs = root;
        }
        if (!std::filesystem::exists(abs, ec)) {
            writer.warn("input " + platform::path_to_utf8(abs) +
                        " does not exist and will be skipped");
        }
        inputs.push_back(std::move(abs));
    }
    return inputs;
}

io::DiscoveryOptions discovery_options(const cli::CollectOptions& opt) {
    io::DiscoveryOptions d;
    d.include_hidden = opt.include_hidden;
    d.follow_symlinks = opt.follow_symlinks;
    d.max_depth = opt.max_depth;
    return d;
}

// ----------------------------------------------------------------------------
// --debug-discovery
// ----------------------------------------------------------------------------

int run_debug_discovery(const std::vector<std::filesystem::path>& inputs,
                        const cli::CollectOptions& opt, output::Writer& writer) {
    io::DiscoveryOptions d = discovery_options(opt);
    d.trace = [&writer](std::string_view line) { writer.info(line); };

    writer.write_line(output::Stream::Stdout, "Running discovery in debug mode...");
    io::Discoverer discoverer(inputs, d);
    std::filesystem::path p;
    while (discoverer.next(p)) {
        writer.write_line(output::Stream::Stdout, " WOULD-PROCESS: " + platform::path_to_utf8(p));
    }
    writer.write_line(output::Stream::Stdout, "Debug discovery finished.");
    return EXIT_OK;
}

}  // namespace

// ----------------------------------------------------------------------------
// Сборка
// ----------------------------------------------------------------------------

int run_collect(const cli::CollectOptions& opt, output::Writer& writer) {
    const std::vector<std::filesystem::path> inputs = absolute_inputs(opt.roots, writer);

    std::filesystem::path out_path;
    try {
        out_path =
            ingest::prepare_output_path(opt.output, platform::local_timestamp("%Y%m%d_%H%M%S"));
    } catch (const std::filesystem::filesystem_error& e) {
        writer.error(std::string("Cannot prepare output path: ") + e.what());
        return EXIT_OUTPUT;
    }
    std::error_code ec;
    const bool append_mode = opt.append && std::filesystem::exists(out_path, ec);

    if (opt.debug_discovery) {
        return run_debug_discovery(inputs, opt, writer);
    }

    if (opt.workers > 1) {
        writer.warn("--workers " + std::to_string(opt.workers) +
                    " requested, files are processed sequentially");
    }

    // 1. Список файлов
    std::vector<std::filesystem::path> files;
    try {
        io::DiscoveryOptions d = discovery_options(opt);
        d.trace = [&writer](std::string_view line) { writer.trace(line); };
        files = ingest::gather_file_list(inputs, d);
    } catch (const std::exception& e) {
        writer.error(std::string("Failed during discovery: ") + e.what());
        return EXIT_USAGE;
    }

    // 2. Без собственного файла результата
    files = ingest::exclude_output_file(std::move(files), out_path);

    if (files.empty()) {
        writer.write_line(output::Stream::Stdout, "No files found to process. Exiting.");
        return EXIT_OK;
    }

    // 3. Открытие результата
    std::unique_ptr<output::FileSink> sink;
    try {
        sink = std::make_unique<output::FileSink>(out_path, append_mode);
    } catch (const std::exception& e) {
        writer.error(e.what());
        return EXIT_OUTPUT;
    }

    if (!append_mode) {
        sink->write(ingest::format_run_banner(platform::local_timestamp("%Y-%m-%d %H:%M:%S")));
    }

    writer.info("Collecting " + std::to_string(files.size()) + " file(s) into " +
                platform::path_to_utf8(out_path));

    // 4. Обработка
    ingest::IngestOptions ingest_opt;
    ingest_opt.max_size_bytes = opt.max_size_bytes;
    ingest_opt.record_encodings = opt.encoding_report || opt.json;

    auto progress = output::make_progress_reporter(writer, "Processing", files.size());
    const ingest::RunStatistics stats =
        ingest::ingest_files(files, *sink, ingest_opt, *progress, writer);
    progress->finish();
    sink->close();

    // 5. Отчёт
    if (opt.json) {
        rapidjson::Document doc;
        report::summary_to_json(stats, out_path, doc);
        writer.write_json_pretty(doc);
        return EXIT_OK;
    }

    std::optional<std::uint64_t> out_size;
    const std::uintmax_t size = std::filesystem::file_size(out_path, ec);
    if (!ec) {
        out_size = static_cast<std::uint64_t>(size);
    }
    writer.write(output::Stream::Stdout,
                 report::render_summary(stats, out_path, out_size, opt.encoding_report));
    return EXIT_OK;
}

}  // namespace collector::app
