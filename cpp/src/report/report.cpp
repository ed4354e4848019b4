// ==============================================================================
// report.cpp - Итоговый отчёт прогона
// ==============================================================================

#include "collector/report.hpp"

#include "collector/platform.hpp"

#include <cstdio>
#include <rapidjson/document.h>

namespace collector::report {

std::string human_size(std::uint64_t bytes) {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};

    double n = static_cast<double>(bytes);
    char buf[64];
    for (const char* unit : kUnits) {
        if (n < 1024.0) {
            std::snprintf(buf, sizeof(buf), "%3.1f%s", n, unit);
            return buf;
        }
        n /= 1024.0;
    }
    std::snprintf(buf, sizeof(buf), "%.1fPB", n);
    return buf;
}

std::string render_summary(const ingest::RunStatistics& stats,
                           const std::filesystem::path& output_path,
                           std::optional<std::uint64_t> output_size, bool encoding_report) {
    std::string out = "\n\nSummary:\n";
    out += "  Files discovered: " + std::to_string(stats.total_files) + "\n";
    out += "  Files processed:  " + std::to_string(stats.processed) + "\n";
    if (stats.skipped_binary > 0) {
        out += "  Skipped (binary-like): " + std::to_string(stats.skipped_binary) + "\n";
    }
    if (stats.skipped_large > 0) {
        out += "  Skipped (too large): " + std::to_string(stats.skipped_large) + "\n";
    }
    if (stats.errors > 0) {
        out += "  Errors: " + std::to_string(stats.errors) + "\n";
    }

    out += "  Output file: " + platform::path_to_utf8(output_path);
    if (output_size.has_value()) {
        out += "  (size: " + human_size(*output_size) + ")";
    }
    out += "\n";

    if (encoding_report && !stats.encodings.empty()) {
        out += "\nEncodings detected (sample):\n";
        std::size_t shown = 0;
        for (const auto& [path, encoding] : stats.encodings) {
            if (shown == kEncodingReportLimit) {
                break;
            }
            out += "  " + path + " -> " + encoding + "\n";
            ++shown;
        }
        if (stats.encodings.size() > shown) {
            out += "  ... and " + std::to_string(stats.encodings.size() - shown) + " more\n";
        }
    }

    out += "\nDone.\n";
    return out;
}

void summary_to_json(const ingest::RunStatistics& stats, const std::filesystem::path& output_path,
                     rapidjson::Document& doc) {
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("files_discovered", static_cast<std::uint64_t>(stats.total_files), alloc);
    doc.AddMember("processed", static_cast<std::uint64_t>(stats.processed), alloc);
    doc.AddMember("skipped_binary", static_cast<std::uint64_t>(stats.skipped_binary), alloc);
    doc.AddMember("skipped_large", static_cast<std::uint64_t>(stats.skipped_large), alloc);
    doc.AddMember("errors", static_cast<std::uint64_t>(stats.errors), alloc);

    const std::string out = platform::path_to_utf8(output_path);
    doc.AddMember("output", rapidjson::Value(out.c_str(), alloc), alloc);

    rapidjson::Value encodings(rapidjson::kArrayType);
    for (const auto& [path, encoding] : stats.encodings) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("path", rapidjson::Value(path.c_str(), alloc), alloc);
        item.AddMember("encoding", rapidjson::Value(encoding.c_str(), alloc), alloc);
        encodings.PushBack(item, alloc);
    }
    doc.AddMember("encodings", encodings, alloc);
}

}  // namespace collector::report
