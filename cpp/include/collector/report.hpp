// ==============================================================================
// collector/report.hpp - Итоговый отчёт прогона
// ==============================================================================
//
// RapidJSON для JSON сериализации
//
// Назначение:
// - Текстовая сводка по RunStatistics
// - JSON-представление сводки (--json)
// - Человекочитаемые размеры
//
// ==============================================================================

#ifndef COLLECTOR_REPORT_HPP
#define COLLECTOR_REPORT_HPP

#include "collector/ingest.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator, typename StackAllocator>
class GenericDocument;
template <typename CharType>
struct UTF8;
using Document =
    GenericDocument<UTF8<char>, MemoryPoolAllocator<CrtAllocator>, CrtAllocator>;
}  // namespace rapidjson

namespace collector::report {

/// Сколько кодировок показывать в текстовой сводке
constexpr std::size_t kEncodingReportLimit = 10;

/// "%3.1f<unit>" по шкале B, KB, MB, GB, TB; дальше "%.1fPB"
std::string human_size(std::uint64_t bytes);

/// Текстовая сводка
///
/// @param stats Статистика прогона
/// @param output_path Файл результата
/// @param output_size Размер файла результата (nullopt - не удалось получить)
/// @param encoding_report Печатать ли кодировки (первые kEncodingReportLimit)
std::string render_summary(const ingest::RunStatistics& stats,
                           const std::filesystem::path& output_path,
                           std::optional<std::uint64_t> output_size, bool encoding_report);

/// Заполнить doc JSON-объектом сводки
///
/// {"files_discovered", "processed", "skipped_binary", "skipped_large", "errors",
///  "output", "encodings": [{"path", "encoding"}, ...]}
void summary_to_json(const ingest::RunStatistics& stats, const std::filesystem::path& output_path,
                     rapidjson::Document& doc);

}  // namespace collector::report

#endif  // COLLECTOR_REPORT_HPP
