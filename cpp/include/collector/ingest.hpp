// ==============================================================================
// collector/ingest.hpp - Конвейер сборки файлов
// ==============================================================================
//
// Назначение:
// - Материализация списка файлов (discovery дренируется один раз)
// - Защита от включения собственного файла результата
// - Последовательная обработка: размер -> выборка -> классификация ->
//   заголовок -> потоковое декодирование -> запись в Sink
// - Накопление RunStatistics
//
// Ошибка одного файла не прерывает обработку остальных.
//
// ==============================================================================

#ifndef COLLECTOR_INGEST_HPP
#define COLLECTOR_INGEST_HPP

#include "collector/discovery.hpp"
#include "collector/output.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace collector::ingest {

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Размер начальной выборки для классификации
constexpr std::size_t kSampleBytes = 8192;

/// Размер чанка потокового чтения остатка файла
constexpr std::size_t kChunkBytes = 65536;

/// Разделитель перед путём в заголовке файла
constexpr const char* kHeaderSeparator = "----";

// ----------------------------------------------------------------------------
// IngestOptions / RunStatistics
// ----------------------------------------------------------------------------

struct IngestOptions {
    /// Файлы строго больше лимита пропускаются; nullopt = без лимита
    std::optional<std::uint64_t> max_size_bytes;

    /// Записывать путь -> метку кодировки для отчёта
    bool record_encodings = false;
};

struct RunStatistics {
    std::size_t total_files = 0;
    std::size_t processed = 0;
    std::size_t skipped_binary = 0;
    std::size_t skipped_large = 0;
    std::size_t errors = 0;

    /// (путь, метка кодировки последнего чанка) в порядке обработки
    std::vector<std::pair<std::string, std::string>> encodings;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Дренировать discovery в список, оставив только существующие обычные файлы
std::vector<std::filesystem::path> gather_file_list(const std::vector<std::filesystem::path>& inputs,
                                                    const io::DiscoveryOptions& opt);

/// Убрать из списка файл результата (сравнение по weakly_canonical)
std::vector<std::filesystem::path> exclude_output_file(std::vector<std::filesystem::path> files,
                                                       const std::filesystem::path& output_path);

/// Заголовок файла: "\n\n----\n<path>\n"
std::string format_file_header(const std::filesystem::path& path);

/// Первая строка нового файла результата (не пишется в режиме append)
/// "# Collected files output generated on <timestamp>\n"
std::string format_run_banner(std::string_view timestamp);

/// Определить путь файла результата
///
/// - существующая директория -> <dir>/collected_files_<file_stamp>.txt
/// - иначе сам путь; недостающие родительские директории создаются
/// - не задан -> <cwd>/collected_files_<file_stamp>.txt
///
/// @param file_stamp Метка времени для имени файла (YYYYmmdd_HHMMSS)
/// @throws std::filesystem::filesystem_error если родителя создать нельзя
std::filesystem::path prepare_output_path(const std::optional<std::filesystem::path>& output,
                                          std::string_view file_stamp);

/// Обработать файлы по порядку и записать текстовые в sink
///
/// @param files Материализованный список файлов
/// @param sink Приёмник результата
/// @param opt Лимит размера и запись кодировок
/// @param progress advance(1) после каждого файла; finish() вызывает вызывающий
/// @param log Диагностика пропусков и ошибок (debug уровень)
/// @return Итоговая статистика прогона
RunStatistics ingest_files(const std::vector<std::filesystem::path>& files, output::Sink& sink,
                           const IngestOptions& opt, output::ProgressReporter& progress,
                           output::Writer& log);

}  // namespace collector::ingest

#endif  // COLLECTOR_INGEST_HPP
