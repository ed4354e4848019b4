// ==============================================================================
// collector/config.hpp - Файл конфигурации (--config)
// ==============================================================================
//
// yaml-cpp для разбора YAML
//
// Значения из файла - умолчания; флаги командной строки, заданные явно,
// имеют приоритет.
//
// ==============================================================================

#ifndef COLLECTOR_CONFIG_HPP
#define COLLECTOR_CONFIG_HPP

#include "collector/cli.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace collector::config {

/// Значения из YAML; nullopt - ключ не задан
struct FileConfig {
    std::optional<bool> include_hidden;
    std::optional<bool> follow_symlinks;
    std::optional<int> depth;
    std::optional<double> max_size_mb;
    std::optional<bool> append;
    std::optional<bool> encoding_report;
    std::optional<int> workers;
    std::optional<std::filesystem::path> output;
    std::optional<int> verbose;
};

struct LoadResult {
    bool ok = false;
    FileConfig config;
    std::string error;  // "<path>: <причина>"
};

/// Загрузить YAML mapping
///
/// Ошибки: файл не читается, YAML невалиден, корень не mapping,
/// неизвестный ключ, значение неверного типа или вне диапазона.
LoadResult load_config(const std::filesystem::path& path);

/// Разобрать YAML из строки (тот же контракт, что load_config)
LoadResult parse_config(const std::string& yaml, const std::string& origin);

/// Применить значения файла к опциям, не трогая явно заданные флаги
void apply_config(const FileConfig& file, cli::CollectOptions& options,
                  cli::GlobalOptions& global, const cli::ExplicitFlags& flags);

}  // namespace collector::config

#endif  // COLLECTOR_CONFIG_HPP
