// ==============================================================================
// collector/cli.hpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: сообщения об ошибках в формате clap
//
// Назначение:
// - Парсинг argv в CollectOptions
// - Генерация --help / --version
// - Учёт флагов, заданных явно (для слияния с --config)
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef COLLECTOR_CLI_HPP
#define COLLECTOR_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace collector::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable), --verbose
    bool quiet = false;  // -q, --quiet
};

// ----------------------------------------------------------------------------
// Опции сборки
// ----------------------------------------------------------------------------

/// Лимит размера по умолчанию, MB
constexpr double DEFAULT_MAX_SIZE_MB = 200.0;

/// MB -> байты; 0 (или меньше) = без лимита
std::optional<std::uint64_t> max_size_from_mb(double mb);

struct CollectOptions {
    std::vector<std::filesystem::path> roots;  // <INPUT>...
    bool include_hidden = false;               // --include-hidden
    bool follow_symlinks = false;              // --follow-symlinks
    std::optional<int> max_depth;              // --scale, --depth
    std::optional<std::uint64_t> max_size_bytes = max_size_from_mb(DEFAULT_MAX_SIZE_MB);
    bool append = false;                          // --append
    bool encoding_report = false;                 // --encoding-report
    int workers = 1;                              // --workers
    std::optional<std::filesystem::path> output;  // -o, --output
    bool debug_discovery = false;                 // --debug-discovery
    bool json = false;                            // --json
};

/// Какие значения заданы в командной строке явно
struct ExplicitFlags {
    bool include_hidden = false;
    bool follow_symlinks = false;
    bool depth = false;
    bool max_size = false;
    bool append = false;
    bool encoding_report = false;
    bool workers = false;
    bool output = false;
    bool verbose = false;
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Основной режим: собрать файлы
struct CollectCommand {
    CollectOptions options;
    ExplicitFlags explicit_flags;
    std::optional<std::filesystem::path> config;  // --config
};

/// -h, --help
struct HelpCommand {};

/// -V, --version
struct VersionCommand {};

using Command = std::variant<CollectCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
///
/// Пути <INPUT> возвращаются как есть; absolute() применяет вызывающий.
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version: "collect-files 0.1.0\n"
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Имя программы
constexpr const char* PROGRAM = "collect-files";

/// Версия программы
constexpr const char* VERSION = "0.1.0";

/// Описание программы
constexpr const char* ABOUT =
    "Collect text files from files and directories into a single output file";

}  // namespace collector::cli

#endif  // COLLECTOR_CLI_HPP
