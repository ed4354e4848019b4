// ==============================================================================
// collector/output.hpp - Пользовательский вывод
// ==============================================================================
//
// RapidJSON для JSON сериализации
// Только этот модуль пишет в stdout/stderr
//
// Назначение:
// - Единственная точка записи в stdout/stderr (Writer)
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - Цветной вывод (ANSI escape codes)
// - Прогресс: интерфейс ProgressReporter и реализации по возможностям терминала
// - Приёмники байтов: FileSink (файл результата), StringSink (память)
//
// ==============================================================================

#ifndef COLLECTOR_OUTPUT_HPP
#define COLLECTOR_OUTPUT_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace collector::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // -v: уровень подробности (0..2+)
};

// ----------------------------------------------------------------------------
// Платформозависимые константы
// ----------------------------------------------------------------------------

#ifdef _WIN32
// Windows: ASCII для совместимости с cmd.exe
constexpr const char* BAR_FILL = "#";
constexpr const char* BAR_EMPTY = "-";
#else
// Unix: Unicode блоки
constexpr const char* BAR_FILL = "\xe2\x96\x88";   // █ U+2588
constexpr const char* BAR_EMPTY = "\xe2\x96\x91";  // ░ U+2591
#endif

constexpr std::size_t BAR_WIDTH = 30;

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// Информационное сообщение в stderr (если не quiet): "[+] <message>"
    void info(std::string_view message);

    /// Предупреждение в stderr (если не quiet): "[!] <message>"
    void warn(std::string_view message);

    /// Ошибка в stderr (всегда): "[x] <message>"
    void error(std::string_view message);

    /// Отладка в stderr (только при verbose > 0): "[*] <message>"
    void debug(std::string_view message);

    /// Трассировка в stderr (только при verbose > 1): "[~] <message>"
    void trace(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (с отступами) + newline
    void write_json_pretty(const rapidjson::Value& value);

    // Прогресс-бар (перерисовка строки stderr через '\r')
    // -------------------------------------------------------------------------

    void progress_begin(std::string_view label, std::size_t total);
    void progress_tick(std::size_t current);
    void progress_end();

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    void render_progress();

    FILE* get_file(Stream s) const;

    OutputConfig config_;

    // Состояние прогресс-бара
    std::string progress_label_;
    std::size_t progress_total_ = 0;
    std::size_t progress_current_ = 0;
    bool progress_active_ = false;
};

// ----------------------------------------------------------------------------
// ProgressReporter - прогресс обработки файлов
// ----------------------------------------------------------------------------

/// Конвейер получает готовый репортёр и не знает, как он рисует
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    /// Продвинуться на n единиц
    virtual void advance(std::size_t n) = 0;

    /// Завершить отображение (идемпотентно)
    virtual void finish() = 0;
};

/// Ничего не выводит (quiet, verbose, JSON, тесты)
class NullProgress : public ProgressReporter {
public:
    void advance(std::size_t) override {}
    void finish() override {}
};

/// Бар в терминале через Writer::progress_*
class TerminalProgress : public ProgressReporter {
public:
    TerminalProgress(Writer& writer, std::string_view label, std::size_t total);
    ~TerminalProgress() override;

    void advance(std::size_t n) override;
    void finish() override;

private:
    Writer& writer_;
    std::size_t current_ = 0;
    bool finished_ = false;
};

/// Строки "<label>: n/total" при каждом пройденном десятке процентов
class PlainProgress : public ProgressReporter {
public:
    PlainProgress(Writer& writer, std::string_view label, std::size_t total);

    void advance(std::size_t n) override;
    void finish() override;

private:
    void report();

    Writer& writer_;
    std::string label_;
    std::size_t total_ = 0;
    std::size_t current_ = 0;
    std::size_t last_decile_ = 0;
    bool finished_ = false;
};

/// Выбрать реализацию по возможностям вывода:
/// quiet или verbose -> NullProgress, TTY stderr -> TerminalProgress,
/// иначе PlainProgress
std::unique_ptr<ProgressReporter> make_progress_reporter(Writer& writer, std::string_view label,
                                                         std::size_t total);

// ----------------------------------------------------------------------------
// Sink - приёмник байтов результата
// ----------------------------------------------------------------------------

class Sink {
public:
    virtual ~Sink() = default;

    /// Записать байты; ошибка записи - std::runtime_error
    virtual void write(std::string_view bytes) = 0;
};

/// Файл результата (RAII над FILE*)
class FileSink : public Sink {
public:
    /// Открыть файл
    /// @param append true - дописывать в конец, false - перезаписать
    /// @throws std::runtime_error если файл не открывается на запись
    FileSink(const std::filesystem::path& path, bool append);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(std::string_view bytes) override;

    /// Сбросить и закрыть файл; повторный вызов ничего не делает
    /// @throws std::runtime_error при ошибке закрытия
    void close();

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    FILE* file_ = nullptr;
};

/// Приёмник в памяти
class StringSink : public Sink {
public:
    void write(std::string_view bytes) override { data_.append(bytes); }

    const std::string& str() const { return data_; }

private:
    std::string data_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Форматирует информационное сообщение: "[+] <message>\n"
std::string format_info(std::string_view message);

/// Форматирует сообщение об ошибке: "[x] <message>\n"
std::string format_error(std::string_view message);

/// Форматирует предупреждение: "[!] <message>\n"
std::string format_warning(std::string_view message);

/// Форматирует отладочное сообщение: "[*] <message>\n"
std::string format_debug(std::string_view message);

/// Строка прогресс-бара без '\r': "<label> [███░░░]  50% 5/10"
std::string format_progress_bar(std::string_view label, std::size_t current, std::size_t total);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace collector::output

#endif  // COLLECTOR_OUTPUT_HPP
