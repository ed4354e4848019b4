// ==============================================================================
// collector/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8
// Платформенная специфика изолирована здесь
//
// Назначение:
// - Преобразования путей в UTF-8 и обратно
// - Определение TTY (цвет и прогресс)
// - Атрибут "скрытый" (Windows) и идентичность файла (device/inode)
// - Временные файлы и локальное время
//
// ==============================================================================

#ifndef COLLECTOR_PLATFORM_HPP
#define COLLECTOR_PLATFORM_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace collector::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать path из строки UTF-8
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Метаданные файловой системы
// ----------------------------------------------------------------------------

/// Пара (device, inode), как её вернул stat()/lstat()
struct StatIdentity {
    std::uint64_t device = 0;
    std::uint64_t inode = 0;
};

/// Получить device/inode для пути
///
/// @param p Путь
/// @param follow_symlinks true = stat(), false = lstat()
/// @return std::nullopt при ошибке или если платформа не даёт inode (Windows)
std::optional<StatIdentity> stat_identity(const std::filesystem::path& p, bool follow_symlinks);

/// Проверить платформенный атрибут "скрытый"
/// Windows: FILE_ATTRIBUTE_HIDDEN. Остальные платформы: всегда false.
/// Любая ошибка трактуется как "не скрыт".
bool has_hidden_attribute(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// Время и временные файлы
// ----------------------------------------------------------------------------

/// Текущее локальное время в формате strftime
std::string local_timestamp(const char* format);

/// Создать пустой временный файл и вернуть путь к нему
/// @throws std::runtime_error если файл создать не удалось
std::filesystem::path make_temp_file(std::string_view prefix);

}  // namespace collector::platform

#endif  // COLLECTOR_PLATFORM_HPP
