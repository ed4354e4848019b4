// ==============================================================================
// collector/discovery.hpp - File Discovery
// ==============================================================================
//
// Записи директории обходятся в отсортированном порядке
//
// Назначение:
// - Итеративный (без рекурсии) обход корней: файлы и директории
// - Фильтрация скрытых записей
// - Политика следования симлинкам
// - Ограничение глубины
// - Защита от петель по ключу идентичности (identity.hpp)
// - Ленивая выдача: Discoverer::next() возвращает по одному файлу
//
// ==============================================================================

#ifndef COLLECTOR_DISCOVERY_HPP
#define COLLECTOR_DISCOVERY_HPP

#include "collector/identity.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace collector::io {

// ----------------------------------------------------------------------------
// DiscoveryOptions - параметры поиска файлов
// ----------------------------------------------------------------------------

/// Приёмник диагностических сообщений обхода (по строке на решение)
using DiscoveryTrace = std::function<void(std::string_view)>;

struct DiscoveryOptions {
    /// false = скрытые файлы и директории пропускаются
    bool include_hidden = false;

    /// true = симлинки разыменовываются (и для типа, и для ключа идентичности)
    bool follow_symlinks = false;

    /// Максимальная глубина; nullopt = без ограничения
    /// 0 = только прямые потомки корневой директории
    std::optional<int> max_depth;

    /// Диагностика (root не существует, скрытые, повторы, глубина, ошибки чтения)
    DiscoveryTrace trace;
};

// ----------------------------------------------------------------------------
// Discoverer - ленивая последовательность найденных файлов
// ----------------------------------------------------------------------------

/// Обходчик корней с явным стеком
///
/// Использование:
/// @code
///   Discoverer d(inputs, opt);
///   std::filesystem::path file;
///   while (d.next(file)) {
///       // обработка file
///   }
/// @endcode
///
/// Каждый вызов next() выполняет ровно столько работы, сколько нужно
/// для следующего файла. Множество просмотренных ключей и стек живут
/// в экземпляре: новый Discoverer - новый прогон.
class Discoverer {
public:
    Discoverer(std::vector<std::filesystem::path> inputs, DiscoveryOptions opt);

    /// Получить следующий файл
    ///
    /// @param out[out] Путь к файлу (заполняется при успехе)
    /// @return false, когда все корни исчерпаны
    bool next(std::filesystem::path& out);

    /// Сколько ключей идентичности уже записано
    std::size_t seen_count() const { return seen_.size(); }

private:
    /// Единица отложенной работы: директория и её глубина
    struct Frame {
        std::filesystem::path dir;
        int depth = 0;
    };

    /// Начать обработку очередного корня
    /// @return true если корень - файл (тогда он в out)
    bool start_root(const std::filesystem::path& root, std::filesystem::path& out);

    /// Снять директорию со стека и прочитать её записи в entries_
    void open_directory(const Frame& frame);

    /// Решение по одной записи директории
    /// @return true если запись - файл для выдачи (тогда он в out)
    bool visit_entry(const std::filesystem::directory_entry& entry, std::filesystem::path& out);

    void trace(std::string_view message) const;

    std::vector<std::filesystem::path> inputs_;
    DiscoveryOptions opt_;

    std::size_t root_index_ = 0;
    std::vector<Frame> stack_;

    // Снимок записей текущей директории
    std::vector<std::filesystem::directory_entry> entries_;
    std::size_t entry_index_ = 0;
    int entries_depth_ = 0;

    std::unordered_set<IdentityKey, IdentityKeyHash> seen_;
};

// ----------------------------------------------------------------------------
// Свободные функции
// ----------------------------------------------------------------------------

/// Скрыта ли запись: имя начинается с '.' ("." и ".." не считаются)
/// или установлен платформенный атрибут
bool is_hidden(const std::filesystem::path& p);

/// Найти файлы по путям
///
/// @param inputs Пути к файлам или директориям
/// @param opt Параметры обхода
/// @return Все найденные файлы в порядке выдачи Discoverer
///
/// Несуществующие корни и нечитаемые директории пропускаются.
/// Пустой результат - не ошибка.
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt);

}  // namespace collector::io

#endif  // COLLECTOR_DISCOVERY_HPP
