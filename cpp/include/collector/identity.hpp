// ==============================================================================
// collector/identity.hpp - Идентичность записей файловой системы
// ==============================================================================
//
// Назначение:
// - Ключ дедупликации / обнаружения петель для записи ФС
// - (device, inode), если оба доступны и не оба нулевые
// - Иначе - разрешённый абсолютный путь
//
// Некоторые ФС (и Windows) отдают нулевые или отсутствующие inode/device.
// Без fallback на путь все такие записи схлопнулись бы в один ключ.
//
// ==============================================================================

#ifndef COLLECTOR_IDENTITY_HPP
#define COLLECTOR_IDENTITY_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace collector::io {

// ----------------------------------------------------------------------------
// IdentityKey
// ----------------------------------------------------------------------------

struct IdentityKey {
    enum class Kind { Inode, Path };

    Kind kind = Kind::Path;
    std::uint64_t device = 0;  // только для Kind::Inode
    std::uint64_t inode = 0;   // только для Kind::Inode
    std::string path;          // только для Kind::Path

    static IdentityKey from_inode(std::uint64_t device, std::uint64_t inode);
    static IdentityKey from_path(std::string path);

    /// Отладочное представление: "inode:<dev>:<ino>" или "path:<p>"
    std::string to_string() const;

    bool operator==(const IdentityKey& other) const;
    bool operator!=(const IdentityKey& other) const { return !(*this == other); }
};

struct IdentityKeyHash {
    std::size_t operator()(const IdentityKey& key) const noexcept;
};

// ----------------------------------------------------------------------------
// key_for
// ----------------------------------------------------------------------------

/// Вычислить ключ идентичности для записи
///
/// @param entry Путь к записи
/// @param follow_symlinks true - ключ цели симлинка, false - самого симлинка
/// @return Ключ; функция не бросает исключений и не имеет побочных эффектов
IdentityKey key_for(const std::filesystem::path& entry, bool follow_symlinks);

}  // namespace collector::io

#endif  // COLLECTOR_IDENTITY_HPP
