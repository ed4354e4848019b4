// ==============================================================================
// identity.cpp - Идентичность записей файловой системы
// ==============================================================================

#include "collector/identity.hpp"

#include "collector/platform.hpp"

#include <functional>
#include <system_error>
#include <utility>

namespace collector::io {

namespace {

/// Лучший доступный строковый путь для fallback-ключа
/// weakly_canonical(absolute) -> absolute -> как есть
std::string resolved_path_string(const std::filesystem::path& entry) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(entry, ec);
    if (ec) {
        return platform::path_to_utf8(entry);
    }

    std::filesystem::path resolved = std::filesystem::weakly_canonical(abs, ec);
    if (ec) {
        return platform::path_to_utf8(abs);
    }
    return platform::path_to_utf8(resolved);
}

}  // namespace

// ----------------------------------------------------------------------------
// IdentityKey
// ----------------------------------------------------------------------------

IdentityKey IdentityKey::from_inode(std::uint64_t device, std::uint64_t inode) {
    IdentityKey key;
    key.kind = Kind::Inode;
    key.device = device;
    key.inode = inode;
    return key;
}

IdentityKey IdentityKey::from_path(std::string path) {
    IdentityKey key;
    key.kind = Kind::Path;
    key.path = std::move(path);
    return key;
}

std::string IdentityKey::to_string() const {
    if (kind == Kind::Inode) {
        return "inode:" + std::to_string(device) + ":" + std::to_string(inode);
    }
    return "path:" + path;
}

bool IdentityKey::operator==(const IdentityKey& other) const {
    if (kind != other.kind) {
        return false;
    }
    if (kind == Kind::Inode) {
        return device == other.device && inode == other.inode;
    }
    return path == other.path;
}

std::size_t IdentityKeyHash::operator()(const IdentityKey& key) const noexcept {
    if (key.kind == IdentityKey::Kind::Path) {
        return std::hash<std::string>{}(key.path);
    }
    // boost::hash_combine-подобное смешивание
    std::size_t h = std::hash<std::uint64_t>{}(key.device);
    h ^= std::hash<std::uint64_t>{}(key.inode) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

// ----------------------------------------------------------------------------
// key_for
// ----------------------------------------------------------------------------

IdentityKey key_for(const std::filesystem::path& entry, bool follow_symlinks) {
    auto st = platform::stat_identity(entry, follow_symlinks);

    // (0, 0) - признак ФС, не заполняющей inode/device
    if (st.has_value() && !(st->device == 0 && st->inode == 0)) {
        return IdentityKey::from_inode(st->device, st->inode);
    }

    return IdentityKey::from_path(resolved_path_string(entry));
}

}  // namespace collector::io
