// ==============================================================================
// discovery.cpp - File Discovery
// ==============================================================================
//
// Итеративный обход с явным стеком (глубина вложенности не расходует
// стек вызовов), дедупликация по IdentityKey.
//
// ==============================================================================

#include "collector/discovery.hpp"

#include "collector/platform.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace collector::io {

namespace {

std::string display(const std::filesystem::path& p) {
    return platform::path_to_utf8(p);
}

}  // namespace

// ----------------------------------------------------------------------------
// is_hidden
// ----------------------------------------------------------------------------

bool is_hidden(const std::filesystem::path& p) {
    const std::string name = platform::path_to_utf8(p.filename());
    if (!name.empty() && name[0] == '.' && name != "." && name != "..") {
        return true;
    }
    return platform::has_hidden_attribute(p);
}

// ----------------------------------------------------------------------------
// Discoverer
// ----------------------------------------------------------------------------

Discoverer::Discoverer(std::vector<std::filesystem::path> inputs, DiscoveryOptions opt)
    : inputs_(std::move(inputs)), opt_(std::move(opt)) {}

void Discoverer::trace(std::string_view message) const {
    if (opt_.trace) {
        opt_.trace(message);
    }
}

bool Discoverer::next(std::filesystem::path& out) {
    for (;;) {
        // 1. Необработанные записи текущей директории
        while (entry_index_ < entries_.size()) {
            const std::size_t idx = entry_index_++;
            if (visit_entry(entries_[idx], out)) {
                return true;
            }
        }
        entries_.clear();
        entry_index_ = 0;

        // 2. Следующая директория со стека (LIFO)
        if (!stack_.empty()) {
            Frame frame = std::move(stack_.back());
            stack_.pop_back();
            open_directory(frame);
            continue;
        }

        // 3. Следующий корень
        if (root_index_ < inputs_.size()) {
            const std::filesystem::path& root = inputs_[root_index_++];
            if (start_root(root, out)) {
                return true;
            }
            continue;
        }

        return false;
    }
}

bool Discoverer::start_root(const std::filesystem::path& root, std::filesystem::path& out) {
    std::error_code ec;

    // Явно переданный файл выдаётся без проверок скрытости и повторов
    if (std::filesystem::is_regular_file(root, ec)) {
        trace("root is file -> " + display(root));
        out = root;
        return true;
    }

    ec.clear();
    if (!std::filesystem::exists(root, ec)) {
        trace("root does not exist -> " + display(root));
        return false;
    }

    stack_.push_back(Frame{root, 0});
    return false;
}

void Discoverer::open_directory(const Frame& frame) {
    if (!opt_.include_hidden && is_hidden(frame.dir)) {
        trace("skip hidden dir -> " + display(frame.dir));
        return;
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(frame.dir, ec);
    if (ec) {
        trace("failed to read directory " + display(frame.dir) + " - " + ec.message());
        return;
    }

    std::vector<std::filesystem::directory_entry> snapshot;
    for (auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        snapshot.push_back(*it);
    }
    if (ec) {
        // Уже прочитанные записи обрабатываются, остаток директории теряется
        trace("failed to read directory " + display(frame.dir) + " - " + ec.message());
    }

    std::sort(snapshot.begin(), snapshot.end(),
              [](const std::filesystem::directory_entry& a,
                 const std::filesystem::directory_entry& b) { return a.path() < b.path(); });

    entries_ = std::move(snapshot);
    entry_index_ = 0;
    entries_depth_ = frame.depth;
}

bool Discoverer::visit_entry(const std::filesystem::directory_entry& entry,
                             std::filesystem::path& out) {
    const std::filesystem::path& p = entry.path();

    // Ключ записывается до решения о скрытости: скрытая цель петли
    // помечается просмотренной, даже если никогда не выдаётся
    IdentityKey key = key_for(p, opt_.follow_symlinks);
    if (!seen_.insert(key).second) {
        trace("skipping seen key -> " + display(p) + " key=" + key.to_string());
        return false;
    }

    if (!opt_.include_hidden && is_hidden(p)) {
        trace("skip hidden -> " + display(p));
        return false;
    }

    std::error_code ec;
    std::filesystem::file_status st = opt_.follow_symlinks ? entry.status(ec)
                                                           : entry.symlink_status(ec);
    if (ec && st.type() != std::filesystem::file_type::not_found) {
        trace("failed to get metadata for " + display(p) + " - " + ec.message());
        return false;
    }

    if (std::filesystem::is_regular_file(st)) {
        trace("file -> " + display(p));
        out = p;
        return true;
    }

    if (std::filesystem::is_directory(st)) {
        const int child_depth = entries_depth_ + 1;
        if (!opt_.max_depth.has_value() || child_depth <= *opt_.max_depth) {
            trace("dir -> " + display(p) + " depth=" + std::to_string(child_depth));
            stack_.push_back(Frame{p, child_depth});
        } else {
            trace("depth limit reached, not descending -> " + display(p));
        }
        return false;
    }

    // Битые симлинки, сокеты, FIFO и симлинки без follow_symlinks игнорируются
    return false;
}

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt) {
    std::vector<std::filesystem::path> result;

    Discoverer discoverer(inputs, opt);
    std::filesystem::path file;
    while (discoverer.next(file)) {
        result.push_back(file);
    }

    // Пустой результат - не ошибка
    return result;
}

}  // namespace collector::io
