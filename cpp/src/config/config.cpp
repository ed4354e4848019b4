// ==============================================================================
// config.cpp - Файл конфигурации (--config)
// ==============================================================================

#include "collector/config.hpp"

#include "collector/platform.hpp"

#include <cmath>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace collector::config {

namespace {

/// Ошибка значения конкретного ключа
class KeyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

bool read_bool(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        throw KeyError("invalid value for '" + key + "': expected a boolean");
    }
}

int read_int(const YAML::Node& node, const std::string& key, int min_value) {
    int v = 0;
    try {
        v = node.as<int>();
    } catch (const YAML::Exception&) {
        throw KeyError("invalid value for '" + key + "': expected an integer");
    }
    if (v < min_value) {
        throw KeyError("invalid value for '" + key + "': must be >= " + std::to_string(min_value));
    }
    return v;
}

void read_entry(const std::string& key, const YAML::Node& value, FileConfig& cfg) {
    if (!value.IsScalar()) {
        throw KeyError("invalid value for '" + key + "': expected a scalar");
    }

    if (key == "include_hidden") {
        cfg.include_hidden = read_bool(value, key);
    } else if (key == "follow_symlinks") {
        cfg.follow_symlinks = read_bool(value, key);
    } else if (key == "append") {
        cfg.append = read_bool(value, key);
    } else if (key == "encoding_report") {
        cfg.encoding_report = read_bool(value, key);
    } else if (key == "depth") {
        cfg.depth = read_int(value, key, 0);
    } else if (key == "workers") {
        cfg.workers = read_int(value, key, 1);
    } else if (key == "verbose") {
        // verbose: true | false | уровень
        bool flag = false;
        if (YAML::convert<bool>::decode(value, flag)) {
            cfg.verbose = flag ? 1 : 0;
        } else {
            cfg.verbose = read_int(value, key, 0);
        }
    } else if (key == "max_size_mb") {
        double mb = 0.0;
        try {
            mb = value.as<double>();
        } catch (const YAML::Exception&) {
            throw KeyError("invalid value for 'max_size_mb': expected a number");
        }
        if (!std::isfinite(mb) || mb <= 0.0) {
            throw KeyError("invalid value for 'max_size_mb': must be > 0");
        }
        cfg.max_size_mb = mb;
    } else if (key == "output") {
        const std::string out = value.as<std::string>();
        if (out.empty()) {
            throw KeyError("invalid value for 'output': empty path");
        }
        cfg.output = platform::path_from_utf8(out);
    } else {
        throw KeyError("unknown key '" + key + "'");
    }
}

LoadResult from_root(const YAML::Node& root, const std::string& origin) {
    LoadResult result;

    // Пустой документ - пустая конфигурация
    if (!root || root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        result.error = origin + ": config root must be a mapping";
        return result;
    }

    try {
        for (const auto& kv : root) {
            read_entry(kv.first.as<std::string>(), kv.second, result.config);
        }
    } catch (const KeyError& e) {
        result.error = origin + ": " + e.what();
        return result;
    } catch (const YAML::Exception& e) {
        result.error = origin + ": " + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace

LoadResult load_config(const std::filesystem::path& path) {
    const std::string origin = platform::path_to_utf8(path);
    try {
        return from_root(YAML::LoadFile(path.string()), origin);
    } catch (const YAML::Exception& e) {
        LoadResult result;
        result.error = origin + ": " + e.what();
        return result;
    }
}

LoadResult parse_config(const std::string& yaml, const std::string& origin) {
    try {
        return from_root(YAML::Load(yaml), origin);
    } catch (const YAML::Exception& e) {
        LoadResult result;
        result.error = origin + ": " + e.what();
        return result;
    }
}

void apply_config(const FileConfig& file, cli::CollectOptions& options,
                  cli::GlobalOptions& global, const cli::ExplicitFlags& flags) {
    if (file.include_hidden && !flags.include_hidden) {
        options.include_hidden = *file.include_hidden;
    }
    if (file.follow_symlinks && !flags.follow_symlinks) {
        options.follow_symlinks = *file.follow_symlinks;
    }
    if (file.depth && !flags.depth) {
        options.max_depth = *file.depth;
    }
    if (file.max_size_mb && !flags.max_size) {
        options.max_size_bytes = cli::max_size_from_mb(*file.max_size_mb);
    }
    if (file.append && !flags.append) {
        options.append = *file.append;
    }
    if (file.encoding_report && !flags.encoding_report) {
        options.encoding_report = *file.encoding_report;
    }
    if (file.workers && !flags.workers) {
        options.workers = *file.workers;
    }
    if (file.output && !flags.output) {
        options.output = *file.output;
    }
    if (file.verbose && !flags.verbose) {
        global.verbose = *file.verbose;
    }
}

}  // namespace collector::config
