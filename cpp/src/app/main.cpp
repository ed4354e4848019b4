// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv через cli
// 2. Слияние с --config
// 3. Создание Writer (output)
// 4. Сборка файлов или --debug-discovery (collect.hpp)
// 5. Возврат exit code
//
// Exit codes: 0 - успех, 2 - ошибка CLI/конфигурации (и обхода),
// 3 - файл результата не открывается.
//
// ==============================================================================

#include "collector/cli.hpp"
#include "collector/collect.hpp"
#include "collector/config.hpp"
#include "collector/output.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace collector;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);
    cli::GlobalOptions global = parse_result.global;

    // 2. Слияние с --config (до создания Writer: конфигурация задаёт verbose)
    std::optional<std::string> config_error;
    if (parse_result.ok) {
        if (auto* cmd = std::get_if<cli::CollectCommand>(&parse_result.command)) {
            if (cmd->config.has_value()) {
                config::LoadResult loaded = config::load_config(*cmd->config);
                if (loaded.ok) {
                    config::apply_config(loaded.config, cmd->options, global,
                                         cmd->explicit_flags);
                } else {
                    config_error = loaded.error;
                }
            }
        }
    }

    // 3. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = global.quiet;
    out_cfg.verbose = global.verbose;
    output::Writer writer(out_cfg);

    // Сообщение парсинга идёт без форматирования [x], напрямую в stderr
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }
    if (config_error.has_value()) {
        writer.error("Failed to load config " + *config_error);
        return app::EXIT_USAGE;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return app::run_collect(cmd.options, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
