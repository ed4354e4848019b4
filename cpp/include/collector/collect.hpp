// ==============================================================================
// collector/collect.hpp - Прогон сборки
// ==============================================================================
//
// Назначение:
// - Последовательность одного прогона: входы -> путь результата ->
//   обход -> исключение результата -> запись -> отчёт
// - Режим --debug-discovery (обход без записи)
//
// Exit codes: 0 - успех (в т.ч. нет файлов), 2 - ошибка обхода,
// 3 - файл результата не подготовить или не открыть.
//
// ==============================================================================

#ifndef COLLECTOR_COLLECT_HPP
#define COLLECTOR_COLLECT_HPP

#include "collector/cli.hpp"
#include "collector/output.hpp"

namespace collector::app {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_OUTPUT = 3;

/// Выполнить сборку по опциям
///
/// Файл результата не создаётся, если нечего обрабатывать.
/// В режиме append к существующему файлу заголовок прогона не пишется.
///
/// @return exit code
int run_collect(const cli::CollectOptions& opt, output::Writer& writer);

}  // namespace collector::app

#endif  // COLLECTOR_COLLECT_HPP
