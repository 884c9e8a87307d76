// ==============================================================================
// sandpipe/processing.hpp - MOD-0010: Этап processing
// ==============================================================================
//
// MOD-0010 processing
//
// Назначение:
// - Запуск всех включённых processing-модулей по возрастанию order
// - Слияние данных каждого модуля в общую карту результатов
//
// Данные модуля попадают в карту, только если ключ непуст и данные истинны
// (не null, не пустые строка/массив/объект, не 0/false). Повторная запись
// ключа: побеждает последний модуль, пишется предупреждение.
//
// ==============================================================================

#ifndef SANDPIPE_PROCESSING_HPP
#define SANDPIPE_PROCESSING_HPP

#include <sandpipe/runner.hpp>

#include <sandpipe/results.hpp>

#include <vector>

namespace sandpipe::pipeline {

class RunProcessing {
public:
    RunProcessing(const Task& task, const Registry& registry, const config::Config& cfg,
                  output::Writer& writer, RunnerOptions options = {});

    /// Выполнить один модуль против текущей карты результатов
    ModuleResult process(const PluginDescriptor& descriptor);

    /// Выполнить все модули; вернуть заполненную карту
    ResultsMap run();

    /// Исходы модулей последнего run() в порядке выполнения
    const std::vector<ModuleResult>& outcomes() const { return outcomes_; }

    const std::filesystem::path& analysis_path() const { return analysis_path_; }

private:
    void merge(const ModuleResult& result);

    Task task_;
    const Registry& registry_;
    const config::Config& cfg_;
    output::Writer& writer_;
    RunnerOptions options_;
    std::filesystem::path analysis_path_;

    ResultsMap results_;
    std::vector<ModuleResult> outcomes_;
};

}  // namespace sandpipe::pipeline

#endif  // SANDPIPE_PROCESSING_HPP
