// ==============================================================================
// sandpipe/reporting.hpp - MOD-0011: Этап reporting
// ==============================================================================
//
// MOD-0011 reporting
//
// Назначение:
// - Запуск всех включённых reporting-модулей по возрастанию order
//   против итоговой карты результатов
// - Каждому модулю передаётся вторичная конфигурация анализа
//   (<analysis>/analysis.yaml; отсутствие файла не ошибка)
//
// ==============================================================================

#ifndef SANDPIPE_REPORTING_HPP
#define SANDPIPE_REPORTING_HPP

#include <sandpipe/runner.hpp>

#include <sandpipe/results.hpp>

#include <vector>

namespace sandpipe::pipeline {

class RunReporting {
public:
    RunReporting(const Task& task, ResultsMap& results, const Registry& registry,
                 const config::Config& cfg, output::Writer& writer, RunnerOptions options = {});

    ModuleResult process(const PluginDescriptor& descriptor);

    void run();

    const std::vector<ModuleResult>& outcomes() const { return outcomes_; }

    const std::filesystem::path& analysis_path() const { return analysis_path_; }

    /// Вторичная конфигурация, прочитанная в конструкторе
    const config::Config& analysis_config() const { return analysis_cfg_; }

private:
    Task task_;
    ResultsMap& results_;
    const Registry& registry_;
    const config::Config& cfg_;
    output::Writer& writer_;
    RunnerOptions options_;
    std::filesystem::path analysis_path_;
    config::Config analysis_cfg_;

    std::vector<ModuleResult> outcomes_;
};

}  // namespace sandpipe::pipeline

#endif  // SANDPIPE_REPORTING_HPP
