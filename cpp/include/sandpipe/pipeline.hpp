// ==============================================================================
// sandpipe/pipeline.hpp - MOD-0016: Полный конвейер анализа
// ==============================================================================
//
// MOD-0016 pipeline
//
// processing → signatures → reporting для одной задачи.
//
// ==============================================================================

#ifndef SANDPIPE_PIPELINE_HPP
#define SANDPIPE_PIPELINE_HPP

#include <sandpipe/engine.hpp>
#include <sandpipe/processing.hpp>
#include <sandpipe/reporting.hpp>

namespace sandpipe::pipeline {

struct AnalysisOptions {
    RunnerOptions runner;
    EngineOptions engine;

    bool run_signatures = true;
    bool run_reporting = true;
};

/// Сводка прогона (для CLI и тестов)
struct AnalysisSummary {
    std::vector<ModuleResult> processing;
    std::vector<ModuleResult> reporting;
    EngineStats signatures;
    bool cancelled = false;
};

/// Выполнить все этапы. Токен отмены из options.runner передаётся движку,
/// если у движка свой не задан.
ResultsMap run_analysis(const Task& task, const Registry& registry,
                        const config::StageConfigs& configs, output::Writer& writer,
                        const AnalysisOptions& options = {}, AnalysisSummary* summary = nullptr);

}  // namespace sandpipe::pipeline

#endif  // SANDPIPE_PIPELINE_HPP
