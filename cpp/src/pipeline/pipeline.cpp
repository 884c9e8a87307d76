// ==============================================================================
// pipeline.cpp - MOD-0016: Полный конвейер анализа
// ==============================================================================
//
// MOD-0016 pipeline
//
// ==============================================================================

#include <sandpipe/pipeline.hpp>

namespace sandpipe::pipeline {

ResultsMap run_analysis(const Task& task, const Registry& registry,
                        const config::StageConfigs& configs, output::Writer& writer,
                        const AnalysisOptions& options, AnalysisSummary* summary) {
    const CancelToken* cancel = options.runner.cancel;

    writer.info("Processing task #" + std::to_string(task.id));

    RunProcessing processing(task, registry, configs.processing, writer, options.runner);
    ResultsMap results = processing.run();
    if (summary != nullptr) {
        summary->processing = processing.outcomes();
    }

    if (options.run_signatures && !is_cancelled(cancel)) {
        EngineOptions engine_options = options.engine;
        if (engine_options.cancel == nullptr) {
            engine_options.cancel = cancel;
        }
        RunSignatures signatures(results, registry, writer, std::move(engine_options));
        signatures.run();
        if (summary != nullptr) {
            summary->signatures = signatures.stats();
        }
    }

    if (options.run_reporting && !is_cancelled(cancel)) {
        RunReporting reporting(task, results, registry, configs.reporting, writer,
                               options.runner);
        reporting.run();
        if (summary != nullptr) {
            summary->reporting = reporting.outcomes();
        }
    }

    if (is_cancelled(cancel)) {
        writer.warn("Analysis of task #" + std::to_string(task.id) + " was cancelled");
        if (summary != nullptr) {
            summary->cancelled = true;
        }
    } else {
        writer.info("Task #" + std::to_string(task.id) + ": analysis complete");
    }

    return results;
}

}  // namespace sandpipe::pipeline
