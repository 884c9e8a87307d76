// ==============================================================================
// processing.cpp - MOD-0010: Этап processing
// ==============================================================================
//
// MOD-0010 processing
//
// ==============================================================================

#include <sandpipe/processing.hpp>

namespace sandpipe::pipeline {

namespace {
constexpr const char* STAGE = "processing";
}

RunProcessing::RunProcessing(const Task& task, const Registry& registry,
                             const config::Config& cfg, output::Writer& writer,
                             RunnerOptions options)
    : task_(task),
      registry_(registry),
      cfg_(cfg),
      writer_(writer),
      options_(std::move(options)),
      analysis_path_(pipeline::analysis_path(options_.root, task.id)) {}

ModuleResult RunProcessing::process(const PluginDescriptor& descriptor) {
    ModuleResult result;
    result.module = descriptor.name;

    auto module = load_module<Processing>(descriptor, cfg_, task_, analysis_path_, STAGE,
                                          writer_, result);
    if (!module) {
        return result;
    }

    result.key = module->key();
    module->set_results(&results_);

    if (execute(STAGE, task_, writer_, result, [&] { result.data = module->run(); })) {
        writer_.debug("Executed processing module \"" + descriptor.name + "\" on task #" +
                      std::to_string(task_.id));
    }
    return result;
}

void RunProcessing::merge(const ModuleResult& result) {
    if (!result.ok() || result.key.empty() || !result.data.truthy()) {
        return;
    }
    if (results_.has(result.key)) {
        writer_.warn("Processing module \"" + result.module + "\" overwrites results key \"" +
                     result.key + "\"");
    }
    results_.set(result.key, result.data);
}

ResultsMap RunProcessing::run() {
    results_ = ResultsMap();
    outcomes_.clear();

    const auto& descriptors = registry_.list(Group::Processing);
    if (descriptors.empty()) {
        writer_.info("No processing modules loaded");
        return results_;
    }

    for (const auto& descriptor : ordered(descriptors)) {
        if (is_cancelled(options_.cancel)) {
            ModuleResult skipped;
            skipped.outcome = Outcome::Cancelled;
            skipped.module = descriptor.name;
            outcomes_.push_back(std::move(skipped));
            continue;
        }

        ModuleResult result = process(descriptor);
        merge(result);
        outcomes_.push_back(std::move(result));
    }

    if (is_cancelled(options_.cancel)) {
        writer_.warn("Processing of task #" + std::to_string(task_.id) + " was cancelled");
    }

    return results_;
}

}  // namespace sandpipe::pipeline
