// ==============================================================================
// reporting.cpp - MOD-0011: Этап reporting
// ==============================================================================
//
// MOD-0011 reporting
//
// ==============================================================================

#include <sandpipe/reporting.hpp>

namespace sandpipe::pipeline {

namespace {
constexpr const char* STAGE = "reporting";
}

RunReporting::RunReporting(const Task& task, ResultsMap& results, const Registry& registry,
                           const config::Config& cfg, output::Writer& writer,
                           RunnerOptions options)
    : task_(task),
      results_(results),
      registry_(registry),
      cfg_(cfg),
      writer_(writer),
      options_(std::move(options)),
      analysis_path_(pipeline::analysis_path(options_.root, task.id)) {
    auto loaded = config::Config::load_optional(analysis_path_ / "analysis.yaml");
    if (loaded.ok) {
        analysis_cfg_ = std::move(loaded.config);
    } else {
        writer_.warn("Unable to load the analysis configuration: " + loaded.error);
    }
}

ModuleResult RunReporting::process(const PluginDescriptor& descriptor) {
    ModuleResult result;
    result.module = descriptor.name;

    auto module = load_module<Report>(descriptor, cfg_, task_, analysis_path_, STAGE, writer_,
                                      result);
    if (!module) {
        return result;
    }

    module->set_analysis_config(analysis_cfg_);

    if (execute(STAGE, task_, writer_, result, [&] { module->run(results_); })) {
        writer_.debug("Executed reporting module \"" + descriptor.name + "\"");
    }
    return result;
}

void RunReporting::run() {
    outcomes_.clear();

    const auto& descriptors = registry_.list(Group::Reporting);
    if (descriptors.empty()) {
        writer_.info("No reporting modules loaded");
        return;
    }

    for (const auto& descriptor : ordered(descriptors)) {
        if (is_cancelled(options_.cancel)) {
            ModuleResult skipped;
            skipped.outcome = Outcome::Cancelled;
            skipped.module = descriptor.name;
            outcomes_.push_back(std::move(skipped));
            continue;
        }
        outcomes_.push_back(process(descriptor));
    }
}

}  // namespace sandpipe::pipeline
