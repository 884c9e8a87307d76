// ==============================================================================
// runner.cpp - MOD-0009: Исполнение модулей с изоляцией сбоев
// ==============================================================================
//
// MOD-0009 runner
//
// ==============================================================================

#include <sandpipe/runner.hpp>

#include <sandpipe/errors.hpp>

#include <algorithm>

namespace sandpipe::pipeline {

const char* to_string(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success:
        return "success";
    case Outcome::LoadFailure:
        return "load-failure";
    case Outcome::NotConfigured:
        return "not-configured";
    case Outcome::Disabled:
        return "disabled";
    case Outcome::Misconfigured:
        return "misconfigured";
    case Outcome::DependencyMissing:
        return "dependency-missing";
    case Outcome::ModuleFailure:
        return "module-failure";
    case Outcome::UnexpectedFailure:
        return "unexpected-failure";
    case Outcome::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

std::filesystem::path analysis_path(const std::filesystem::path& root, std::int64_t task_id) {
    return root / "storage" / "analyses" / std::to_string(task_id);
}

std::vector<PluginDescriptor> ordered(const std::vector<PluginDescriptor>& descriptors) {
    std::vector<PluginDescriptor> out = descriptors;
    std::stable_sort(out.begin(), out.end(),
                     [](const PluginDescriptor& a, const PluginDescriptor& b) {
                         return a.order < b.order;
                     });
    return out;
}

std::unique_ptr<Plugin> instantiate(const PluginDescriptor& descriptor, const char* stage,
                                    output::Writer& writer, ModuleResult& result) {
    result.module = descriptor.name;
    try {
        std::unique_ptr<Plugin> plugin = descriptor.instantiate();
        if (!plugin) {
            throw std::runtime_error("factory returned no instance");
        }
        return plugin;
    } catch (const std::exception& e) {
        result.outcome = Outcome::LoadFailure;
        result.message = e.what();
        writer.error("Unable to instantiate the " + std::string(stage) + " module \"" +
                     descriptor.name + "\": " + e.what());
    } catch (...) {
        result.outcome = Outcome::LoadFailure;
        result.message = "unknown exception";
        writer.error("Unable to instantiate the " + std::string(stage) + " module \"" +
                     descriptor.name + "\": unknown exception");
    }
    return nullptr;
}

std::optional<config::Options> resolve_options(const PluginDescriptor& descriptor,
                                               const config::Config& cfg, const char* stage,
                                               output::Writer& writer, ModuleResult& result) {
    auto options = cfg.find(descriptor.name);
    if (!options) {
        // Отсутствие секции — обычная ситуация, не ошибка
        result.outcome = Outcome::NotConfigured;
        writer.debug("Module " + descriptor.name + " not found in " + stage +
                     " configuration file");
        return std::nullopt;
    }

    try {
        if (!options->enabled()) {
            result.outcome = Outcome::Disabled;
            return std::nullopt;
        }
    } catch (const ConfigError& e) {
        result.outcome = Outcome::Misconfigured;
        result.message = e.what();
        writer.warn("The " + std::string(stage) + " module \"" + descriptor.name +
                    "\" is misconfigured: " + e.what());
        return std::nullopt;
    }

    return options;
}

bool execute(const char* stage, const Task& task, output::Writer& writer, ModuleResult& result,
             const std::function<void()>& body) {
    const std::string who = "The " + std::string(stage) + " module \"" + result.module + "\"";
    try {
        body();
        result.outcome = Outcome::Success;
        return true;
    } catch (const DependencyError& e) {
        result.outcome = Outcome::DependencyMissing;
        result.message = e.what();
        writer.warn(who + " has missing dependencies: " + e.what());
    } catch (const ProcessingError& e) {
        result.outcome = Outcome::ModuleFailure;
        result.message = e.what();
        writer.warn(who + " returned the following error: " + e.what());
    } catch (const ReportError& e) {
        result.outcome = Outcome::ModuleFailure;
        result.message = e.what();
        writer.warn(who + " returned the following error: " + e.what());
    } catch (const ConfigError& e) {
        result.outcome = Outcome::Misconfigured;
        result.message = e.what();
        writer.warn(who + " is misconfigured: " + e.what());
    } catch (const std::exception& e) {
        result.outcome = Outcome::UnexpectedFailure;
        result.message = e.what();
        writer.error("Failed to run the " + std::string(stage) + " module \"" + result.module +
                     "\" for task #" + std::to_string(task.id) + ": " + e.what());
    } catch (...) {
        result.outcome = Outcome::UnexpectedFailure;
        result.message = "unknown exception";
        writer.error("Failed to run the " + std::string(stage) + " module \"" + result.module +
                     "\" for task #" + std::to_string(task.id) + ": unknown exception");
    }
    result.data = Value();
    return false;
}

}  // namespace sandpipe::pipeline
