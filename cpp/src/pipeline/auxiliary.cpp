// ==============================================================================
// auxiliary.cpp - MOD-0012: Жизненный цикл auxiliary-модулей
// ==============================================================================
//
// MOD-0012 auxiliary
//
// ==============================================================================

#include <sandpipe/auxiliary.hpp>

namespace sandpipe::pipeline {

namespace {

constexpr const char* STAGE = "auxiliary";

/// Сбои start/stop auxiliary-модуля — предупреждения, не ошибки
bool guarded(const char* action, ModuleResult& result, output::Writer& writer,
             const std::function<void()>& body) {
    try {
        body();
        result.outcome = Outcome::Success;
        return true;
    } catch (const std::exception& e) {
        result.message = e.what();
    } catch (...) {
        result.message = "unknown exception";
    }
    result.outcome = Outcome::ModuleFailure;
    writer.warn(std::string("Unable to ") + action + " auxiliary module " + result.module +
                ": " + result.message);
    return false;
}

}  // namespace

RunAuxiliary::RunAuxiliary(const Task& task, const Machine& machine, const Registry& registry,
                           const config::Config& cfg, output::Writer& writer,
                           RunnerOptions options)
    : task_(task),
      machine_(machine),
      registry_(registry),
      cfg_(cfg),
      writer_(writer),
      options_(std::move(options)) {}

RunAuxiliary::~RunAuxiliary() = default;

void RunAuxiliary::start() {
    outcomes_.clear();
    const auto path = analysis_path(options_.root, task_.id);

    for (const auto& descriptor : registry_.list(Group::Auxiliary)) {
        if (is_cancelled(options_.cancel)) {
            break;
        }

        ModuleResult result;
        auto module =
            load_module<Auxiliary>(descriptor, cfg_, task_, path, STAGE, writer_, result);
        if (!module) {
            outcomes_.push_back(std::move(result));
            continue;
        }

        module->set_machine(machine_);

        const bool ok = guarded("start", result, writer_, [&] { module->start(); });
        if (ok) {
            writer_.debug("Started auxiliary module: " + descriptor.name);
            enabled_.push_back(Started{descriptor.name, std::move(module)});
        }
        outcomes_.push_back(std::move(result));
    }
}

void RunAuxiliary::stop() {
    for (auto& entry : enabled_) {
        ModuleResult result;
        result.module = entry.name;
        // Сбой остановки одного модуля не мешает остановить остальные
        const bool ok = guarded("stop", result, writer_, [&] { entry.module->stop(); });
        if (ok) {
            writer_.debug("Stopped auxiliary module: " + entry.name);
        }
    }
    enabled_.clear();
}

std::vector<std::string> RunAuxiliary::started() const {
    std::vector<std::string> names;
    names.reserve(enabled_.size());
    for (const auto& entry : enabled_) {
        names.push_back(entry.name);
    }
    return names;
}

}  // namespace sandpipe::pipeline
