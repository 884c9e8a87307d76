// ==============================================================================
// sandpipe/auxiliary.hpp - MOD-0012: Жизненный цикл auxiliary-модулей
// ==============================================================================
//
// MOD-0012 auxiliary
//
// start(): запустить все включённые auxiliary-модули (сбой одного не мешает
// остальным); stop(): остановить запущенные в порядке запуска.
// Auxiliary-модули не пишут в карту результатов.
//
// ==============================================================================

#ifndef SANDPIPE_AUXILIARY_HPP
#define SANDPIPE_AUXILIARY_HPP

#include <sandpipe/runner.hpp>

#include <memory>
#include <string>
#include <vector>

namespace sandpipe::pipeline {

class RunAuxiliary {
public:
    RunAuxiliary(const Task& task, const Machine& machine, const Registry& registry,
                 const config::Config& cfg, output::Writer& writer, RunnerOptions options = {});
    ~RunAuxiliary();

    RunAuxiliary(const RunAuxiliary&) = delete;
    RunAuxiliary& operator=(const RunAuxiliary&) = delete;

    void start();
    void stop();

    /// Имена запущенных модулей в порядке запуска
    std::vector<std::string> started() const;

    const std::vector<ModuleResult>& outcomes() const { return outcomes_; }

private:
    struct Started {
        std::string name;
        std::unique_ptr<Auxiliary> module;
    };

    Task task_;
    Machine machine_;
    const Registry& registry_;
    const config::Config& cfg_;
    output::Writer& writer_;
    RunnerOptions options_;

    std::vector<Started> enabled_;
    std::vector<ModuleResult> outcomes_;
};

}  // namespace sandpipe::pipeline

#endif  // SANDPIPE_AUXILIARY_HPP
