// ==============================================================================
// sandpipe/runner.hpp - MOD-0009: Исполнение модулей с изоляцией сбоев
// ==============================================================================
//
// MOD-0009 runner
//
// Назначение:
// - Общая механика этапов processing / reporting / auxiliary:
//   создать экземпляр, найти секцию конфигурации, пропустить выключенный
//   модуль, внедрить контекст, выполнить, классифицировать исход
// - Ни один сбой модуля не выходит за эту границу
//
// Классификация:
//   фабрика бросила / неверный тип плагина → LoadFailure       (error)
//   нет секции конфигурации               → NotConfigured     (debug)
//   enabled == false                      → Disabled          (тихо)
//   неверные типы в секции                → Misconfigured     (warn)
//   DependencyError                       → DependencyMissing (warn)
//   ProcessingError / ReportError         → ModuleFailure     (warn)
//   любое другое исключение               → UnexpectedFailure (error)
//
// ==============================================================================

#ifndef SANDPIPE_RUNNER_HPP
#define SANDPIPE_RUNNER_HPP

#include <sandpipe/cancel.hpp>
#include <sandpipe/config.hpp>
#include <sandpipe/output.hpp>
#include <sandpipe/plugin.hpp>
#include <sandpipe/registry.hpp>
#include <sandpipe/value.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sandpipe::pipeline {

enum class Outcome {
    Success,
    LoadFailure,
    NotConfigured,
    Disabled,
    Misconfigured,
    DependencyMissing,
    ModuleFailure,
    UnexpectedFailure,
    Cancelled,
};

const char* to_string(Outcome outcome);

/// Исход одного модуля
struct ModuleResult {
    Outcome outcome = Outcome::Success;
    std::string module;
    std::string key;   // processing: ключ данных
    Value data;        // processing: данные (только при Success)
    std::string message;  // текст ошибки для неуспешных исходов

    bool ok() const { return outcome == Outcome::Success; }
};

struct RunnerOptions {
    /// Корень установки: анализы лежат в <root>/storage/analyses/<id>
    std::filesystem::path root = ".";
    const CancelToken* cancel = nullptr;
};

/// <root>/storage/analyses/<task_id>
std::filesystem::path analysis_path(const std::filesystem::path& root, std::int64_t task_id);

/// Копия списка, устойчиво отсортированная по order (реестр не меняется)
std::vector<PluginDescriptor> ordered(const std::vector<PluginDescriptor>& descriptors);

// ----------------------------------------------------------------------------
// Загрузка модуля
// ----------------------------------------------------------------------------

/// Создать экземпляр через фабрику. nullptr + LoadFailure при исключении.
std::unique_ptr<Plugin> instantiate(const PluginDescriptor& descriptor, const char* stage,
                                    output::Writer& writer, ModuleResult& result);

/// Секция конфигурации модуля. nullopt + NotConfigured/Disabled/Misconfigured,
/// если модуль не должен запускаться.
std::optional<config::Options> resolve_options(const PluginDescriptor& descriptor,
                                               const config::Config& cfg, const char* stage,
                                               output::Writer& writer, ModuleResult& result);

/// Экземпляр модуля интерфейса T с внедрённым контекстом, либо nullptr
/// (исход записан в result).
template <typename T>
std::unique_ptr<T> load_module(const PluginDescriptor& descriptor, const config::Config& cfg,
                               const Task& task, const std::filesystem::path& path,
                               const char* stage, output::Writer& writer, ModuleResult& result) {
    result.module = descriptor.name;

    std::unique_ptr<Plugin> plugin = instantiate(descriptor, stage, writer, result);
    if (!plugin) {
        return nullptr;
    }

    auto* typed = dynamic_cast<T*>(plugin.get());
    if (typed == nullptr) {
        result.outcome = Outcome::LoadFailure;
        result.message = "plugin is not a " + std::string(stage) + " module";
        writer.error("Unable to load the " + std::string(stage) + " module \"" +
                     descriptor.name + "\": " + result.message);
        return nullptr;
    }

    auto options = resolve_options(descriptor, cfg, stage, writer, result);
    if (!options) {
        return nullptr;
    }

    plugin.release();
    std::unique_ptr<T> module(typed);
    module->set_task(task);
    module->set_path(path);
    module->set_options(*options);
    return module;
}

// ----------------------------------------------------------------------------
// Выполнение
// ----------------------------------------------------------------------------

/// Выполнить body, классифицировать исключения и записать исход в result.
/// Возвращает true при успехе.
bool execute(const char* stage, const Task& task, output::Writer& writer, ModuleResult& result,
             const std::function<void()>& body);

}  // namespace sandpipe::pipeline

#endif  // SANDPIPE_RUNNER_HPP
