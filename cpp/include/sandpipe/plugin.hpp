// ==============================================================================
// sandpipe/plugin.hpp - MOD-0008: Интерфейсы плагинов
// ==============================================================================
//
// MOD-0008 registry
//
// Назначение:
// - Группы возможностей: auxiliary, machinery, processing, reporting, signatures
// - Task / Machine: контекст анализа, передаваемый модулям
// - Базовые интерфейсы модулей каждой группы
//
// Плагин — это реализация одного из интерфейсов ниже. Какие плагины
// существуют, определяет таблица регистрации (registry.hpp), а не поиск
// наследников во время выполнения. Интерфейс сигнатур — signature.hpp.
//
// ==============================================================================

#ifndef SANDPIPE_PLUGIN_HPP
#define SANDPIPE_PLUGIN_HPP

#include <sandpipe/config.hpp>
#include <sandpipe/results.hpp>
#include <sandpipe/value.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandpipe {

// ============================================================================
// Group
// ============================================================================

enum class Group { Auxiliary, Machinery, Processing, Reporting, Signatures };

/// "auxiliary", "machinery", "processing", "reporting", "signatures"
const char* to_string(Group group);

/// @throw std::invalid_argument если строка не распознана
Group parse_group(std::string_view s);

/// Все группы в каноническом порядке
const std::vector<Group>& all_groups();

// ============================================================================
// Task / Machine
// ============================================================================

/// Задача анализа. Ядро использует только id (путь хранилища и логи),
/// остальные поля читают модули.
struct Task {
    std::int64_t id = 0;
    std::string category = "file";  // file | url | ...
    std::string target;             // путь к образцу или URL
    std::string package;            // пакет анализа
    Value options;                  // произвольные параметры задачи
};

/// Виртуальная машина, на которой выполнялся анализ
struct Machine {
    std::string name;
    std::string label;
    std::string platform;
    std::string ip;
};

// ============================================================================
// Plugin
// ============================================================================

/// Общий корень всех плагинов: реестр хранит фабрики Plugin
class Plugin {
public:
    virtual ~Plugin() = default;
};

/// Общая часть processing/reporting/auxiliary: инъекция контекста
class Module : public Plugin {
public:
    void set_task(const Task& task) { task_ = task; }
    void set_path(const std::filesystem::path& path) { analysis_path_ = path; }
    void set_options(const config::Options& options) { options_ = options; }

    const Task& task() const { return task_; }
    const std::filesystem::path& analysis_path() const { return analysis_path_; }
    const config::Options& options() const { return options_; }

private:
    Task task_;
    std::filesystem::path analysis_path_;
    config::Options options_;
};

// ============================================================================
// Processing
// ============================================================================

/// Processing-модуль: читает сырые артефакты анализа и возвращает данные,
/// которые попадут в карту результатов под ключом key().
///
/// Объявленные сбои: DependencyError, ProcessingError.
class Processing : public Module {
public:
    explicit Processing(std::string key) : key_(std::move(key)) {}

    const std::string& key() const { return key_; }

    /// Результаты предыдущих модулей (только чтение)
    void set_results(const ResultsMap* results) { results_ = results; }

    /// Вернуть данные модуля. Пустое значение (null, {}, [], "") не сохраняется.
    virtual Value run() = 0;

protected:
    /// Результаты предыдущих модулей; nullptr до инъекции
    const ResultsMap* results() const { return results_; }

private:
    std::string key_;
    const ResultsMap* results_ = nullptr;
};

// ============================================================================
// Report
// ============================================================================

/// Reporting-модуль: строит отчёт по итоговой карте результатов.
/// Карта передаётся изменяемой: модуль может добавить ключ для следующих
/// модулей этапа, но по соглашению данные анализа не меняет.
///
/// Объявленные сбои: DependencyError, ReportError.
class Report : public Module {
public:
    /// Путь к вторичной конфигурации анализа
    std::filesystem::path conf_path() const { return analysis_path() / "analysis.yaml"; }

    void set_analysis_config(config::Config cfg) { analysis_cfg_ = std::move(cfg); }
    const config::Config& analysis_config() const { return analysis_cfg_; }

    virtual void run(ResultsMap& results) = 0;

private:
    config::Config analysis_cfg_;
};

// ============================================================================
// Auxiliary
// ============================================================================

/// Auxiliary-модуль: работает параллельно с выполнением образца
/// (снятие трафика, эмуляция пользователя). Жизненный цикл start/stop.
class Auxiliary : public Module {
public:
    void set_machine(const Machine& machine) { machine_ = machine; }
    const Machine& machine() const { return machine_; }

    virtual void start() {}
    virtual void stop() {}

private:
    Machine machine_;
};

// ============================================================================
// Machinery
// ============================================================================

/// Менеджер виртуальных машин. Конвейер результатов его не запускает;
/// он регистрируется для полноты контракта групп.
class Machinery : public Plugin {
public:
    /// Прочитать конфигурацию и заполнить список машин
    virtual void initialize(const config::Options& options) = 0;

    virtual void start(const std::string& label) = 0;
    virtual void stop(const std::string& label) = 0;

    const std::vector<Machine>& machines() const { return machines_; }

protected:
    std::vector<Machine> machines_;
};

}  // namespace sandpipe

#endif  // SANDPIPE_PLUGIN_HPP
