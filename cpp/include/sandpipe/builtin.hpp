// ==============================================================================
// sandpipe/builtin.hpp - MOD-0017: Встроенные плагины
// ==============================================================================
//
// MOD-0017 builtin
//
// processing:
//   target    (order 0) → results["target"]   описание задачи
//   behavior  (order 1) → results["behavior"] <analysis>/logs/behavior.json
// signatures:
//   creates_executable      (2) запись .exe файла
//   autorun_persistence     (3) запись в ключ автозапуска
//   remote_thread_injection (3) запись в память процесса + удалённый поток
//   multiple_indicators     (4) совпали две другие сигнатуры
// reporting:
//   console   (order 1) вывод детектов через Writer
//
// ==============================================================================

#ifndef SANDPIPE_BUILTIN_HPP
#define SANDPIPE_BUILTIN_HPP

#include <sandpipe/output.hpp>
#include <sandpipe/plugin.hpp>
#include <sandpipe/signature.hpp>

#include <set>
#include <string>

namespace sandpipe::builtin {

// ----------------------------------------------------------------------------
// processing
// ----------------------------------------------------------------------------

/// Поведенческий лог анализа.
///
/// Опция `path`: путь к JSON относительно каталога анализа
/// (по умолчанию logs/behavior.json). Нет файла → нет данных.
/// @throw ProcessingError если файл не читается или не JSON объект
class BehaviorAnalysis : public Processing {
public:
    BehaviorAnalysis() : Processing("behavior") {}
    Value run() override;
};

class TargetInfo : public Processing {
public:
    TargetInfo() : Processing("target") {}
    Value run() override;
};

// ----------------------------------------------------------------------------
// signatures
// ----------------------------------------------------------------------------

class CreatesExecutable : public Signature {
public:
    CreatesExecutable();
    bool on_call(const Call& call, const Process& process) override;
};

class AutorunPersistence : public Signature {
public:
    AutorunPersistence();
    bool on_call(const Call& call, const Process& process) override;
};

class RemoteThreadInjection : public Signature {
public:
    RemoteThreadInjection();
    bool on_call(const Call& call, const Process& process) override;

private:
    std::set<std::int64_t> written_;  // pid, писавшие в чужую память
};

class MultipleIndicators : public Signature {
public:
    MultipleIndicators();
    bool on_signature(const Signature& matched) override;

    /// Сколько других сигнатур должно совпасть
    static constexpr std::size_t THRESHOLD = 2;

private:
    std::set<std::string> seen_;
};

// ----------------------------------------------------------------------------
// reporting
// ----------------------------------------------------------------------------

/// Печать детектов через Writer, заданный при регистрации
/// (без него используется Writer с настройками по умолчанию).
/// Опция `results: yes` дополнительно печатает всю карту результатов в JSON.
class ConsoleReport : public Report {
public:
    explicit ConsoleReport(output::Writer* writer = nullptr) : writer_(writer) {}
    void run(ResultsMap& results) override;

private:
    output::Writer* writer_;
};

}  // namespace sandpipe::builtin

#endif  // SANDPIPE_BUILTIN_HPP
