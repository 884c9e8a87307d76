// ==============================================================================
// sandpipe/trace.hpp - MOD-0013: Поведенческая трасса
// ==============================================================================
//
// MOD-0013 signatures
//
// Трасса — упорядоченные процессы, каждый с упорядоченными вызовами API.
// Источник: results["behavior"]["processes"]:
//
//   {"processes": [
//       {"pid": 100, "process_name": "malware.exe",
//        "calls": [{"api": "CreateFileW", "category": "filesystem",
//                   "arguments": {...}, "return": 0}]}
//   ]}
//
// Отсутствующие ключи означают пустую трассу. Элементы, не являющиеся
// объектами, пропускаются.
//
// ==============================================================================

#ifndef SANDPIPE_TRACE_HPP
#define SANDPIPE_TRACE_HPP

#include <sandpipe/results.hpp>
#include <sandpipe/value.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sandpipe {

namespace output {
class Writer;
}

struct Call {
    std::string api;
    std::string category;
    std::size_t index = 0;  // позиция в исходном списке calls процесса
    Value raw;              // полная запись вызова

    /// raw["arguments"][name] или nullptr
    const Value* argument(const std::string& name) const;

    /// Строковый аргумент или fallback
    std::string argument_string(const std::string& name, const std::string& fallback = {}) const;
};

struct Process {
    std::int64_t pid = 0;
    std::string process_name;
    std::vector<Call> calls;
    Value raw;  // полная запись процесса
};

struct Trace {
    std::vector<Process> processes;

    std::size_t call_count() const;
    bool empty() const { return processes.empty(); }
};

/// Построить трассу из results["behavior"]. writer (может быть nullptr)
/// получает debug-сообщения о пропущенных элементах.
Trace load_trace(const ResultsMap& results, output::Writer* writer = nullptr);

/// То же для значения ключа behavior
Trace load_trace(const Value& behavior, output::Writer* writer = nullptr);

}  // namespace sandpipe

#endif  // SANDPIPE_TRACE_HPP
