// ==============================================================================
// trace.cpp - MOD-0013: Поведенческая трасса
// ==============================================================================
//
// MOD-0013 signatures
//
// ==============================================================================

#include <sandpipe/trace.hpp>

#include <sandpipe/output.hpp>

namespace sandpipe {

// ============================================================================
// Call
// ============================================================================

const Value* Call::argument(const std::string& name) const {
    const Value* args = raw.get("arguments");
    if (args == nullptr) {
        return nullptr;
    }
    return args->get(name);
}

std::string Call::argument_string(const std::string& name, const std::string& fallback) const {
    const Value* v = argument(name);
    if (v != nullptr && v->is_string()) {
        return v->as_string();
    }
    return fallback;
}

std::size_t Trace::call_count() const {
    std::size_t total = 0;
    for (const auto& process : processes) {
        total += process.calls.size();
    }
    return total;
}

// ============================================================================
// Загрузка
// ============================================================================

namespace {

void skipped(output::Writer* writer, const std::string& what) {
    if (writer != nullptr) {
        writer->debug("Skipping malformed " + what + " in behavior trace");
    }
}

}  // namespace

Trace load_trace(const Value& behavior, output::Writer* writer) {
    Trace trace;

    const Value* processes = behavior.get("processes");
    if (processes == nullptr) {
        return trace;
    }
    const auto* list = processes->get_array();
    if (list == nullptr) {
        skipped(writer, "process list");
        return trace;
    }

    for (std::size_t i = 0; i < list->size(); ++i) {
        const Value& entry = (*list)[i];
        if (!entry.is_object()) {
            skipped(writer, "process #" + std::to_string(i));
            continue;
        }

        Process process;
        process.raw = entry;
        if (const Value* pid = entry.get("pid")) {
            process.pid = pid->to_int64().value_or(0);
        }
        process.process_name = entry.get_string_or("process_name");

        const Value* calls = entry.get("calls");
        const auto* call_list = calls != nullptr ? calls->get_array() : nullptr;
        if (call_list != nullptr) {
            for (std::size_t j = 0; j < call_list->size(); ++j) {
                const Value& raw_call = (*call_list)[j];
                if (!raw_call.is_object()) {
                    skipped(writer, "call #" + std::to_string(j) + " of pid " +
                                        std::to_string(process.pid));
                    continue;
                }
                Call call;
                call.api = raw_call.get_string_or("api");
                call.category = raw_call.get_string_or("category");
                call.index = j;
                call.raw = raw_call;
                process.calls.push_back(std::move(call));
            }
        } else if (calls != nullptr) {
            skipped(writer, "call list of pid " + std::to_string(process.pid));
        }

        trace.processes.push_back(std::move(process));
    }

    return trace;
}

Trace load_trace(const ResultsMap& results, output::Writer* writer) {
    const Value* behavior = results.get("behavior");
    if (behavior == nullptr) {
        return Trace{};
    }
    return load_trace(*behavior, writer);
}

}  // namespace sandpipe
