// ==============================================================================
// behavior.cpp - MOD-0017: Встроенные processing-модули
// ==============================================================================
//
// MOD-0017 builtin
//
// ==============================================================================

#include <sandpipe/builtin.hpp>

#include <sandpipe/errors.hpp>
#include <sandpipe/platform.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace sandpipe::builtin {

// ============================================================================
// behavior
// ============================================================================

Value BehaviorAnalysis::run() {
    std::filesystem::path log = analysis_path() / "logs" / "behavior.json";

    const std::string custom = options().get_string("path", "");
    if (!custom.empty()) {
        std::filesystem::path p = platform::path_from_utf8(custom);
        log = p.is_absolute() ? p : analysis_path() / p;
    }

    // Поведенческого лога нет (например, анализ URL) → нет данных
    std::error_code ec;
    if (!std::filesystem::exists(log, ec)) {
        return Value();
    }

    std::ifstream file(log, std::ios::binary);
    if (!file.is_open()) {
        throw ProcessingError("could not open behavior log: " + platform::path_to_utf8(log));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Value behavior;
    try {
        behavior = Value::parse_json(buffer.str());
    } catch (const std::runtime_error& e) {
        throw ProcessingError("behavior log " + platform::path_to_utf8(log) + ": " + e.what());
    }

    if (!behavior.is_object()) {
        throw ProcessingError("behavior log " + platform::path_to_utf8(log) +
                              " is not a JSON object");
    }
    return behavior;
}

// ============================================================================
// target
// ============================================================================

Value TargetInfo::run() {
    const Task& t = task();

    Value out = Value::make_object();
    out.set("category", Value(t.category));

    if (t.category == "file") {
        Value file = Value::make_object();
        file.set("path", Value(t.target));
        file.set("name", Value(platform::path_to_utf8(
                             platform::path_from_utf8(t.target).filename())));
        out.set("file", std::move(file));
    } else {
        out.set(t.category, Value(t.target));
    }

    if (!t.package.empty()) {
        out.set("package", Value(t.package));
    }
    return out;
}

}  // namespace sandpipe::builtin
