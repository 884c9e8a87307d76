// ==============================================================================
// console.cpp - MOD-0017: Reporting-модуль console
// ==============================================================================
//
// MOD-0017 builtin
//
// ==============================================================================

#include <sandpipe/builtin.hpp>

#include <sandpipe/errors.hpp>
#include <sandpipe/platform.hpp>

#include <memory>

namespace sandpipe::builtin {

void ConsoleReport::run(ResultsMap& results) {
    std::unique_ptr<output::Writer> fallback;
    output::Writer* out = writer_;
    if (out == nullptr) {
        fallback = std::make_unique<output::Writer>(output::OutputConfig{});
        out = fallback.get();
    }

    const Value* signatures = results.get("signatures");
    if (signatures != nullptr && !signatures->is_array()) {
        throw ReportError("results key \"signatures\" is not a list");
    }

    const std::string prefix = platform::list_prefix();

    out->info("Task #" + std::to_string(task().id) + " (" + task().category + "): " +
              std::to_string(signatures != nullptr ? signatures->size() : 0) +
              " signature(s) matched");

    if (signatures != nullptr) {
        for (const auto& detection : signatures->as_array()) {
            const std::string name = detection.get_string_or("name", "<unnamed>");
            std::int64_t severity = 0;
            if (const Value* sev = detection.get("severity")) {
                severity = sev->to_int64().value_or(0);
            }
            std::string line = prefix + " " + name + " (severity " + std::to_string(severity) + ")";
            const std::string description = detection.get_string_or("description");
            if (!description.empty()) {
                line += ": " + description;
            }

            if (severity >= 3) {
                out->red_line(line);
            } else if (severity == 2) {
                out->yellow_line(line);
            } else {
                out->write_line(output::Stream::Stdout, line);
            }
        }
    }

    if (options().get_bool("results", false)) {
        out->write_line(output::Stream::Stdout, results.dump_json(true));
    }
    out->flush();
}

}  // namespace sandpipe::builtin
