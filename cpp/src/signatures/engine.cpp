// ==============================================================================
// engine.cpp - MOD-0015: Движок сигнатур
// ==============================================================================
//
// MOD-0015 engine
//
// ==============================================================================

#include <sandpipe/engine.hpp>

#include <sandpipe/trace.hpp>

#include <algorithm>
#include <utility>

namespace sandpipe::pipeline {

std::vector<StyleFloor> default_style_floors() {
    return {
        {"1.2", "Signature style has been redesigned in 1.2. This signature is not compatible: "},
        {"2.0", "Version 2.0 features a lot of changes that render old signatures ineffective "
                "as they are not backwards-compatible. Please upgrade this signature: "},
    };
}

RunSignatures::RunSignatures(ResultsMap& results, const Registry& registry,
                             output::Writer& writer, EngineOptions options)
    : results_(results), registry_(registry), writer_(writer), options_(std::move(options)) {
    running_ = version::parse(version::strip_prerelease(options_.version));
    if (!running_) {
        writer_.warn("Unable to parse engine version \"" + options_.version +
                     "\", versioned signatures will be skipped");
    }
}

// ============================================================================
// Загрузка
// ============================================================================

bool RunSignatures::check_signature_version(const PluginDescriptor& descriptor) {
    if (descriptor.minimum) {
        auto minimum = version::parse(*descriptor.minimum);
        if (!minimum || !running_) {
            writer_.debug("Wrong minimum version number in signature " + descriptor.name);
            return false;
        }
        if (version::compare(*running_, *minimum) < 0) {
            writer_.debug("You are running an older incompatible version of the engine, "
                          "the signature \"" + descriptor.name + "\" requires minimum version " +
                          *descriptor.minimum);
            return false;
        }
        for (const auto& style : options_.style_floors) {
            auto floor = version::parse(style.version);
            if (floor && version::compare(*floor, *minimum) > 0) {
                writer_.warn(style.message + descriptor.name);
                return false;
            }
        }
    }

    if (descriptor.maximum) {
        auto maximum = version::parse(*descriptor.maximum);
        if (!maximum || !running_) {
            writer_.debug("Wrong maximum version number in signature " + descriptor.name);
            return false;
        }
        if (version::compare(*running_, *maximum) > 0) {
            writer_.debug("You are running a newer incompatible version of the engine, "
                          "the signature \"" + descriptor.name + "\" requires maximum version " +
                          *descriptor.maximum);
            return false;
        }
    }

    return true;
}

void RunSignatures::load() {
    for (const auto& descriptor : registry_.list(Group::Signatures)) {
        if (!descriptor.enabled) {
            writer_.debug("Signature " + descriptor.name + " is disabled");
            ++stats_.dropped;
            continue;
        }
        if (!check_signature_version(descriptor)) {
            ++stats_.dropped;
            continue;
        }

        std::unique_ptr<Plugin> plugin;
        try {
            plugin = descriptor.instantiate();
        } catch (const std::exception& e) {
            writer_.error("Unable to instantiate the signature \"" + descriptor.name +
                          "\": " + e.what());
            ++stats_.dropped;
            continue;
        } catch (...) {
            writer_.error("Unable to instantiate the signature \"" + descriptor.name +
                          "\": unknown exception");
            ++stats_.dropped;
            continue;
        }

        auto* signature = dynamic_cast<Signature*>(plugin.get());
        if (signature == nullptr) {
            writer_.error("Unable to load the signature \"" + descriptor.name +
                          "\": plugin is not a signature");
            ++stats_.dropped;
            continue;
        }

        plugin.release();
        active_.emplace_back(signature);
        active_.back()->set_results(&results_);
        ++stats_.loaded;
    }
}

// ============================================================================
// init / quickout
// ============================================================================

void RunSignatures::initialize() {
    for (auto& signature : active_) {
        signature->compile_filters();
    }

    // Проход по снимку: удаление не сдвигает соседей
    std::vector<std::unique_ptr<Signature>> snapshot = std::move(active_);
    active_.clear();

    for (auto& signature : snapshot) {
        bool skip = false;
        try {
            signature->init();
            skip = signature->quickout();
        } catch (const std::exception& e) {
            writer_.error("Failed to initialize the " + signature->name() + " signature: " +
                          e.what());
            ++stats_.dropped;
            continue;
        } catch (...) {
            writer_.error("Failed to initialize the " + signature->name() +
                          " signature: unknown exception");
            ++stats_.dropped;
            continue;
        }
        if (skip) {
            writer_.debug("Signature " + signature->name() + " quit early");
            continue;
        }
        active_.push_back(std::move(signature));
    }

    stats_.active = active_.size();

    writer_.debug("Running " + std::to_string(active_.size()) + " signatures");
    for (std::size_t i = 0; i < active_.size(); ++i) {
        const bool last = i + 1 == active_.size();
        writer_.debug(std::string(last ? "\t `-- " : "\t |-- ") + active_[i]->name());
    }
}

// ============================================================================
// Обёртка вызова обработчика
// ============================================================================

void RunSignatures::dispatch(Signature& signature, const char* handler, const Handler& fn) {
    propagated_.clear();
    call_signature(signature, handler, fn, 0);
}

void RunSignatures::call_signature(Signature& signature, const char* handler, const Handler& fn,
                                   std::size_t depth) {
    if (is_cancelled(options_.cancel)) {
        return;
    }

    bool hit = false;
    try {
        hit = signature.is_active() && fn(signature);
    } catch (const std::exception& e) {
        ++stats_.handler_failures;
        writer_.error("Failed to run '" + std::string(handler) + "' of the " +
                      signature.name() + " signature: " + e.what());
        return;
    } catch (...) {
        ++stats_.handler_failures;
        writer_.error("Failed to run '" + std::string(handler) + "' of the " +
                      signature.name() + " signature: unknown exception");
        return;
    }

    if (hit) {
        on_match(signature, depth);
    }
}

void RunSignatures::on_match(Signature& signature, std::size_t depth) {
    if (!signature.matched()) {
        matched_order_.push_back(&signature);
    }
    signature.set_matched();

    if (propagated_.count(&signature) > 0) {
        ++stats_.cascade_truncations;
        writer_.debug("Signature " + signature.name() +
                      " already propagated its match for this event");
        return;
    }
    if (depth >= options_.max_cascade_depth) {
        ++stats_.cascade_truncations;
        writer_.warn("Signature cascade reached depth " + std::to_string(depth) + " at " +
                     signature.name() + ", not propagating further");
        return;
    }
    propagated_.insert(&signature);

    const Signature& matched = signature;
    for (auto& other : active_) {
        call_signature(*other, "on_signature",
                       [&matched](Signature& s) { return s.on_signature(matched); }, depth + 1);
    }
}

// ============================================================================
// Прогон трассы
// ============================================================================

void RunSignatures::replay() {
    const Trace trace = load_trace(results_, &writer_);

    for (const auto& process : trace.processes) {
        if (is_cancelled(options_.cancel)) {
            break;
        }

        for (auto& signature : active_) {
            signature->set_pid(process.pid);
            dispatch(*signature, "on_process",
                     [&process](Signature& s) { return s.on_process(process); });
        }

        for (const auto& call : process.calls) {
            if (is_cancelled(options_.cancel)) {
                break;
            }
            for (auto& signature : active_) {
                if (!signature->accepts(process, call)) {
                    continue;
                }
                signature->set_cid(call.index);
                dispatch(*signature, "on_call",
                         [&call, &process](Signature& s) { return s.on_call(call, process); });
            }
        }
    }
}

void RunSignatures::complete() {
    for (auto& signature : active_) {
        dispatch(*signature, "on_complete", [](Signature& s) { return s.on_complete(); });
    }
}

void RunSignatures::collect() {
    for (const auto& signature : active_) {
        if (signature->matched()) {
            writer_.debug("Analysis matched signature: " + signature->name());
        }
    }

    std::vector<const Signature*> sorted = matched_order_;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Signature* a, const Signature* b) {
        return a->severity() < b->severity();
    });

    Value detections = Value::make_array();
    for (const auto* signature : sorted) {
        try {
            detections.push_back(signature->detection());
        } catch (const std::exception& e) {
            ++stats_.handler_failures;
            writer_.error("Failed to run 'detection' of the " + signature->name() +
                          " signature: " + e.what());
        } catch (...) {
            ++stats_.handler_failures;
            writer_.error("Failed to run 'detection' of the " + signature->name() +
                          " signature: unknown exception");
        }
    }

    stats_.matched = matched_order_.size();
    results_.set("signatures", std::move(detections));
}

// ============================================================================
// run
// ============================================================================

void RunSignatures::run() {
    active_.clear();
    matched_order_.clear();
    propagated_.clear();
    stats_ = EngineStats{};

    load();
    initialize();
    replay();
    complete();
    collect();

    if (is_cancelled(options_.cancel)) {
        writer_.warn("Signature evaluation was cancelled, storing " +
                     std::to_string(stats_.matched) + " detections collected so far");
    }
}

}  // namespace sandpipe::pipeline
