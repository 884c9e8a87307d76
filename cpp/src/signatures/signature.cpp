// ==============================================================================
// signature.cpp - MOD-0013: Интерфейс сигнатуры
// ==============================================================================
//
// MOD-0013 signatures
//
// ==============================================================================

#include <sandpipe/signature.hpp>

namespace sandpipe {

Signature::Signature(std::string name, int severity, std::string description)
    : name_(std::move(name)), severity_(severity), description_(std::move(description)) {}

void Signature::compile_filters() {
    processnames_ = {filter_processnames.begin(), filter_processnames.end()};
    apinames_ = {filter_apinames.begin(), filter_apinames.end()};
    categories_ = {filter_categories.begin(), filter_categories.end()};
}

bool Signature::accepts(const Process& process, const Call& call) const {
    if (!processnames_.empty() && processnames_.count(process.process_name) == 0) {
        return false;
    }
    if (!apinames_.empty() && apinames_.count(call.api) == 0) {
        return false;
    }
    if (!categories_.empty() && categories_.count(call.category) == 0) {
        return false;
    }
    return true;
}

bool Signature::on_process(const Process& /*process*/) {
    return false;
}

bool Signature::on_call(const Call& /*call*/, const Process& /*process*/) {
    return false;
}

bool Signature::on_signature(const Signature& /*matched*/) {
    return false;
}

void Signature::mark(Value evidence) {
    marks_.push_back(std::move(evidence));
}

Value Signature::detection() const {
    Value out = Value::make_object();
    out.set("name", Value(name_));
    out.set("severity", Value(severity_));
    out.set("description", Value(description_));
    out.set("marks", Value(Value::Array(marks_.begin(), marks_.end())));
    return out;
}

}  // namespace sandpipe
