// ==============================================================================
// signatures.cpp - MOD-0017: Встроенные сигнатуры
// ==============================================================================
//
// MOD-0017 builtin
//
// Имена аргументов соответствуют монитору API:
// - файловые вызовы: filepath / FileName
// - реестр: regkey / FullName
// - процессы: process_handle / ProcessHandle
//
// ==============================================================================

#include <sandpipe/builtin.hpp>

#include <algorithm>
#include <cctype>

namespace sandpipe::builtin {

namespace {

std::string to_lowercase(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool ends_with_icase(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) {
        return false;
    }
    return to_lowercase(s.substr(s.size() - suffix.size())) == suffix;
}

/// Первый непустой строковый аргумент из списка имён
std::string first_argument(const Call& call, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        std::string value = call.argument_string(name);
        if (!value.empty()) {
            return value;
        }
    }
    return {};
}

Value call_mark(const Signature& sig, const Call& call, const std::string& ioc) {
    Value mark = Value::make_object();
    mark.set("type", Value("call"));
    mark.set("pid", Value(sig.pid()));
    mark.set("cid", Value(static_cast<std::uint64_t>(sig.cid())));
    mark.set("api", Value(call.api));
    if (!ioc.empty()) {
        mark.set("ioc", Value(ioc));
    }
    return mark;
}

}  // namespace

// ============================================================================
// creates_executable
// ============================================================================

CreatesExecutable::CreatesExecutable()
    : Signature("creates_executable", 2, "Creates an executable file on the filesystem") {
    filter_categories = {"filesystem"};
    filter_apinames = {"CreateFileW", "CreateFileA", "NtCreateFile", "NtWriteFile"};
}

bool CreatesExecutable::on_call(const Call& call, const Process& /*process*/) {
    const std::string path = first_argument(call, {"filepath", "FileName"});
    if (!ends_with_icase(path, ".exe") && !ends_with_icase(path, ".dll")) {
        return false;
    }
    mark(call_mark(*this, call, path));
    return true;
}

// ============================================================================
// autorun_persistence
// ============================================================================

AutorunPersistence::AutorunPersistence()
    : Signature("autorun_persistence", 3, "Installs itself for autorun at Windows startup") {
    filter_categories = {"registry"};
    filter_apinames = {"RegSetValueExA", "RegSetValueExW", "NtSetValueKey", "RegCreateKeyExA",
                       "RegCreateKeyExW"};
}

bool AutorunPersistence::on_call(const Call& call, const Process& /*process*/) {
    const std::string key = first_argument(call, {"regkey", "FullName"});
    const std::string lower = to_lowercase(key);

    static const char* const AUTORUN_KEYS[] = {
        "\\software\\microsoft\\windows\\currentversion\\run",
        "\\software\\microsoft\\windows nt\\currentversion\\winlogon",
        "\\system\\currentcontrolset\\services\\",
    };
    for (const char* autorun : AUTORUN_KEYS) {
        if (lower.find(autorun) != std::string::npos) {
            mark(call_mark(*this, call, key));
            return true;
        }
    }
    return false;
}

// ============================================================================
// remote_thread_injection
// ============================================================================

RemoteThreadInjection::RemoteThreadInjection()
    : Signature("remote_thread_injection", 3,
                "Writes into the memory of another process and starts a thread in it") {
    filter_categories = {"process"};
    filter_apinames = {"WriteProcessMemory", "NtWriteVirtualMemory", "CreateRemoteThread",
                       "CreateRemoteThreadEx", "NtCreateThreadEx"};
}

bool RemoteThreadInjection::on_call(const Call& call, const Process& process) {
    if (call.api == "WriteProcessMemory" || call.api == "NtWriteVirtualMemory") {
        written_.insert(process.pid);
        return false;
    }

    // Создание потока засчитывается только после записи в память
    if (written_.count(process.pid) == 0) {
        return false;
    }
    mark(call_mark(*this, call, first_argument(call, {"process_handle", "ProcessHandle"})));
    return true;
}

// ============================================================================
// multiple_indicators
// ============================================================================

MultipleIndicators::MultipleIndicators()
    : Signature("multiple_indicators", 4, "Shows several independent malicious indicators") {}

bool MultipleIndicators::on_signature(const Signature& matched) {
    if (&matched == this || !seen_.insert(matched.name()).second) {
        return false;
    }
    if (seen_.size() < THRESHOLD) {
        return false;
    }

    // На пороге отмечаются все накопленные сигнатуры, дальше только новые
    const bool first = seen_.size() == THRESHOLD;
    for (const auto& name : seen_) {
        if (!first && name != matched.name()) {
            continue;
        }
        Value mark_value = Value::make_object();
        mark_value.set("type", Value("signature"));
        mark_value.set("name", Value(name));
        mark(std::move(mark_value));
    }
    return true;
}

}  // namespace sandpipe::builtin
