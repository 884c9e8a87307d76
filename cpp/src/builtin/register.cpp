// ==============================================================================
// register.cpp - MOD-0017: Таблица регистрации встроенных плагинов
// ==============================================================================
//
// MOD-0017 builtin
// MOD-0008 registry
//
// ==============================================================================

#include <sandpipe/builtin.hpp>
#include <sandpipe/registry.hpp>

namespace sandpipe {

namespace {

template <typename T>
PluginDescriptor signature(const char* name) {
    PluginDescriptor d = describe<T>(name);
    d.minimum = "2.0";
    return d;
}

}  // namespace

void register_builtin_plugins(Registry& registry, output::Writer* writer) {
    // processing
    registry.register_plugin(describe<builtin::TargetInfo>("target", 0));
    registry.register_plugin(describe<builtin::BehaviorAnalysis>("behavior", 1));

    // signatures
    registry.register_plugin(signature<builtin::CreatesExecutable>("creates_executable"));
    registry.register_plugin(signature<builtin::AutorunPersistence>("autorun_persistence"));
    registry.register_plugin(
        signature<builtin::RemoteThreadInjection>("remote_thread_injection"));
    registry.register_plugin(signature<builtin::MultipleIndicators>("multiple_indicators"));

    // reporting
    PluginDescriptor console = describe<builtin::ConsoleReport>("console", 1);
    console.factory = [writer] {
        return std::unique_ptr<Plugin>(std::make_unique<builtin::ConsoleReport>(writer));
    };
    registry.register_plugin(std::move(console));
}

}  // namespace sandpipe
