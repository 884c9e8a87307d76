// ==============================================================================
// test_auxiliary_gtest.cpp - Тесты auxiliary-модулей (GoogleTest)
// ==============================================================================
//
// MOD-0012: auxiliary
// ADR-0008: GoogleTest
//
// ==============================================================================

#include <sandpipe/auxiliary.hpp>

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandpipe::pipeline::test {

using output::Level;

namespace {

using CallLog = std::shared_ptr<std::vector<std::string>>;

output::OutputConfig history_config() {
    output::OutputConfig config;
    config.silent = true;
    config.keep_history = true;
    return config;
}

class Sniffer : public Auxiliary {
public:
    Sniffer(std::string name, CallLog log, bool fail_start = false, bool fail_stop = false)
        : name_(std::move(name)), log_(std::move(log)), fail_start_(fail_start),
          fail_stop_(fail_stop) {}

    void start() override {
        if (fail_start_) {
            throw std::runtime_error("interface down");
        }
        log_->push_back("start " + name_ + " " + machine().label);
    }

    void stop() override {
        if (fail_stop_) {
            throw std::runtime_error("already stopped");
        }
        log_->push_back("stop " + name_);
    }

private:
    std::string name_;
    CallLog log_;
    bool fail_start_;
    bool fail_stop_;
};

PluginDescriptor sniffer(const std::string& name, CallLog log, bool fail_start = false,
                         bool fail_stop = false) {
    PluginDescriptor d;
    d.group = Group::Auxiliary;
    d.name = name;
    d.factory = [name, log, fail_start, fail_stop] {
        return std::make_unique<Sniffer>(name, log, fail_start, fail_stop);
    };
    return d;
}

config::Config enabled(const std::vector<std::string>& names) {
    std::string yaml;
    for (const auto& name : names) {
        yaml += name + ":\n  enabled: yes\n";
    }
    return config::Config::parse(yaml).config;
}

Machine make_machine() {
    return Machine{"cuckoo1", "win7", "windows", "192.168.56.101"};
}

}  // namespace

// ==============================================================================
// TST-AUXILIARY-001: запуск и остановка
// ==============================================================================

TEST(AuxiliaryTest, StartStop_InStartOrder) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(sniffer("sniffer", log));
    registry.register_plugin(sniffer("screenshots", log));

    auto cfg = enabled({"sniffer", "screenshots"});
    output::Writer writer(history_config());
    RunAuxiliary aux(Task{3}, make_machine(), registry, cfg, writer);

    aux.start();
    std::vector<std::string> names = {"sniffer", "screenshots"};
    EXPECT_EQ(aux.started(), names);

    aux.stop();
    std::vector<std::string> expected = {"start sniffer win7", "start screenshots win7",
                                         "stop sniffer", "stop screenshots"};
    EXPECT_EQ(*log, expected);
    EXPECT_TRUE(aux.started().empty());
}

TEST(AuxiliaryTest, Start_FailureIsWarningAndNotStopped) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(sniffer("broken", log, true));
    registry.register_plugin(sniffer("sniffer", log));

    auto cfg = enabled({"broken", "sniffer"});
    output::Writer writer(history_config());
    RunAuxiliary aux(Task{3}, make_machine(), registry, cfg, writer);

    aux.start();
    EXPECT_TRUE(writer.contains(Level::Warn, "Unable to start auxiliary module broken"));
    EXPECT_EQ(writer.count(Level::Error), 0u);
    ASSERT_EQ(aux.outcomes().size(), 2u);
    EXPECT_EQ(aux.outcomes()[0].outcome, Outcome::ModuleFailure);
    EXPECT_TRUE(aux.outcomes()[1].ok());

    aux.stop();
    std::vector<std::string> expected = {"start sniffer win7", "stop sniffer"};
    EXPECT_EQ(*log, expected);
}

TEST(AuxiliaryTest, Stop_FailureDoesNotBlockOthers) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(sniffer("first", log, false, true));
    registry.register_plugin(sniffer("second", log));

    auto cfg = enabled({"first", "second"});
    output::Writer writer(history_config());
    RunAuxiliary aux(Task{3}, make_machine(), registry, cfg, writer);

    aux.start();
    aux.stop();

    EXPECT_TRUE(writer.contains(Level::Warn, "Unable to stop auxiliary module first"));
    EXPECT_EQ(log->back(), "stop second");
}

TEST(AuxiliaryTest, Start_SkipsDisabledAndUnconfigured) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(sniffer("off", log));
    registry.register_plugin(sniffer("orphan", log));

    auto cfg = config::Config::parse("off:\n  enabled: no\n").config;
    output::Writer writer(history_config());
    RunAuxiliary aux(Task{3}, make_machine(), registry, cfg, writer);

    aux.start();
    EXPECT_TRUE(aux.started().empty());
    EXPECT_TRUE(log->empty());
    EXPECT_EQ(writer.count(Level::Warn), 0u);
}

}  // namespace sandpipe::pipeline::test
