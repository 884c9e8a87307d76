// ==============================================================================
// test_registry_gtest.cpp - Тесты реестра плагинов (GoogleTest)
// ==============================================================================
//
// MOD-0008: registry
// ADR-0008: GoogleTest
//
// ==============================================================================

#include <sandpipe/builtin.hpp>
#include <sandpipe/registry.hpp>

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace sandpipe::test {

namespace {

class NullProcessing : public Processing {
public:
    NullProcessing() : Processing("null") {}
    Value run() override { return Value(); }
};

class NullReport : public Report {
public:
    void run(ResultsMap& /*results*/) override {}
};

class NullAuxiliary : public Auxiliary {};

class NullMachinery : public Machinery {
public:
    void initialize(const config::Options& /*options*/) override {
        machines_.push_back(Machine{"cuckoo1", "cuckoo1", "windows", "192.168.56.101"});
    }
    void start(const std::string& /*label*/) override {}
    void stop(const std::string& /*label*/) override {}
};

class NullSignature : public Signature {
public:
    NullSignature() : Signature("null", 1) {}
};

}  // namespace

// ==============================================================================
// TST-REGISTRY-001: группа по интерфейсу
// ==============================================================================

TEST(RegistryTest, GroupOf_DerivedFromInterface) {
    EXPECT_EQ(group_of<NullProcessing>(), Group::Processing);
    EXPECT_EQ(group_of<NullReport>(), Group::Reporting);
    EXPECT_EQ(group_of<NullAuxiliary>(), Group::Auxiliary);
    EXPECT_EQ(group_of<NullMachinery>(), Group::Machinery);
    EXPECT_EQ(group_of<NullSignature>(), Group::Signatures);
}

TEST(RegistryTest, GroupNames_RoundTrip) {
    for (Group group : all_groups()) {
        EXPECT_EQ(parse_group(to_string(group)), group);
    }
    EXPECT_THROW(parse_group("plugins"), std::invalid_argument);
}

TEST(RegistryTest, Describe_DefaultsAndFactory) {
    PluginDescriptor d = describe<NullProcessing>("null");

    EXPECT_EQ(d.group, Group::Processing);
    EXPECT_EQ(d.name, "null");
    EXPECT_EQ(d.order, 1);
    EXPECT_TRUE(d.enabled);
    EXPECT_FALSE(d.minimum.has_value());

    auto a = d.instantiate();
    auto b = d.instantiate();
    ASSERT_NE(a, nullptr);
    EXPECT_NE(a.get(), b.get());
    EXPECT_NE(dynamic_cast<Processing*>(a.get()), nullptr);
}

TEST(RegistryTest, Instantiate_WithoutFactoryThrows) {
    PluginDescriptor d;
    d.name = "empty";
    EXPECT_THROW(d.instantiate(), std::runtime_error);
}

// ==============================================================================
// TST-REGISTRY-002: списки групп
// ==============================================================================

TEST(RegistryTest, List_UnknownGroupIsEmpty) {
    Registry registry;
    EXPECT_TRUE(registry.list(Group::Processing).empty());
    EXPECT_TRUE(registry.list().empty());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(RegistryTest, Register_KeepsRegistrationOrder) {
    Registry registry;
    registry.register_plugin(describe<NullProcessing>("first", 5));
    registry.register_plugin(describe<NullProcessing>("second", 1));
    registry.register_plugin(describe<NullReport>("report"));

    const auto& processing = registry.list(Group::Processing);
    ASSERT_EQ(processing.size(), 2u);
    EXPECT_EQ(processing[0].name, "first");
    EXPECT_EQ(processing[1].name, "second");
    EXPECT_EQ(registry.list(Group::Reporting).size(), 1u);
    EXPECT_EQ(registry.list().size(), 2u);
    EXPECT_EQ(registry.size(), 3u);
}

TEST(RegistryTest, Register_DuplicatesAllowed) {
    Registry registry;
    registry.register_plugin(describe<NullSignature>("null"));
    registry.register_plugin(describe<NullSignature>("null"));
    EXPECT_EQ(registry.list(Group::Signatures).size(), 2u);
}

TEST(RegistryTest, Registries_AreIndependent) {
    Registry a;
    Registry b;
    a.register_plugin(describe<NullProcessing>("null"));
    EXPECT_EQ(a.size(), 1u);
    EXPECT_EQ(b.size(), 0u);
}

// ==============================================================================
// TST-REGISTRY-003: встроенные плагины
// ==============================================================================

TEST(RegistryTest, Builtin_RegistersAllGroups) {
    Registry registry;
    register_builtin_plugins(registry);

    const auto& processing = registry.list(Group::Processing);
    ASSERT_EQ(processing.size(), 2u);
    EXPECT_EQ(processing[0].name, "target");
    EXPECT_EQ(processing[0].order, 0);
    EXPECT_EQ(processing[1].name, "behavior");
    EXPECT_EQ(processing[1].order, 1);

    const auto& signatures = registry.list(Group::Signatures);
    ASSERT_EQ(signatures.size(), 4u);
    for (const auto& d : signatures) {
        EXPECT_EQ(d.minimum.value_or(""), "2.0") << d.name;
        auto plugin = d.instantiate();
        auto* sig = dynamic_cast<Signature*>(plugin.get());
        ASSERT_NE(sig, nullptr);
        EXPECT_EQ(sig->name(), d.name);
    }

    ASSERT_EQ(registry.list(Group::Reporting).size(), 1u);
    EXPECT_EQ(registry.list(Group::Reporting)[0].name, "console");
    EXPECT_TRUE(registry.list(Group::Auxiliary).empty());
}

TEST(RegistryTest, Machinery_ExposesMachines) {
    NullMachinery machinery;
    machinery.initialize(config::Options());
    ASSERT_EQ(machinery.machines().size(), 1u);
    EXPECT_EQ(machinery.machines()[0].label, "cuckoo1");
}

}  // namespace sandpipe::test
