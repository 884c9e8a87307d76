// ==============================================================================
// test_processing_gtest.cpp - Тесты этапа processing (GoogleTest)
// ==============================================================================
//
// MOD-0009: runner
// MOD-0010: processing
// ADR-0008: GoogleTest
//
// ==============================================================================

#include <sandpipe/errors.hpp>
#include <sandpipe/processing.hpp>

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

/// Возвращает заданные данные и записывает своё имя в журнал вызовов
class FixedModule : public Processing {
public:
    FixedModule(std::string key, Value data, CallLog log)
        : Processing(std::move(key)), data_(std::move(data)), log_(std::move(log)) {}

    Value run() override {
        log_->push_back(key());
        return data_;
    }

private:
    Value data_;
    CallLog log_;
};

/// Бросает исключение заданного типа
template <typename E>
class FailingModule : public Processing {
public:
    explicit FailingModule(std::string key) : Processing(std::move(key)) {}
    Value run() override { throw E("boom"); }
};

/// Читает ключ предыдущего модуля
class ReaderModule : public Processing {
public:
    explicit ReaderModule(std::string source) : Processing("copy"), source_(std::move(source)) {}

    Value run() override {
        const Value* v = results() != nullptr ? results()->get(source_) : nullptr;
        return v != nullptr ? *v : Value();
    }

private:
    std::string source_;
};

/// Возвращает путь анализа, переданный раннером
class PathModule : public Processing {
public:
    PathModule() : Processing("path") {}
    Value run() override { return Value(analysis_path().generic_string()); }
};

/// Запрашивает отмену во время работы
class CancellingModule : public Processing {
public:
    explicit CancellingModule(CancelToken* token) : Processing("cancel"), token_(token) {}
    Value run() override {
        token_->cancel();
        return Value("done");
    }

private:
    CancelToken* token_;
};

class NotProcessing : public Report {
public:
    void run(ResultsMap& /*results*/) override {}
};

PluginDescriptor fixed(const std::string& name, int order, Value data, CallLog log) {
    PluginDescriptor d;
    d.group = Group::Processing;
    d.name = name;
    d.order = order;
    d.factory = [name, data, log] { return std::make_unique<FixedModule>(name, data, log); };
    return d;
}

template <typename M, typename... Args>
PluginDescriptor custom(const std::string& name, Args... args) {
    PluginDescriptor d;
    d.group = Group::Processing;
    d.name = name;
    d.factory = [args...] { return std::make_unique<M>(args...); };
    return d;
}

config::Config enabled(const std::vector<std::string>& names) {
    std::string yaml;
    for (const auto& name : names) {
        yaml += name + ":\n  enabled: yes\n";
    }
    return config::Config::parse(yaml).config;
}

Task make_task(std::int64_t id = 7) {
    Task task;
    task.id = id;
    return task;
}

}  // namespace

// ==============================================================================
// TST-PROCESSING-001: порядок выполнения
// ==============================================================================

TEST(ProcessingTest, Run_OrderAscendingStableTies) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(fixed("a", 3, Value("a"), log));
    registry.register_plugin(fixed("b", 1, Value("b"), log));
    registry.register_plugin(fixed("c", 2, Value("c"), log));
    registry.register_plugin(fixed("d", 1, Value("d"), log));

    auto cfg = enabled({"a", "b", "c", "d"});
    output::Writer writer(history_config());
    RunProcessing processing(make_task(), registry, cfg, writer);
    ResultsMap results = processing.run();

    std::vector<std::string> expected = {"b", "d", "c", "a"};
    EXPECT_EQ(*log, expected);
    EXPECT_EQ(results.keys(), expected);

    // Реестр не переупорядочен
    EXPECT_EQ(registry.list(Group::Processing)[0].name, "a");
}

TEST(ProcessingTest, Run_LaterModuleReadsEarlierOutput) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(custom<ReaderModule>("copy", std::string("first")));
    registry.register_plugin(fixed("first", 0, Value("payload"), log));

    auto cfg = enabled({"copy", "first"});
    output::Writer writer(history_config());
    ResultsMap results = RunProcessing(make_task(), registry, cfg, writer).run();

    ASSERT_TRUE(results.has("copy"));
    EXPECT_EQ(results.get("copy")->as_string(), "payload");
}

TEST(ProcessingTest, Run_InjectsAnalysisPath) {
    Registry registry;
    registry.register_plugin(custom<PathModule>("path"));

    auto cfg = enabled({"path"});
    output::Writer writer(history_config());
    RunnerOptions options;
    options.root = "/opt/sandbox";
    ResultsMap results = RunProcessing(make_task(42), registry, cfg, writer, options).run();

    ASSERT_TRUE(results.has("path"));
    EXPECT_EQ(results.get("path")->as_string(), "/opt/sandbox/storage/analyses/42");
}

// ==============================================================================
// TST-PROCESSING-002: изоляция сбоев
// ==============================================================================

TEST(ProcessingTest, Run_UnexpectedFailureIsIsolated) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(fixed("before", 1, Value("x"), log));
    registry.register_plugin(custom<FailingModule<std::runtime_error>>("broken", std::string("broken")));
    registry.register_plugin(fixed("after", 1, Value("y"), log));

    auto cfg = enabled({"before", "broken", "after"});
    output::Writer writer(history_config());
    RunProcessing processing(make_task(13), registry, cfg, writer);
    ResultsMap results = processing.run();

    EXPECT_TRUE(results.has("before"));
    EXPECT_TRUE(results.has("after"));
    EXPECT_FALSE(results.has("broken"));

    EXPECT_TRUE(writer.contains(Level::Error, "broken"));
    EXPECT_TRUE(writer.contains(Level::Error, "#13"));
    ASSERT_EQ(processing.outcomes().size(), 3u);
    EXPECT_EQ(processing.outcomes()[1].outcome, Outcome::UnexpectedFailure);
}

TEST(ProcessingTest, Run_DeclaredFailuresAreWarnings) {
    Registry registry;
    registry.register_plugin(custom<FailingModule<DependencyError>>("deps", std::string("deps")));
    registry.register_plugin(custom<FailingModule<ProcessingError>>("proc", std::string("proc")));

    auto cfg = enabled({"deps", "proc"});
    output::Writer writer(history_config());
    RunProcessing processing(make_task(), registry, cfg, writer);
    ResultsMap results = processing.run();

    EXPECT_TRUE(results.empty());
    EXPECT_EQ(writer.count(Level::Error), 0u);
    EXPECT_TRUE(writer.contains(Level::Warn, "missing dependencies"));
    EXPECT_TRUE(writer.contains(Level::Warn, "returned the following error"));
    EXPECT_EQ(processing.outcomes()[0].outcome, Outcome::DependencyMissing);
    EXPECT_EQ(processing.outcomes()[1].outcome, Outcome::ModuleFailure);
}

TEST(ProcessingTest, Run_FactoryFailureIsLoadFailure) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    PluginDescriptor broken;
    broken.group = Group::Processing;
    broken.name = "broken";
    broken.factory = []() -> std::unique_ptr<Plugin> { throw std::runtime_error("no memory"); };
    registry.register_plugin(broken);
    registry.register_plugin(fixed("ok", 2, Value("x"), log));

    auto cfg = enabled({"broken", "ok"});
    output::Writer writer(history_config());
    RunProcessing processing(make_task(), registry, cfg, writer);
    ResultsMap results = processing.run();

    EXPECT_TRUE(results.has("ok"));
    EXPECT_EQ(processing.outcomes()[0].outcome, Outcome::LoadFailure);
    EXPECT_TRUE(writer.contains(Level::Error, "Unable to instantiate"));
}

TEST(ProcessingTest, Run_FactoryThrowingNonExceptionIsLoadFailure) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    PluginDescriptor odd;
    odd.group = Group::Processing;
    odd.name = "odd";
    odd.factory = []() -> std::unique_ptr<Plugin> { throw 42; };
    registry.register_plugin(odd);
    registry.register_plugin(fixed("ok", 2, Value("x"), log));

    auto cfg = enabled({"odd", "ok"});
    output::Writer writer(history_config());
    RunProcessing processing(make_task(), registry, cfg, writer);
    ResultsMap results;
    ASSERT_NO_THROW(results = processing.run());

    EXPECT_TRUE(results.has("ok"));
    ASSERT_EQ(processing.outcomes().size(), 2u);
    EXPECT_EQ(processing.outcomes()[0].outcome, Outcome::LoadFailure);
    EXPECT_EQ(processing.outcomes()[0].message, "unknown exception");
    EXPECT_EQ(processing.outcomes()[1].outcome, Outcome::Success);
    EXPECT_TRUE(
        writer.contains(Level::Error, "Unable to instantiate the processing module \"odd\""));
}

TEST(ProcessingTest, Run_WrongPluginKindIsLoadFailure) {
    Registry registry;
    PluginDescriptor d;
    d.group = Group::Processing;
    d.name = "report";
    d.factory = [] { return std::make_unique<NotProcessing>(); };
    registry.register_plugin(d);

    auto cfg = enabled({"report"});
    output::Writer writer(history_config());
    RunProcessing processing(make_task(), registry, cfg, writer);
    processing.run();

    ASSERT_EQ(processing.outcomes().size(), 1u);
    EXPECT_EQ(processing.outcomes()[0].outcome, Outcome::LoadFailure);
    EXPECT_TRUE(writer.contains(Level::Error, "report"));
}

// ==============================================================================
// TST-PROCESSING-003: пропуск модулей
// ==============================================================================

TEST(ProcessingTest, Run_UnconfiguredModuleOnlyDebug) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(fixed("orphan", 1, Value("x"), log));

    config::Config cfg;
    output::Writer writer(history_config());
    RunProcessing processing(make_task(), registry, cfg, writer);
    ResultsMap results = processing.run();

    EXPECT_TRUE(results.empty());
    EXPECT_TRUE(log->empty());
    EXPECT_TRUE(writer.contains(Level::Debug, "orphan"));
    EXPECT_EQ(writer.count(Level::Warn), 0u);
    EXPECT_EQ(writer.count(Level::Error), 0u);
    EXPECT_EQ(processing.outcomes()[0].outcome, Outcome::NotConfigured);
}

TEST(ProcessingTest, Run_DisabledModuleSkipped) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(fixed("off", 1, Value("x"), log));

    auto cfg = config::Config::parse("off:\n  enabled: no\n").config;
    output::Writer writer(history_config());
    RunProcessing processing(make_task(), registry, cfg, writer);
    ResultsMap results = processing.run();

    EXPECT_TRUE(results.empty());
    EXPECT_TRUE(log->empty());
    EXPECT_EQ(writer.count(Level::Warn), 0u);
    EXPECT_EQ(processing.outcomes()[0].outcome, Outcome::Disabled);
}

TEST(ProcessingTest, Run_MisconfiguredModuleWarns) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(fixed("odd", 1, Value("x"), log));

    auto cfg = config::Config::parse("odd:\n  enabled: perhaps\n").config;
    output::Writer writer(history_config());
    RunProcessing processing(make_task(), registry, cfg, writer);
    processing.run();

    EXPECT_TRUE(log->empty());
    EXPECT_TRUE(writer.contains(Level::Warn, "misconfigured"));
    EXPECT_EQ(processing.outcomes()[0].outcome, Outcome::Misconfigured);
}

TEST(ProcessingTest, Run_EmptyRegistryLogsInfo) {
    Registry registry;
    config::Config cfg;
    output::Writer writer(history_config());

    ResultsMap results = RunProcessing(make_task(), registry, cfg, writer).run();

    EXPECT_TRUE(results.empty());
    EXPECT_TRUE(writer.contains(Level::Info, "No processing modules loaded"));
}

// ==============================================================================
// TST-PROCESSING-004: слияние данных
// ==============================================================================

TEST(ProcessingTest, Merge_FalsyDataAndEmptyKeyDropped) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;
    registry.register_plugin(fixed("nothing", 1, Value(), log));
    registry.register_plugin(fixed("empty_list", 1, Value::make_array(), log));
    registry.register_plugin(fixed("zero", 1, Value(0), log));
    PluginDescriptor nokey = fixed("nokey", 1, Value("orphan data"), log);
    nokey.factory = [log] { return std::make_unique<FixedModule>("", Value("orphan data"), log); };
    registry.register_plugin(nokey);
    registry.register_plugin(fixed("real", 1, Value(1), log));

    auto cfg = config::Config::parse("nothing: {enabled: yes}\n"
                                     "empty_list: {enabled: yes}\n"
                                     "zero: {enabled: yes}\n"
                                     "nokey: {enabled: yes}\n"
                                     "real: {enabled: yes}\n")
                   .config;
    output::Writer writer(history_config());
    ResultsMap results = RunProcessing(make_task(), registry, cfg, writer).run();

    EXPECT_EQ(log->size(), 5u);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results.has("real"));
}

TEST(ProcessingTest, Merge_DuplicateKeyLaterWinsWithWarning) {
    auto log = std::make_shared<std::vector<std::string>>();
    Registry registry;

    PluginDescriptor first = fixed("first", 1, Value("old"), log);
    first.factory = [log] { return std::make_unique<FixedModule>("shared", Value("old"), log); };
    PluginDescriptor second = fixed("second", 2, Value("new"), log);
    second.factory = [log] { return std::make_unique<FixedModule>("shared", Value("new"), log); };
    registry.register_plugin(first);
    registry.register_plugin(second);

    auto cfg = enabled({"first", "second"});
    output::Writer writer(history_config());
    ResultsMap results = RunProcessing(make_task(), registry, cfg, writer).run();

    ASSERT_TRUE(results.has("shared"));
    EXPECT_EQ(results.get("shared")->as_string(), "new");
    EXPECT_TRUE(writer.contains(Level::Warn, "overwrites"));
}

// ==============================================================================
// TST-PROCESSING-005: отмена
// ==============================================================================

TEST(ProcessingTest, Cancel_StopsBetweenModules) {
    auto log = std::make_shared<std::vector<std::string>>();
    CancelToken token;
    Registry registry;
    registry.register_plugin(custom<CancellingModule>("cancel", &token));
    registry.register_plugin(fixed("later", 2, Value("x"), log));

    auto cfg = enabled({"cancel", "later"});
    output::Writer writer(history_config());
    RunnerOptions options;
    options.cancel = &token;
    RunProcessing processing(make_task(), registry, cfg, writer, options);
    ResultsMap results = processing.run();

    EXPECT_TRUE(results.has("cancel"));
    EXPECT_FALSE(results.has("later"));
    EXPECT_TRUE(log->empty());
    ASSERT_EQ(processing.outcomes().size(), 2u);
    EXPECT_EQ(processing.outcomes()[1].outcome, Outcome::Cancelled);
}

}  // namespace sandpipe::pipeline::test
