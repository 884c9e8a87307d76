// ==============================================================================
// test_pipeline_gtest.cpp - Тесты полного конвейера анализа (GoogleTest)
// ==============================================================================
//
// MOD-0016: pipeline
// ADR-0008: GoogleTest
//
// ==============================================================================

#include <sandpipe/pipeline.hpp>
#include <sandpipe/registry.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#ifdef _WIN32
#include <process.h>
#define getpid _getpid
#else
#include <unistd.h>
#endif

namespace sandpipe::pipeline::test {

namespace fs = std::filesystem;
using output::Level;

namespace {

output::OutputConfig history_config() {
    output::OutputConfig config;
    config.silent = true;
    config.keep_history = true;
    return config;
}

const char* const BEHAVIOR = R"({
    "processes": [
        {"pid": 100, "process_name": "malware.exe", "calls": [
            {"api": "CreateFileW", "category": "filesystem",
             "arguments": {"filepath": "C:\\Users\\a\\AppData\\svchost.exe"}},
            {"api": "RegSetValueExA", "category": "registry",
             "arguments": {"regkey": "HKEY_CURRENT_USER\\Software\\Microsoft\\Windows\\CurrentVersion\\Run\\svchost"}}
        ]}
    ]
})";

/// Ловит итоговую карту результатов на этапе reporting
class CaptureReport : public Report {
public:
    explicit CaptureReport(std::vector<std::string>* keys) : keys_(keys) {}
    void run(ResultsMap& results) override { *keys_ = results.keys(); }

private:
    std::vector<std::string>* keys_;
};

/// Совпадает на любом вызове
class AnyCall : public Signature {
public:
    explicit AnyCall(std::string name) : Signature(std::move(name), 1) {}
    bool on_call(const Call&, const Process&) override { return true; }
};

PluginDescriptor any_call(const std::string& name, const std::string& minimum) {
    PluginDescriptor d;
    d.group = Group::Signatures;
    d.name = name;
    d.minimum = minimum;
    d.factory = [name] { return std::make_unique<AnyCall>(name); };
    return d;
}

}  // namespace

class PipelineTestFixture : public ::testing::Test {
protected:
    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() / (std::string("sandpipe_pipeline_") +
                                             test_info->name() + "_" + std::to_string(getpid()));
        std::error_code ec;
        fs::remove_all(root_, ec);
        fs::create_directories(analysis_path(root_, task_.id) / "logs");

        options_.runner.root = root_;

        task_.target = "/tmp/sample.exe";
        configs_.processing =
            config::Config::parse("target:\n  enabled: yes\nbehavior:\n  enabled: yes\n").config;
        configs_.reporting = config::Config::parse("capture:\n  enabled: yes\n").config;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write_behavior(const std::string& content) {
        std::ofstream file(analysis_path(root_, task_.id) / "logs" / "behavior.json");
        file << content;
    }

    void register_capture(Registry& registry) {
        PluginDescriptor capture;
        capture.group = Group::Reporting;
        capture.name = "capture";
        capture.factory = [this] { return std::make_unique<CaptureReport>(&reported_keys_); };
        registry.register_plugin(capture);
    }

    fs::path root_;
    Task task_{5};
    config::StageConfigs configs_;
    AnalysisOptions options_;
    std::vector<std::string> reported_keys_;
};

// ==============================================================================
// TST-PIPELINE-001: сквозной прогон
// ==============================================================================

TEST_F(PipelineTestFixture, RunAnalysis_EndToEnd) {
    write_behavior(BEHAVIOR);

    Registry registry;
    register_builtin_plugins(registry);
    register_capture(registry);

    output::Writer writer(history_config());
    AnalysisSummary summary;
    ResultsMap results = run_analysis(task_, registry, configs_, writer, options_, &summary);

    std::vector<std::string> keys = {"target", "behavior", "signatures"};
    EXPECT_EQ(results.keys(), keys);
    EXPECT_EQ(reported_keys_, keys);

    std::vector<std::string> names;
    for (const auto& detection : results.get("signatures")->as_array()) {
        names.push_back(detection.get_string_or("name"));
    }
    std::vector<std::string> expected = {"creates_executable", "autorun_persistence",
                                         "multiple_indicators"};
    EXPECT_EQ(names, expected);

    EXPECT_EQ(summary.signatures.matched, 3u);
    EXPECT_EQ(summary.processing.size(), 2u);
    EXPECT_FALSE(summary.cancelled);
    EXPECT_TRUE(writer.contains(Level::Info, "Processing task #5"));
    EXPECT_TRUE(writer.contains(Level::Info, "Task #5: analysis complete"));
    EXPECT_EQ(writer.count(Level::Error), 0u);
}

TEST_F(PipelineTestFixture, RunAnalysis_NoBehaviorLog) {
    Registry registry;
    register_builtin_plugins(registry);

    output::Writer writer(history_config());
    ResultsMap results = run_analysis(task_, registry, configs_, writer, options_);

    EXPECT_TRUE(results.has("target"));
    EXPECT_FALSE(results.has("behavior"));
    ASSERT_TRUE(results.has("signatures"));
    EXPECT_EQ(results.get("signatures")->size(), 0u);
}

TEST_F(PipelineTestFixture, RunAnalysis_MalformedBehaviorIsolated) {
    write_behavior("{not json");

    Registry registry;
    register_builtin_plugins(registry);

    output::Writer writer(history_config());
    AnalysisSummary summary;
    ResultsMap results = run_analysis(task_, registry, configs_, writer, options_, &summary);

    EXPECT_TRUE(results.has("target"));
    EXPECT_FALSE(results.has("behavior"));
    EXPECT_TRUE(writer.contains(Level::Warn, "behavior"));
    EXPECT_TRUE(writer.contains(Level::Info, "analysis complete"));
}

TEST_F(PipelineTestFixture, RunAnalysis_StagesCanBeSkipped) {
    write_behavior(BEHAVIOR);

    Registry registry;
    register_builtin_plugins(registry);
    register_capture(registry);

    options_.run_signatures = false;
    options_.run_reporting = false;

    output::Writer writer(history_config());
    ResultsMap results = run_analysis(task_, registry, configs_, writer, options_);

    EXPECT_FALSE(results.has("signatures"));
    EXPECT_TRUE(reported_keys_.empty());
}

TEST_F(PipelineTestFixture, RunAnalysis_CancelledBeforeStart) {
    write_behavior(BEHAVIOR);

    Registry registry;
    register_builtin_plugins(registry);

    CancelToken token;
    token.cancel();
    options_.runner.cancel = &token;

    output::Writer writer(history_config());
    AnalysisSummary summary;
    ResultsMap results = run_analysis(task_, registry, configs_, writer, options_, &summary);

    EXPECT_TRUE(results.empty());
    EXPECT_TRUE(summary.cancelled);
    EXPECT_TRUE(writer.contains(Level::Warn, "was cancelled"));
}

TEST_F(PipelineTestFixture, RunAnalysis_OldStyleSignatureDropped) {
    write_behavior(BEHAVIOR);

    Registry registry;
    register_builtin_plugins(registry);
    registry.register_plugin(any_call("legacy_rule", "1.0"));
    registry.register_plugin(any_call("current_rule", "2.0"));

    output::Writer writer(history_config());
    AnalysisSummary summary;
    ResultsMap results = run_analysis(task_, registry, configs_, writer, options_, &summary);

    std::vector<std::string> names;
    for (const auto& detection : results.get("signatures")->as_array()) {
        names.push_back(detection.get_string_or("name"));
    }
    EXPECT_EQ(std::count(names.begin(), names.end(), "legacy_rule"), 0);
    EXPECT_EQ(std::count(names.begin(), names.end(), "current_rule"), 1);
    EXPECT_EQ(summary.signatures.dropped, 1u);
    EXPECT_TRUE(writer.contains(Level::Warn,
                                "Signature style has been redesigned in 1.2. This signature is "
                                "not compatible: legacy_rule"));
}

TEST_F(PipelineTestFixture, RunAnalysis_EmptyRegistry) {
    Registry registry;
    output::Writer writer(history_config());

    ResultsMap results = run_analysis(task_, registry, configs_, writer, options_);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.get("signatures")->size(), 0u);
    EXPECT_TRUE(writer.contains(Level::Info, "No processing modules loaded"));
    EXPECT_TRUE(writer.contains(Level::Info, "No reporting modules loaded"));
    EXPECT_EQ(writer.count(Level::Error), 0u);
}

}  // namespace sandpipe::pipeline::test
