// ==============================================================================
// main.cpp - MOD-0001: Точка входа приложения
// ==============================================================================
//
// MOD-0001 app
// GUIDE-0001 G-024: перехват исключений на границе app
//
// Точка входа:
// 1. Парсинг argv через MOD-0002 cli
// 2. Создание Writer (MOD-0003 output)
// 3. Регистрация встроенных плагинов (MOD-0017 builtin)
// 4. Dispatch команды
// 5. Возврат exit code
//
// ==============================================================================

#include <sandpipe/cli.hpp>
#include <sandpipe/config.hpp>
#include <sandpipe/output.hpp>
#include <sandpipe/pipeline.hpp>
#include <sandpipe/platform.hpp>
#include <sandpipe/registry.hpp>

#include <exception>
#include <iostream>
#include <system_error>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
   ___  ___ _ __   __| |_ __ (_)_ __   ___
  / __|/ _` | '_ \ / _` | '_ \| | '_ \ / _ \
  \__ \ (_| | | | | (_| | |_) | | |_) |  __/
  |___/\__,_|_| |_|\__,_| .__/|_| .__/ \___|
                        |_|     |_|
)";

void print_banner(sandpipe::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(sandpipe::output::Stream::Stderr, BANNER);
    writer.write_line(sandpipe::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Конфигурация по умолчанию: все встроенные модули включены
// ----------------------------------------------------------------------------

constexpr const char* DEFAULT_PROCESSING = "target:\n"
                                           "  enabled: yes\n"
                                           "behavior:\n"
                                           "  enabled: yes\n";

constexpr const char* DEFAULT_REPORTING = "console:\n"
                                          "  enabled: yes\n";

bool load_configs(const std::filesystem::path& dir, sandpipe::config::StageConfigs& configs,
                  sandpipe::output::Writer& writer) {
    using namespace sandpipe;

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        writer.warn("Configuration directory " + platform::path_to_utf8(dir) +
                    " not found, using built-in defaults");
        configs.processing = config::Config::parse(DEFAULT_PROCESSING).config;
        configs.reporting = config::Config::parse(DEFAULT_REPORTING).config;
        return true;
    }

    auto loaded = config::load_stage_configs(dir);
    if (!loaded.ok) {
        writer.error(loaded.error);
        return false;
    }
    configs = std::move(loaded.configs);
    return true;
}

// ----------------------------------------------------------------------------
// process
// ----------------------------------------------------------------------------

int run_process(const sandpipe::cli::ProcessCommand& cmd, sandpipe::output::Writer& writer) {
    using namespace sandpipe;

    config::StageConfigs configs;
    const auto config_dir = cmd.config_dir.value_or(cmd.root / "conf");
    if (!load_configs(config_dir, configs, writer)) {
        return 1;
    }

    // --behavior: явный путь к логу и включённый модуль behavior
    if (cmd.behavior.has_value()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(*cmd.behavior, ec)) {
            writer.error("Behaviour log not found: " + platform::path_to_utf8(*cmd.behavior));
            return 1;
        }
        config::Options behavior = configs.processing.find("behavior").value_or(
            config::Options("behavior", YAML::Node(YAML::NodeType::Map)));
        behavior.set_bool("enabled", true);
        behavior.set_string("path",
                            platform::path_to_utf8(std::filesystem::absolute(*cmd.behavior, ec)));
        configs.processing.set(std::move(behavior));
    }

    Task task;
    task.id = cmd.task_id;
    task.category = cmd.category;
    task.target = cmd.target.value_or("");

    Registry registry;
    register_builtin_plugins(registry, &writer);

    pipeline::AnalysisOptions options;
    options.runner.root = cmd.root;

    pipeline::AnalysisSummary summary;
    ResultsMap results = pipeline::run_analysis(task, registry, configs, writer, options, &summary);

    writer.debug("Signatures: " + std::to_string(summary.signatures.loaded) + " loaded, " +
                 std::to_string(summary.signatures.active) + " active, " +
                 std::to_string(summary.signatures.matched) + " matched, " +
                 std::to_string(summary.signatures.handler_failures) + " handler failures");

    if (cmd.json) {
        writer.write_line(output::Stream::Stdout, results.dump_json(true));
    }
    return 0;
}

// ----------------------------------------------------------------------------
// list
// ----------------------------------------------------------------------------

int run_list(sandpipe::output::Writer& writer) {
    using namespace sandpipe;

    Registry registry;
    register_builtin_plugins(registry, &writer);

    const std::string prefix = platform::list_prefix();
    for (Group group : all_groups()) {
        const auto& descriptors = registry.list(group);
        writer.write_line(output::Stream::Stdout, std::string(to_string(group)) + ":");
        if (descriptors.empty()) {
            writer.write_line(output::Stream::Stdout, "  (none)");
            continue;
        }
        for (const auto& d : descriptors) {
            std::string line = "  " + prefix + " " + d.name + " (order " + std::to_string(d.order);
            if (d.minimum) {
                line += ", minimum " + *d.minimum;
            }
            if (d.maximum) {
                line += ", maximum " + *d.maximum;
            }
            line += ")";
            writer.write_line(output::Stream::Stdout, line);
        }
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace sandpipe;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга идут в stderr без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ProcessCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_process(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::ListCommand>) {
                return run_list(writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // GUIDE-0001 G-024: перехват исключений на границе app
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
