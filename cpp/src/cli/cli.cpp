// ==============================================================================
// cli.cpp - MOD-0002: CLI парсинг
// ==============================================================================
//
// MOD-0002 cli
// ADR-0006: собственный слой CLI
//
// ==============================================================================

#include <sandpipe/cli.hpp>

#include <sandpipe/platform.hpp>
#include <sandpipe/version.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace sandpipe::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

/// Строгий разбор неотрицательного идентификатора задачи
std::optional<std::int64_t> parse_task_id(const char* s) {
    if (s == nullptr || *s == '\0') {
        return std::nullopt;
    }
    for (const char* p = s; *p != '\0'; ++p) {
        if (*p < '0' || *p > '9') {
            return std::nullopt;
        }
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s, &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

ParseResult usage_error(ParseResult result, const std::string& message) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message);
    return result;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("sandpipe ") + version::APP_VERSION + " (engine " +
           version::ENGINE_VERSION + ")\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: sandpipe [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  process  Run processing, signatures and reporting for an analysis\n"
               "  list     List registered plugins by group\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -v...            Print verbose output\n"
               "  -q               Suppress informational output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Process analysis #42 stored under /opt/sandbox:\n"
               "        ./sandpipe process 42 --root /opt/sandbox\n"
               "\n"
               "    Correlate a standalone behaviour log and print JSON results:\n"
               "        ./sandpipe process 1 --behavior behavior.json --json\n";
    } else if (*command == "process") {
        return "Run processing, signatures and reporting for an analysis\n"
               "\n"
               "Usage: sandpipe process [OPTIONS] <TASK_ID>\n"
               "\n"
               "Arguments:\n"
               "  <TASK_ID>  Identifier of the analysis task\n"
               "\n"
               "Options:\n"
               "      --root <ROOT>          Installation root holding storage/analyses "
               "(default: .)\n"
               "      --config <CONFIG>      Directory with processing.yaml, reporting.yaml "
               "(default: <ROOT>/conf)\n"
               "      --behavior <BEHAVIOR>  Behaviour log to use instead of logs/behavior.json\n"
               "      --target <TARGET>      Analysed file path or URL\n"
               "      --category <CATEGORY>  Task category: file or url (default: file)\n"
               "  -j, --json                 Print the final results as JSON\n"
               "  -h, --help                 Print help\n";
    } else if (*command == "list") {
        return "List registered plugins by group\n"
               "\n"
               "Usage: sandpipe list\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n"
                       "Usage: sandpipe [OPTIONS] <COMMAND>\n\n"
                       "For more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            return usage_error(std::move(result),
                               std::string("error: unexpected argument '") + arg + "' found");
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "process")) {
        ProcessCommand process_cmd;
        bool have_id = false;

        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];

            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"process"};
                return result;
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                process_cmd.json = true;
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (str_eq(arg, "-v")) {
                result.global.verbose++;
            } else if (str_eq(arg, "--root") || str_eq(arg, "--config") ||
                       str_eq(arg, "--behavior") || str_eq(arg, "--target") ||
                       str_eq(arg, "--category")) {
                // Опции со значением
                const char* v = i + 1 < argc ? argv[++i] : nullptr;
                if (v == nullptr) {
                    return usage_error(std::move(result),
                                       std::string("error: a value is required for '") + arg +
                                           "' but none was supplied");
                }
                if (str_eq(arg, "--root")) {
                    process_cmd.root = platform::path_from_utf8(v);
                } else if (str_eq(arg, "--config")) {
                    process_cmd.config_dir = platform::path_from_utf8(v);
                } else if (str_eq(arg, "--behavior")) {
                    process_cmd.behavior = platform::path_from_utf8(v);
                } else if (str_eq(arg, "--target")) {
                    process_cmd.target = v;
                } else {
                    process_cmd.category = v;
                }
            } else if (arg[0] != '-') {
                if (have_id) {
                    return usage_error(std::move(result),
                                       std::string("error: unexpected argument '") + arg +
                                           "' found");
                }
                auto id = parse_task_id(arg);
                if (!id) {
                    return usage_error(std::move(result),
                                       std::string("error: invalid value '") + arg +
                                           "' for '<TASK_ID>': expected a non-negative integer");
                }
                process_cmd.task_id = *id;
                have_id = true;
            } else {
                return usage_error(std::move(result),
                                   std::string("error: unexpected argument '") + arg + "' found");
            }
        }

        if (!have_id) {
            return usage_error(std::move(result),
                               "error: the following required arguments were not provided:\n"
                               "  <TASK_ID>");
        }

        result.ok = true;
        result.command = process_cmd;
    } else if (str_eq(cmd, "list")) {
        for (int i = cmd_idx + 1; i < argc; ++i) {
            if (str_eq(argv[i], "-h") || str_eq(argv[i], "--help")) {
                result.ok = true;
                result.command = HelpCommand{"list"};
                return result;
            }
        }
        result.ok = true;
        result.command = ListCommand{};
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{argv[cmd_idx + 1]};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        return usage_error(std::move(result),
                           std::string("error: unrecognized subcommand '") + cmd + "'");
    }

    return result;
}

}  // namespace sandpipe::cli
