// ==============================================================================
// sandpipe/cli.hpp - MOD-0002: CLI парсинг и команды
// ==============================================================================
//
// MOD-0002 cli
// ADR-0006: собственный слой CLI
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диспетчеризация подкоманд
// - Диагностические ошибки CLI
//
// ==============================================================================

#ifndef SANDPIPE_CLI_HPP
#define SANDPIPE_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sandpipe::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// process - полный конвейер анализа одной задачи
struct ProcessCommand {
    std::int64_t task_id = 0;                         // <TASK_ID>
    std::filesystem::path root = ".";                 // --root
    std::optional<std::filesystem::path> config_dir;  // --config (по умолчанию <root>/conf)
    std::optional<std::filesystem::path> behavior;    // --behavior
    std::optional<std::string> target;                // --target
    std::string category = "file";                    // --category
    bool json = false;                                // -j, --json
};

/// list - зарегистрированные плагины по группам
struct ListCommand {};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<ProcessCommand, ListCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv);

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// Сообщение об ошибке разбора с подсказкой
std::string render_usage_error(const std::string& error_msg);

constexpr const char* ABOUT = "Process sandbox analyses and correlate behavioural signatures";

}  // namespace sandpipe::cli

#endif  // SANDPIPE_CLI_HPP
