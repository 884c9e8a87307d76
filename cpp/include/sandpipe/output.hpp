// ==============================================================================
// sandpipe/output.hpp - MOD-0003: Журнал и пользовательский вывод
// ==============================================================================
//
// MOD-0003 output
// ADR-0006: собственный слой вывода
// ADR-0003: RapidJSON для JSON сериализации
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Уровни журнала: trace / debug / info / warn / error
// - Цветные префиксы на TTY
// - История сообщений в памяти (для тестов и сводок прогона)
//
// Все этапы конвейера получают Writer по ссылке; глобального логгера нет.
//
// ==============================================================================

#ifndef SANDPIPE_OUTPUT_HPP
#define SANDPIPE_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandpipe::output {

enum class Stream { Stdout, Stderr };

/// Уровень сообщения журнала
enum class Level { Trace, Debug, Info, Warn, Error };

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

struct OutputConfig {
    bool quiet = false;      // -q: подавить info/warn
    int verbose = 0;         // -v: 1 = debug, 2+ = trace
    bool no_banner = false;  // --no-banner
    bool silent = false;     // ничего не писать в потоки (только история)
    bool keep_history = false;

    std::optional<std::filesystem::path> output_path;
};

/// Запись истории журнала
struct Record {
    Level level;
    std::string message;
};

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    // Журнал
    // -------------------------------------------------------------------------

    /// "[+] <message>", подавляется при quiet
    void info(std::string_view message);

    /// "[!] <message>", подавляется при quiet
    void warn(std::string_view message);
    void warning(std::string_view message) { warn(message); }

    /// "[x] <message>", печатается всегда
    void error(std::string_view message);

    /// "[*] <message>", только при verbose > 0
    void debug(std::string_view message);

    /// "[~] <message>", только при verbose > 1
    void trace(std::string_view message);

    void log(Level level, std::string_view message);

    /// История (пустая если keep_history == false). Пишется независимо от
    /// quiet/verbose: фильтруется только вывод в поток.
    const std::vector<Record>& history() const { return history_; }

    /// Сколько записей истории имеют данный уровень
    std::size_t count(Level level) const;

    /// Есть ли запись данного уровня, содержащая подстроку
    bool contains(Level level, std::string_view needle) const;

    void clear_history() { history_.clear(); }

    // Цветной вывод
    // -------------------------------------------------------------------------

    void yellow_line(std::string_view message);
    void red_line(std::string_view message);

    void flush();

    const OutputConfig& config() const { return config_; }

    bool open_output_file();
    void close_output_file();
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_prefixed(Level level, std::string_view message);
    void write_colored(Stream s, std::string_view message, Color color);
    FILE* get_file(Stream s) const;
    bool enabled(Level level) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
    std::vector<Record> history_;
};

const char* to_string(Level level);

std::string ansi_color_code(Color color);

bool supports_color(Stream s);

}  // namespace sandpipe::output

#endif  // SANDPIPE_OUTPUT_HPP
