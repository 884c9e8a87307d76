// ==============================================================================
// output.cpp - MOD-0003: Журнал и пользовательский вывод
// ==============================================================================
//
// MOD-0003 output
// ADR-0006: собственный слой вывода
// ADR-0003: RapidJSON для JSON сериализации
// Байты первичны, std::endl не используется.
//
// ==============================================================================

#include "sandpipe/output.hpp"

#include "sandpipe/platform.hpp"

#include <algorithm>
#include <cstdio>

namespace sandpipe::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

const char* level_prefix(Level level) {
    switch (level) {
    case Level::Trace:
        return "[~] ";
    case Level::Debug:
        return "[*] ";
    case Level::Info:
        return "[+] ";
    case Level::Warn:
        return "[!] ";
    case Level::Error:
        return "[x] ";
    }
    return "";
}

Color level_color(Level level) {
    switch (level) {
    case Level::Trace:
        return Color::Magenta;
    case Level::Debug:
        return Color::Cyan;
    case Level::Info:
        return Color::Green;
    case Level::Warn:
        return Color::Yellow;
    case Level::Error:
        return Color::Red;
    }
    return Color::Default;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    if (config_.silent) {
        return;
    }
    // stdout перенаправляется в файл, если он открыт
    FILE* f = (s == Stream::Stdout && output_file_ != nullptr) ? output_file_ : get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Trace:
        return config_.verbose > 1;
    case Level::Debug:
        return config_.verbose > 0;
    case Level::Info:
    case Level::Warn:
        return !config_.quiet;
    case Level::Error:
        return true;
    }
    return false;
}

void Writer::log(Level level, std::string_view message) {
    if (config_.keep_history) {
        history_.push_back(Record{level, std::string(message)});
    }
    if (!enabled(level)) {
        return;
    }
    write_prefixed(level, message);
}

void Writer::write_prefixed(Level level, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(level_color(level)));
        write(Stream::Stderr, level_prefix(level));
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, level_prefix(level));
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    log(Level::Info, message);
}

void Writer::warn(std::string_view message) {
    log(Level::Warn, message);
}

void Writer::error(std::string_view message) {
    log(Level::Error, message);
}

void Writer::debug(std::string_view message) {
    log(Level::Debug, message);
}

void Writer::trace(std::string_view message) {
    log(Level::Trace, message);
}

std::size_t Writer::count(Level level) const {
    return static_cast<std::size_t>(std::count_if(
        history_.begin(), history_.end(), [level](const Record& r) { return r.level == level; }));
}

bool Writer::contains(Level level, std::string_view needle) const {
    return std::any_of(history_.begin(), history_.end(), [&](const Record& r) {
        return r.level == level && r.message.find(needle) != std::string::npos;
    });
}

void Writer::yellow_line(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_colored(Stream::Stderr, message, Color::Yellow);
    write(Stream::Stderr, "\n");
}

void Writer::red_line(std::string_view message) {
    write_colored(Stream::Stderr, message, Color::Red);
    write(Stream::Stderr, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    // В файл без ANSI-кодов
    bool use_color = (s == Stream::Stdout && output_file_ == nullptr && supports_color(s)) ||
                     (s == Stream::Stderr && supports_color(s));

    if (use_color) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();
#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif
    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

const char* to_string(Level level) {
    switch (level) {
    case Level::Trace:
        return "trace";
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Warn:
        return "warn";
    case Level::Error:
        return "error";
    }
    return "unknown";
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace sandpipe::output
