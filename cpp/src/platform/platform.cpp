// ==============================================================================
// platform.cpp - MOD-0004: Платформенные абстракции
// ==============================================================================
//
// MOD-0004 platform
//
// Пути хранятся как std::filesystem::path, на границе (CLI, журнал, JSON)
// переводятся в UTF-8 средствами самой библиотеки.
//
// ==============================================================================

#include "sandpipe/platform.hpp"

#include <cstdio>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace sandpipe::platform {

namespace {

bool is_terminal(std::FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // namespace

std::filesystem::path path_from_utf8(std::string_view u8str) {
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

bool is_tty_stdout() {
    return is_terminal(stdout);
}

bool is_tty_stderr() {
    return is_terminal(stderr);
}

const char* list_prefix() {
#ifdef _WIN32
    // cmd.exe по умолчанию не в UTF-8
    return "+";
#else
    return "\xe2\x80\xa3";
#endif
}

}  // namespace sandpipe::platform
