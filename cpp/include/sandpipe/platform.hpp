// ==============================================================================
// sandpipe/platform.hpp - MOD-0004: Платформенные абстракции
// ==============================================================================
//
// MOD-0004 platform
//
// Различия Windows/Unix для путей и терминала.
//
// ==============================================================================

#ifndef SANDPIPE_PLATFORM_HPP
#define SANDPIPE_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace sandpipe::platform {

/// UTF-8 строка → native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path → UTF-8 строка (для логов и результатов)
std::string path_to_utf8(const std::filesystem::path& p);

bool is_tty_stdout();
bool is_tty_stderr();

/// Маркер элемента списка в консольном выводе ("+" на Windows, "‣" иначе)
const char* list_prefix();

}  // namespace sandpipe::platform

#endif  // SANDPIPE_PLATFORM_HPP
