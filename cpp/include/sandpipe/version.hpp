// ==============================================================================
// sandpipe/version.hpp - MOD-0014: Версии движка и сигнатур
// ==============================================================================
//
// MOD-0014 version
//
// Формат версии: N.N[.N][(a|b)N]
// - "1.2" == "1.2.0"
// - пре-релиз (a/b) меньше соответствующего релиза
// Суффикс после '-' ("2.0-dev", "2.1-rc1") отбрасывается до разбора.
//
// ==============================================================================

#ifndef SANDPIPE_VERSION_HPP
#define SANDPIPE_VERSION_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace sandpipe::version {

/// Версия движка, с которой сравниваются minimum/maximum сигнатур
inline constexpr const char* ENGINE_VERSION = "2.0-dev";

/// Версия приложения (sandpipe --version)
inline constexpr const char* APP_VERSION = "2.0.0";

struct Version {
    std::array<int, 3> numbers{0, 0, 0};
    char prerelease = 0;  // 0, 'a' или 'b'
    int prerelease_number = 0;
};

/// Отбросить всё начиная с первого '-'
std::string strip_prerelease(std::string_view text);

/// Строгий разбор; nullopt если строка не соответствует формату
std::optional<Version> parse(std::string_view text);

/// <0, 0, >0
int compare(const Version& a, const Version& b);

}  // namespace sandpipe::version

#endif  // SANDPIPE_VERSION_HPP
