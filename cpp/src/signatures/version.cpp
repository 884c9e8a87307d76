// ==============================================================================
// version.cpp - MOD-0014: Версии движка и сигнатур
// ==============================================================================
//
// MOD-0014 version
//
// ==============================================================================

#include <sandpipe/version.hpp>

#include <cctype>
#include <limits>

namespace sandpipe::version {

std::string strip_prerelease(std::string_view text) {
    auto pos = text.find('-');
    return std::string(text.substr(0, pos));
}

namespace {

/// Разобрать десятичное число начиная с pos; pos сдвигается за число
bool read_number(std::string_view text, std::size_t& pos, int& out) {
    std::size_t start = pos;
    long long value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        value = value * 10 + (text[pos] - '0');
        if (value > std::numeric_limits<int>::max()) {
            return false;
        }
        ++pos;
    }
    if (pos == start) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

}  // namespace

std::optional<Version> parse(std::string_view text) {
    Version v;
    std::size_t pos = 0;

    // Обязательные major.minor
    if (!read_number(text, pos, v.numbers[0])) {
        return std::nullopt;
    }
    if (pos >= text.size() || text[pos] != '.') {
        return std::nullopt;
    }
    ++pos;
    if (!read_number(text, pos, v.numbers[1])) {
        return std::nullopt;
    }

    // Необязательный patch
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        if (!read_number(text, pos, v.numbers[2])) {
            return std::nullopt;
        }
    }

    // Необязательный пре-релиз a/b с номером
    if (pos < text.size() && (text[pos] == 'a' || text[pos] == 'b')) {
        v.prerelease = text[pos];
        ++pos;
        if (!read_number(text, pos, v.prerelease_number)) {
            return std::nullopt;
        }
    }

    if (pos != text.size()) {
        return std::nullopt;
    }
    return v;
}

int compare(const Version& a, const Version& b) {
    for (std::size_t i = 0; i < a.numbers.size(); ++i) {
        if (a.numbers[i] != b.numbers[i]) {
            return a.numbers[i] < b.numbers[i] ? -1 : 1;
        }
    }

    // Релиз старше любого пре-релиза той же версии
    if (a.prerelease != b.prerelease) {
        if (a.prerelease == 0) {
            return 1;
        }
        if (b.prerelease == 0) {
            return -1;
        }
        return a.prerelease < b.prerelease ? -1 : 1;
    }
    if (a.prerelease_number != b.prerelease_number) {
        return a.prerelease_number < b.prerelease_number ? -1 : 1;
    }
    return 0;
}

}  // namespace sandpipe::version
