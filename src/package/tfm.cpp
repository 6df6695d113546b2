#include "package/tfm.hpp"

#include "common.hpp"

#include <algorithm>
#include <string>

namespace apidiff::package {

namespace {

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

/// Parses "N" or "N.M" at the start of `s`; returns false if `s` has no digit.
auto parse_major_minor(std::string_view s, int& major, int& minor) -> bool {
    major = 0;
    minor = 0;
    size_t i = 0;
    if (i >= s.size() || !is_digit(s[i])) {
        return false;
    }
    while (i < s.size() && is_digit(s[i])) {
        major = major * 10 + (s[i] - '0');
        ++i;
    }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && is_digit(s[i])) {
            minor = minor * 10 + (s[i] - '0');
            ++i;
        }
    }
    return true;
}

} // namespace

auto tfm_priority(std::string_view tfm) -> int {
    std::string name = to_lower_ascii(tfm);
    if (auto dash = name.find('-'); dash != std::string::npos) {
        name.resize(dash);
    }
    if (name.rfind("net", 0) != 0) {
        return 0;
    }

    std::string_view rest(name);
    rest.remove_prefix(3);
    int major = 0;
    int minor = 0;

    if (rest.rfind("standard", 0) == 0) {
        if (!parse_major_minor(rest.substr(8), major, minor)) {
            return 1;
        }
        if (major >= 2) {
            return 60 + std::min(minor, 3) * 10;
        }
        return 40 + std::min(minor, 9);
    }

    if (rest.rfind("coreapp", 0) == 0) {
        if (!parse_major_minor(rest.substr(7), major, minor)) {
            return 1;
        }
        return 70 + std::min(major, 3) * 2 + (minor > 0 ? 1 : 0);
    }

    if (!parse_major_minor(rest, major, minor)) {
        return 1;
    }

    // .NET 5+ uses dotted names ("net8.0"); .NET Framework uses bare digits ("net472")
    bool dotted = rest.find('.') != std::string_view::npos;
    if (dotted || (major >= 5 && major <= 9)) {
        if (major < 5) {
            return 1;
        }
        return 60 + major * 5 + std::min(minor, 4);
    }

    std::string digits;
    for (char c : rest) {
        if (!is_digit(c)) {
            break;
        }
        digits += c;
    }
    if (digits.size() >= 2 && digits[0] == '4') {
        return 50 + (digits[1] - '0');
    }
    // net11, net20, net35 and friends
    return 10 + (digits[0] - '0');
}

} // namespace apidiff::package
