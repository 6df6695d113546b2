#include "package/version.hpp"

#include <charconv>
#include <vector>

namespace apidiff::package {

namespace {

auto split(std::string_view text, char sep) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (true) {
        size_t next = text.find(sep, pos);
        if (next == std::string_view::npos) {
            parts.push_back(text.substr(pos));
            return parts;
        }
        parts.push_back(text.substr(pos, next - pos));
        pos = next + 1;
    }
}

auto is_label_char(char c) -> bool {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
}

} // namespace

auto normalize_version(std::string_view text) -> Result<std::string, VersionError> {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return VersionError{"version is empty"};
    }

    // Build metadata never takes part in identity
    if (auto plus = text.find('+'); plus != std::string_view::npos) {
        text = text.substr(0, plus);
    }

    std::string_view release;
    if (auto dash = text.find('-'); dash != std::string_view::npos) {
        release = text.substr(dash + 1);
        text = text.substr(0, dash);
        if (release.empty()) {
            return VersionError{"empty pre-release label"};
        }
    }

    auto parts = split(text, '.');
    if (parts.size() > 4) {
        return VersionError{"too many version components"};
    }

    std::vector<uint64_t> numbers;
    for (auto part : parts) {
        if (part.empty()) {
            return VersionError{"empty version component"};
        }
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc{} || ptr != part.data() + part.size()) {
            return VersionError{"invalid version component '" + std::string(part) + "'"};
        }
        numbers.push_back(value);
    }
    while (numbers.size() < 3) {
        numbers.push_back(0);
    }
    if (numbers.size() == 4 && numbers[3] == 0) {
        numbers.pop_back();
    }

    std::string normalized;
    for (size_t i = 0; i < numbers.size(); ++i) {
        if (i > 0) {
            normalized += '.';
        }
        normalized += std::to_string(numbers[i]);
    }

    if (!release.empty()) {
        for (auto label : split(release, '.')) {
            if (label.empty()) {
                return VersionError{"empty pre-release identifier"};
            }
            for (char c : label) {
                if (!is_label_char(c)) {
                    return VersionError{"invalid character '" + std::string(1, c) +
                                        "' in pre-release label"};
                }
            }
        }
        normalized += '-';
        normalized += to_lower_ascii(release);
    }

    return normalized;
}

} // namespace apidiff::package
