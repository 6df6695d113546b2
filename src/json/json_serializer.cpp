//! # JSON Serializer
//!
//! Compact and pretty serialization for `JsonValue`. Control characters are
//! escaped as `\u00XX`; NaN and infinities become `null`.

#include "json/json_value.hpp"

#include <cmath>
#include <cstdio>
#include <ostream>

namespace apidiff::json {

namespace {

void append_escaped(const std::string& s, std::string& out) {
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
}

void append_number(const JsonNumber& num, std::string& out) {
    switch (num.kind) {
    case JsonNumber::Kind::Int64:
        out += std::to_string(num.i64);
        return;
    case JsonNumber::Kind::Uint64:
        out += std::to_string(num.u64);
        return;
    case JsonNumber::Kind::Double: {
        if (std::isnan(num.f64) || std::isinf(num.f64)) {
            out += "null";
            return;
        }
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", num.f64);
        std::string text = buf;
        if (text.find_first_of(".eE") == std::string::npos) {
            text += ".0";
        }
        out += text;
        return;
    }
    }
}

/// `indent < 0` selects the compact form.
void serialize(const JsonValue& value, std::string& out, int indent, int level) {
    auto newline = [&](int lvl) {
        if (indent >= 0) {
            out += '\n';
            out.append(static_cast<size_t>(indent * lvl), ' ');
        }
    };

    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        append_number(value.as_number(), out);
    } else if (value.is_string()) {
        append_escaped(value.as_string(), out);
    } else if (value.is_array()) {
        const auto& arr = value.as_array();
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            newline(level + 1);
            serialize(arr[i], out, indent, level + 1);
        }
        if (!arr.empty()) {
            newline(level);
        }
        out += ']';
    } else if (value.is_object()) {
        const auto& obj = value.as_object();
        out += '{';
        bool first = true;
        for (const auto& [key, member] : obj) {
            if (!first) {
                out += ',';
            }
            first = false;
            newline(level + 1);
            append_escaped(key, out);
            out += indent >= 0 ? ": " : ":";
            serialize(member, out, indent, level + 1);
        }
        if (!obj.empty()) {
            newline(level);
        }
        out += '}';
    }
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize(*this, out, -1, 0);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize(*this, out, indent < 0 ? 0 : indent, 0);
    return out;
}

auto JsonValue::write_to(std::ostream& os) const -> std::ostream& {
    return os << to_string();
}

} // namespace apidiff::json
