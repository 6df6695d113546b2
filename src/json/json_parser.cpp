//! # JSON Parser Implementation
//!
//! Single-pass recursive descent over a `std::string_view` cursor. Every
//! error carries the line/column where the cursor stood.

#include "json/json_parser.hpp"

#include <charconv>
#include <cstdlib>

namespace apidiff::json {

namespace {

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

// ============================================================================
// Cursor
// ============================================================================

auto JsonParser::peek() const -> char {
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

auto JsonParser::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonParser::consume_literal(std::string_view word) -> bool {
    if (input_.substr(pos_, word.size()) != word) {
        return false;
    }
    for (size_t i = 0; i < word.size(); ++i) {
        advance();
    }
    return true;
}

auto JsonParser::error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_, pos_);
}

// ============================================================================
// Grammar
// ============================================================================

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    skip_whitespace();
    if (pos_ < input_.size()) {
        return error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    if (depth_ >= MAX_DEPTH) {
        return error("Maximum nesting depth exceeded");
    }

    char c = peek();
    switch (c) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
        if (consume_literal("true")) {
            return JsonValue(true);
        }
        break;
    case 'f':
        if (consume_literal("false")) {
            return JsonValue(false);
        }
        break;
    case 'n':
        if (consume_literal("null")) {
            return JsonValue();
        }
        break;
    case '\0':
        if (pos_ >= input_.size()) {
            return error("Unexpected end of input");
        }
        break;
    default:
        if (c == '-' || is_digit(c)) {
            return parse_number();
        }
        break;
    }
    return error(std::string("Unexpected character: ") + c);
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '{'
    skip_whitespace();

    JsonObject obj;
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return error("Expected string key in object");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (peek() != ':') {
            return error("Expected ':' after object key");
        }
        advance();
        skip_whitespace();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj[std::move(unwrap(key))] = std::move(unwrap(value));

        skip_whitespace();
        char c = advance();
        if (c == '}') {
            --depth_;
            return JsonValue(std::move(obj));
        }
        if (c != ',') {
            return error("Expected ',' or '}' in object");
        }
        skip_whitespace();
        if (peek() == '}') {
            return error("Trailing comma in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '['
    skip_whitespace();

    JsonArray arr;
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        skip_whitespace();
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == ']') {
            --depth_;
            return JsonValue(std::move(arr));
        }
        if (c != ',') {
            return error("Expected ',' or ']' in array");
        }
        skip_whitespace();
        if (peek() == ']') {
            return error("Trailing comma in array");
        }
    }
}

auto JsonParser::parse_hex4() -> Result<uint32_t, JsonError> {
    if (pos_ + 4 > input_.size()) {
        return error("Incomplete unicode escape sequence");
    }
    uint32_t value = 0;
    const char* begin = input_.data() + pos_;
    auto [ptr, ec] = std::from_chars(begin, begin + 4, value, 16);
    if (ec != std::errc{} || ptr != begin + 4) {
        return error("Invalid unicode escape sequence");
    }
    for (int i = 0; i < 4; ++i) {
        advance();
    }
    return value;
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    advance(); // opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = advance();
        if (c == '"') {
            return value;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return error("Control character in string");
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            value += escaped;
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            auto hi = parse_hex4();
            if (is_err(hi)) {
                return unwrap_err(hi);
            }
            uint32_t cp = unwrap(hi);
            // High surrogate must be followed by \uDC00-\uDFFF
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (!consume_literal("\\u")) {
                    return error("Unpaired surrogate in unicode escape");
                }
                auto lo = parse_hex4();
                if (is_err(lo)) {
                    return unwrap_err(lo);
                }
                uint32_t low = unwrap(lo);
                if (low < 0xDC00 || low > 0xDFFF) {
                    return error("Invalid low surrogate in unicode escape");
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(value, cp);
            break;
        }
        default:
            return error("Invalid escape sequence: \\" + std::string(1, escaped));
        }
    }
    return error("Unterminated string");
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (peek() == '0') {
        advance();
    } else if (is_digit(peek())) {
        while (is_digit(peek())) {
            advance();
        }
    } else {
        return error("Invalid number");
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!is_digit(peek())) {
            return error("Expected digit after decimal point");
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!is_digit(peek())) {
            return error("Expected digit in exponent");
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    std::string_view text = input_.substr(start, pos_ - start);
    const char* first = text.data();
    const char* last = text.data() + text.size();

    if (!is_float) {
        if (text[0] == '-') {
            int64_t value = 0;
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec == std::errc{}) {
                return JsonValue(value);
            }
        } else {
            uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec == std::errc{}) {
                if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return JsonValue(static_cast<int64_t>(value));
                }
                return JsonValue(value);
            }
        }
        // Out of 64-bit range: fall through to double
    }

    return JsonValue(std::strtod(std::string(text).c_str(), nullptr));
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace apidiff::json
