/**
 * @file json.cpp
 * @brief Реализация парсера и сериализатора JSON
 */

#include "json.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <limits>

namespace strata {

// =============================================================================
// JsonValue
// =============================================================================

std::optional<bool> JsonValue::as_bool() const noexcept {
    if (const auto* v = std::get_if<bool>(&value_)) {
        return *v;
    }
    return std::nullopt;
}

std::optional<uint64_t> JsonValue::as_uint64() const noexcept {
    if (const auto* v = std::get_if<uint64_t>(&value_)) {
        return *v;
    }
    if (const auto* v = std::get_if<int64_t>(&value_)) {
        if (*v >= 0) return static_cast<uint64_t>(*v);
        return std::nullopt;
    }
    if (const auto* v = std::get_if<double>(&value_)) {
        if (*v >= 0.0 && std::floor(*v) == *v &&
            *v < static_cast<double>(std::numeric_limits<uint64_t>::max())) {
            return static_cast<uint64_t>(*v);
        }
    }
    return std::nullopt;
}

std::optional<int64_t> JsonValue::as_int64() const noexcept {
    if (const auto* v = std::get_if<int64_t>(&value_)) {
        return *v;
    }
    if (const auto* v = std::get_if<uint64_t>(&value_)) {
        if (*v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(*v);
        }
        return std::nullopt;
    }
    if (const auto* v = std::get_if<double>(&value_)) {
        if (std::floor(*v) == *v && std::fabs(*v) < 9.2e18) {
            return static_cast<int64_t>(*v);
        }
    }
    return std::nullopt;
}

std::optional<double> JsonValue::as_double() const noexcept {
    if (const auto* v = std::get_if<double>(&value_)) return *v;
    if (const auto* v = std::get_if<int64_t>(&value_)) return static_cast<double>(*v);
    if (const auto* v = std::get_if<uint64_t>(&value_)) return static_cast<double>(*v);
    return std::nullopt;
}

const JsonValue* JsonValue::find(std::string_view key) const {
    const auto* object = as_object();
    if (!object) {
        return nullptr;
    }
    auto it = object->find(key);
    if (it == object->end()) {
        return nullptr;
    }
    return &it->second;
}

// =============================================================================
// Парсер
// =============================================================================

namespace {

/// @brief Ограничение вложенности против переполнения стека
constexpr int MAX_DEPTH = 64;

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    Result<JsonValue> parse_document() {
        skip_whitespace();
        auto value = parse_value(0);
        if (!value) {
            return value;
        }
        skip_whitespace();
        if (pos_ != text_.size()) {
            return fail("лишние символы после значения");
        }
        return value;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};

    Result<JsonValue> fail(std::string_view what) const {
        return Err<JsonValue>(ErrorCode::ProtocolMalformed,
            std::format("JSON: {} (позиция {})", what, pos_));
    }

    void skip_whitespace() {
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
            ++pos_;
        }
    }

    bool consume_literal(std::string_view literal) {
        if (text_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    Result<JsonValue> parse_value(int depth) {
        if (depth > MAX_DEPTH) {
            return fail("слишком глубокая вложенность");
        }
        if (pos_ >= text_.size()) {
            return fail("неожиданный конец данных");
        }

        switch (text_[pos_]) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': {
                auto str = parse_string();
                if (!str) return std::unexpected(str.error());
                return JsonValue(std::move(*str));
            }
            case 't':
                if (consume_literal("true")) return JsonValue(true);
                return fail("ожидалось true");
            case 'f':
                if (consume_literal("false")) return JsonValue(false);
                return fail("ожидалось false");
            case 'n':
                if (consume_literal("null")) return JsonValue(nullptr);
                return fail("ожидалось null");
            default:
                return parse_number();
        }
    }

    Result<JsonValue> parse_object(int depth) {
        ++pos_;  // '{'
        JsonValue::Object object;

        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return JsonValue(std::move(object));
        }

        while (true) {
            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != '"') {
                return fail("ожидался ключ объекта");
            }
            auto key = parse_string();
            if (!key) return std::unexpected(key.error());

            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') {
                return fail("ожидалось ':'");
            }
            ++pos_;
            skip_whitespace();

            auto value = parse_value(depth + 1);
            if (!value) return value;
            object.insert_or_assign(std::move(*key), std::move(*value));

            skip_whitespace();
            if (pos_ >= text_.size()) {
                return fail("незакрытый объект");
            }
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == '}') {
                ++pos_;
                return JsonValue(std::move(object));
            }
            return fail("ожидалось ',' или '}'");
        }
    }

    Result<JsonValue> parse_array(int depth) {
        ++pos_;  // '['
        JsonValue::Array array;

        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return JsonValue(std::move(array));
        }

        while (true) {
            skip_whitespace();
            auto value = parse_value(depth + 1);
            if (!value) return value;
            array.push_back(std::move(*value));

            skip_whitespace();
            if (pos_ >= text_.size()) {
                return fail("незакрытый массив");
            }
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == ']') {
                ++pos_;
                return JsonValue(std::move(array));
            }
            return fail("ожидалось ',' или ']'");
        }
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::optional<uint32_t> parse_hex4() {
        if (pos_ + 4 > text_.size()) return std::nullopt;
        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, value, 16);
        if (ec != std::errc{} || ptr != text_.data() + pos_ + 4) return std::nullopt;
        pos_ += 4;
        return value;
    }

    Result<std::string> parse_string() {
        ++pos_;  // '"'
        std::string out;

        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return Err<std::string>(ErrorCode::ProtocolMalformed,
                    std::format("JSON: управляющий символ в строке (позиция {})", pos_));
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) break;

            char esc = text_[pos_++];
            switch (esc) {
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/'); break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u': {
                    auto cp = parse_hex4();
                    if (!cp) {
                        return Err<std::string>(ErrorCode::ProtocolMalformed,
                            std::format("JSON: некорректный \\u escape (позиция {})", pos_));
                    }
                    uint32_t code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF &&
                        text_.substr(pos_, 2) == "\\u") {
                        pos_ += 2;
                        auto low = parse_hex4();
                        if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                            code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                        }
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return Err<std::string>(ErrorCode::ProtocolMalformed,
                        std::format("JSON: неизвестный escape (позиция {})", pos_));
            }
        }

        return Err<std::string>(ErrorCode::ProtocolMalformed, "JSON: незакрытая строка");
    }

    Result<JsonValue> parse_number() {
        std::size_t start = pos_;
        bool negative = false;
        bool fractional = false;

        if (text_[pos_] == '-') {
            negative = true;
            ++pos_;
        }
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c >= '0' && c <= '9') {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
                fractional = true;
                ++pos_;
            } else {
                break;
            }
        }

        std::string_view token = text_.substr(start, pos_ - start);
        if (token.empty() || token == "-") {
            return fail("ожидалось значение");
        }

        const char* first = token.data();
        const char* last = token.data() + token.size();

        if (!fractional) {
            if (negative) {
                int64_t value = 0;
                auto [ptr, ec] = std::from_chars(first, last, value);
                if (ec == std::errc{} && ptr == last) return JsonValue(value);
            } else {
                uint64_t value = 0;
                auto [ptr, ec] = std::from_chars(first, last, value);
                if (ec == std::errc{} && ptr == last) return JsonValue(value);
            }
        }

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) {
            return fail("некорректное число");
        }
        return JsonValue(value);
    }
};

void write_string(std::string& out, const std::string& str) {
    out.push_back('"');
    for (char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

void write_value(std::string& out, const JsonValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
            out += std::format("{}", v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                out += std::format("{}", v);
            } else {
                out += "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            write_string(out, v);
        } else if constexpr (std::is_same_v<T, JsonValue::Array>) {
            out.push_back('[');
            bool first = true;
            for (const auto& item : v) {
                if (!first) out.push_back(',');
                first = false;
                write_value(out, item);
            }
            out.push_back(']');
        } else {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, item] : v) {
                if (!first) out.push_back(',');
                first = false;
                write_string(out, key);
                out.push_back(':');
                write_value(out, item);
            }
            out.push_back('}');
        }
    }, value.raw());
}

} // namespace

Result<JsonValue> parse_json(std::string_view text) {
    Parser parser(text);
    return parser.parse_document();
}

std::string to_json(const JsonValue& value) {
    std::string out;
    write_value(out, value);
    return out;
}

} // namespace strata
