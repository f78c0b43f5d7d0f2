/**
 * @file json.cpp
 * @brief Реализация минималистичного JSON разбора
 */

#include "json.hpp"

#include <charconv>
#include <format>

namespace sealchain::json {

namespace {

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::size_t skip_ws(std::string_view text, std::size_t pos) noexcept {
    while (pos < text.size() && is_space(text[pos])) ++pos;
    return pos;
}

/**
 * @brief Конец значения, начинающегося с pos
 * 
 * @return Позиция сразу после значения или npos при ошибке
 */
std::size_t skip_value(std::string_view text, std::size_t pos) noexcept {
    if (pos >= text.size()) return std::string_view::npos;
    
    char c = text[pos];
    if (c == '"') {
        ++pos;
        while (pos < text.size()) {
            if (text[pos] == '\\') {
                pos += 2;
                continue;
            }
            if (text[pos] == '"') return pos + 1;
            ++pos;
        }
        return std::string_view::npos;
    }
    
    if (c == '{' || c == '[') {
        int depth = 0;
        while (pos < text.size()) {
            char ch = text[pos];
            if (ch == '"') {
                pos = skip_value(text, pos);
                if (pos == std::string_view::npos) return pos;
                continue;
            }
            if (ch == '{' || ch == '[') ++depth;
            else if (ch == '}' || ch == ']') {
                if (--depth == 0) return pos + 1;
            }
            ++pos;
        }
        return std::string_view::npos;
    }
    
    // Число, true, false, null
    while (pos < text.size() && text[pos] != ',' && text[pos] != '}' &&
           text[pos] != ']' && !is_space(text[pos])) {
        ++pos;
    }
    return pos;
}

void append_utf8(std::string& out, uint32_t cp) {
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

std::optional<uint32_t> parse_hex4(std::string_view text, std::size_t pos) noexcept {
    if (pos + 4 > text.size()) return std::nullopt;
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + 4, value, 16);
    if (ec != std::errc{} || ptr != text.data() + pos + 4) return std::nullopt;
    return value;
}

/// Текст числа: сырое число или содержимое строки
std::optional<std::string_view> numeric_text(std::string_view raw) noexcept {
    if (raw.empty() || is_null(raw)) return std::nullopt;
    if (raw.front() == '"') {
        if (raw.size() < 2 || raw.back() != '"') return std::nullopt;
        return raw.substr(1, raw.size() - 2);
    }
    return raw;
}

} // anonymous namespace

std::optional<std::string_view> find_member(std::string_view object, std::string_view key) {
    std::size_t pos = skip_ws(object, 0);
    if (pos >= object.size() || object[pos] != '{') return std::nullopt;
    ++pos;
    
    while (true) {
        pos = skip_ws(object, pos);
        if (pos >= object.size() || object[pos] == '}') return std::nullopt;
        
        // Имя поля
        std::size_t name_end = skip_value(object, pos);
        if (name_end == std::string_view::npos || object[pos] != '"') return std::nullopt;
        std::string_view name = object.substr(pos + 1, name_end - pos - 2);
        
        pos = skip_ws(object, name_end);
        if (pos >= object.size() || object[pos] != ':') return std::nullopt;
        pos = skip_ws(object, pos + 1);
        
        std::size_t value_end = skip_value(object, pos);
        if (value_end == std::string_view::npos) return std::nullopt;
        if (name == key) {
            return object.substr(pos, value_end - pos);
        }
        
        pos = skip_ws(object, value_end);
        if (pos < object.size() && object[pos] == ',') {
            ++pos;
        }
    }
}

bool is_null(std::string_view raw) noexcept {
    return raw == "null";
}

std::optional<std::string> get_string(std::string_view object, std::string_view key) {
    auto raw = find_member(object, key);
    if (!raw || raw->empty() || raw->front() != '"') return std::nullopt;
    return unescape(*raw);
}

std::optional<int64_t> get_int(std::string_view object, std::string_view key) {
    auto raw = find_member(object, key);
    if (!raw) return std::nullopt;
    auto text = numeric_text(*raw);
    if (!text) return std::nullopt;
    
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc{} || ptr != text->data() + text->size()) return std::nullopt;
    return value;
}

std::optional<uint64_t> get_uint(std::string_view object, std::string_view key) {
    auto raw = find_member(object, key);
    if (!raw) return std::nullopt;
    auto text = numeric_text(*raw);
    if (!text) return std::nullopt;
    
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc{} || ptr != text->data() + text->size()) return std::nullopt;
    return value;
}

std::optional<bool> get_bool(std::string_view object, std::string_view key) {
    auto raw = find_member(object, key);
    if (!raw) return std::nullopt;
    if (*raw == "true") return true;
    if (*raw == "false") return false;
    return std::nullopt;
}

std::optional<std::vector<std::string_view>> split_array(std::string_view array) {
    std::size_t pos = skip_ws(array, 0);
    if (pos >= array.size() || array[pos] != '[') return std::nullopt;
    ++pos;
    
    std::vector<std::string_view> items;
    while (true) {
        pos = skip_ws(array, pos);
        if (pos >= array.size()) return std::nullopt;
        if (array[pos] == ']') return items;
        
        std::size_t end = skip_value(array, pos);
        if (end == std::string_view::npos) return std::nullopt;
        items.push_back(array.substr(pos, end - pos));
        
        pos = skip_ws(array, end);
        if (pos < array.size() && array[pos] == ',') {
            ++pos;
        }
    }
}

std::string escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
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
    return out;
}

std::optional<std::string> unescape(std::string_view quoted) {
    if (quoted.size() < 2 || quoted.front() != '"' || quoted.back() != '"') {
        return std::nullopt;
    }
    std::string_view body = quoted.substr(1, quoted.size() - 2);
    
    std::string out;
    out.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i >= body.size()) return std::nullopt;
        
        switch (body[i]) {
            case '"':  out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/'); break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u': {
                auto cp = parse_hex4(body, i + 1);
                if (!cp) return std::nullopt;
                i += 4;
                // Суррогатная пара
                if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                    if (i + 6 >= body.size() || body[i + 1] != '\\' || body[i + 2] != 'u') {
                        return std::nullopt;
                    }
                    auto low = parse_hex4(body, i + 3);
                    if (!low || *low < 0xDC00 || *low > 0xDFFF) return std::nullopt;
                    cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                    i += 6;
                }
                append_utf8(out, *cp);
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return out;
}

} // namespace sealchain::json
