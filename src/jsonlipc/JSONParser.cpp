//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict recursive-descent JSON parser and compact serializer using only the std library
//==========================================================================================================

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <system_error>
#include <type_traits>

#include "jsonlipc/JSONValue.h"
#include "logging/Logger.h"

namespace jsonlipc {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Strict recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int MaxDepth = 512u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0u};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what, i);
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    void expectLiteral(const char* lit) {
        const std::size_t n = std::char_traits<char>::length(lit);
        if (s.compare(i, n, lit) != 0) {
            fail(std::string("Invalid literal, expected '") + lit + "'");
        }
        i += n;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    // Copies one multi-byte UTF-8 sequence whose lead byte was just consumed. Rejects stray
    // continuation bytes, truncation, overlong forms, encoded surrogates and code points past U+10FFFF.
    void appendValidatedUtf8(std::string& out, unsigned char lead) {
        std::size_t len = 0;
        unsigned int code = 0;
        if (lead >= 0xC2 && lead <= 0xDF) { len = 2; code = lead & 0x1Fu; }
        else if (lead >= 0xE0 && lead <= 0xEF) { len = 3; code = lead & 0x0Fu; }
        else if (lead >= 0xF0 && lead <= 0xF4) { len = 4; code = lead & 0x07u; }
        else fail("Invalid UTF-8 lead byte");

        const std::size_t begin = i - 1;
        if (begin + len > s.size()) fail("Truncated UTF-8 sequence");
        for (std::size_t k = 1; k < len; ++k) {
            const auto b = static_cast<unsigned char>(s[i]);
            if ((b & 0xC0u) != 0x80u) fail("Invalid UTF-8 continuation byte");
            code = (code << 6) | (b & 0x3Fu);
            ++i;
        }
        if ((len == 3 && code < 0x800u) || (len == 4 && code < 0x10000u)) fail("Overlong UTF-8 sequence");
        if (code >= 0xD800u && code <= 0xDFFFu) fail("UTF-8 encoded surrogate");
        if (code > 0x10FFFFu) fail("UTF-8 code point out of range");
        out.append(s, begin, len);
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (static_cast<unsigned char>(c) >= 0x80) {
                appendValidatedUtf8(out, static_cast<unsigned char>(c));
                continue;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        const std::size_t start = i;
        auto isDigit = [this](std::size_t k) { return k < s.size() && s[k] >= '0' && s[k] <= '9'; };
        if (i < s.size() && s[i] == '-') ++i;
        if (!isDigit(i)) fail("Invalid number");
        if (s[i] == '0') {
            ++i;
        } else {
            while (isDigit(i)) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (!isDigit(i)) fail("Invalid number fraction");
            while (isDigit(i)) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (!isDigit(i)) fail("Invalid number exponent");
            while (isDigit(i)) ++i;
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto res = std::from_chars(first, last, v);
            if (res.ec == std::errc() && res.ptr == last) {
                return JSONValue(v);
            }
            // Only int64 is carried exactly; wider integers are rejected rather than rounded.
            fail("Integer out of range");
        }
        const std::string text(first, last);
        char* end = nullptr;
        errno = 0;
        const double d = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) fail("Invalid number");
        // Underflow yields a denormal or zero, which is kept. Overflow has no JSON representation.
        if (errno == ERANGE && std::isinf(d)) fail("Number out of range");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > MaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > MaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') { expectLiteral("true"); return JSONValue(true); }
        if (c == 'f') { expectLiteral("false"); return JSONValue(false); }
        if (c == 'n') { expectLiteral("null"); return JSONValue(nullptr); }
        if (c == '-' || (c >= '0' && c <= '9')) return parseNumber();
        fail(std::string("Unexpected character '") + c + "'");
    }
};

void serializeString(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void serializeDouble(std::ostringstream& oss, double v) {
    if (!std::isfinite(v)) {
        oss << "null";
        return;
    }
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    std::string text(buf, res.ptr);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    oss << text;
}

void serializeInto(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            serializeDouble(oss, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            serializeString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                if (v[i]) { serializeInto(oss, *v[i]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                serializeString(oss, key);
                oss << ':';
                if (val) { serializeInto(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Unexpected trailing content");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    serializeInto(oss, value);
    return oss.str();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.IsNumber() && b.IsNumber()) {
        if (std::holds_alternative<int64_t>(a.value) && std::holds_alternative<int64_t>(b.value)) {
            return std::get<int64_t>(a.value) == std::get<int64_t>(b.value);
        }
        auto asDouble = [](const JSONValue& v) {
            return std::holds_alternative<int64_t>(v.value) ? static_cast<double>(std::get<int64_t>(v.value))
                                                             : std::get<double>(v.value);
        };
        return asDouble(a) == asDouble(b);
    }
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (a.IsArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        const JSONValue nul;
        for (std::size_t k = 0; k < x.size(); ++k) {
            if ((x[k] ? *x[k] : nul) != (y[k] ? *y[k] : nul)) return false;
        }
        return true;
    }
    if (a.IsObject()) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        const JSONValue nul;
        for (const auto& [key, val] : x) {
            auto it = y.find(key);
            if (it == y.end()) return false;
            if ((val ? *val : nul) != (it->second ? *it->second : nul)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

const JSONValue* FindMember(const JSONValue::Object& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetString(const JSONValue::Object& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || !std::holds_alternative<std::string>(v->value)) {
        return std::nullopt;
    }
    return std::get<std::string>(v->value);
}

std::optional<double> GetNumber(const JSONValue::Object& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return static_cast<double>(std::get<int64_t>(v->value));
    }
    if (std::holds_alternative<double>(v->value)) {
        return std::get<double>(v->value);
    }
    return std::nullopt;
}

std::optional<int64_t> GetInteger(const JSONValue::Object& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || !std::holds_alternative<int64_t>(v->value)) {
        return std::nullopt;
    }
    return std::get<int64_t>(v->value);
}

std::optional<bool> GetBool(const JSONValue::Object& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || !std::holds_alternative<bool>(v->value)) {
        return std::nullopt;
    }
    return std::get<bool>(v->value);
}

void SetMember(JSONValue::Object& obj, const std::string& key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}

bool SetMemberIfAbsent(JSONValue::Object& obj, const std::string& key, JSONValue v) {
    if (obj.find(key) != obj.end()) {
        return false;
    }
    obj[key] = std::make_shared<JSONValue>(std::move(v));
    return true;
}

} // namespace jsonlipc
