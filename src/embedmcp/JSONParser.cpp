//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, compact serializer and value helpers
//==========================================================================================================

#include <cerrno>
#include <cmath>
#include <cctype>
#include <cstdlib>
#include <format>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "embedmcp/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace embedmcp {

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
// Recursive JSON parser
// -------------------------------
namespace {

constexpr unsigned int kMaxDepth = 256u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const char* what) const { throw JSONParseError(what, i); }

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

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
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

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
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
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t intStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == intStart) fail("Invalid number");
        if (s[intStart] == '0' && i - intStart > 1) fail("Leading zero in number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("Invalid fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("Invalid exponent");
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Falls through to double for integers beyond int64 range
            }
        }
        // strtod reports overflow and underflow alike with ERANGE. Only overflow is rejected; an
        // underflowing literal keeps the denormal or zero that strtod produced.
        errno = 0;
        const double d = std::strtod(num.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(d)) {
            fail("Number out of range");
        }
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (!match(']')) {
            while (true) {
                arr.push_back(std::make_shared<JSONValue>(parseValue()));
                if (match(']')) break;
                if (!match(',')) fail("Expected ',' in array");
            }
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (!match('}')) {
            while (true) {
                std::string key = parseString();
                if (!match(':')) fail("Expected ':' after key");
                obj[key] = std::make_shared<JSONValue>(parseValue());
                if (match('}')) break;
                if (!match(',')) fail("Expected ',' in object");
            }
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
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
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
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                oss << "null";
                return;
            }
            std::string num = std::format("{}", v);
            if (num.find_first_of(".eE") == std::string::npos) {
                num += ".0";
            }
            oss << num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) writeValue(oss, *v[k]); else oss << "null";
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscaped(oss, key);
                oss << ':';
                if (val) writeValue(oss, *val); else oss << "null";
            }
            oss << '}';
        }
    }, value.get());
}

bool sameNode(const std::shared_ptr<JSONValue>& a, const std::shared_ptr<JSONValue>& b) {
    if (!a || !b) {
        const bool aNull = !a || a->isNull();
        const bool bNull = !b || b->isNull();
        return aNull && bNull;
    }
    return *a == *b;
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (const auto* arr = std::get_if<JSONValue::Array>(&a.value)) {
        const auto& other = std::get<JSONValue::Array>(b.value);
        if (arr->size() != other.size()) return false;
        for (std::size_t k = 0; k < arr->size(); ++k) {
            if (!sameNode((*arr)[k], other[k])) return false;
        }
        return true;
    }
    if (const auto* obj = std::get_if<JSONValue::Object>(&a.value)) {
        const auto& other = std::get<JSONValue::Object>(b.value);
        if (obj->size() != other.size()) return false;
        for (const auto& [key, val] : *obj) {
            auto it = other.find(key);
            if (it == other.end() || !sameNode(val, it->second)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

const JSONValue* FindMember(const JSONValue& object, const std::string& key) {
    const auto* obj = std::get_if<JSONValue::Object>(&object.value);
    if (!obj) return nullptr;
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) return nullptr;
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (!v || !v->isString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

std::optional<int64_t> GetIntMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (!v) return std::nullopt;
    if (const auto* n = std::get_if<int64_t>(&v->value)) return *n;
    return std::nullopt;
}

} // namespace embedmcp
