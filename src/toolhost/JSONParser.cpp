//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, compact serializer and JSON-RPC frame codecs
//==========================================================================================================

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <fmt/format.h>
#include "toolhost/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace toolhost {

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

const JSONValue* JSONValue::find(const std::string& key) const {
    if (!std::holds_alternative<Object>(value)) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {

constexpr std::size_t MaxNestingDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    std::size_t depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(fmt::format("JSON parse error at offset {}: {}", i, what));
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

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape");
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
        if (i >= s.size() || s[i] != '"') fail("expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("invalid escape");
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
                        // High surrogate must be followed by \uDC00-\uDFFF
                        if (i + 2 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate");
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            fail("lone high surrogate");
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("lone low surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
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
        if (i == intStart) fail("expected digit");
        if (s[intStart] == '0' && i - intStart > 1) fail("leading zero in number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("expected digit after decimal point");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("expected digit in exponent");
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            errno = 0;
            char* end = nullptr;
            long long v = std::strtoll(num.c_str(), &end, 10);
            if (errno != ERANGE) {
                return JSONValue(static_cast<int64_t>(v));
            }
            // Out of int64 range: keep the magnitude as a double
        }
        return JSONValue(std::strtod(num.c_str(), nullptr));
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input");
        if (++depth > MaxNestingDepth) fail("nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') {
            out = JSONValue(parseString());
        } else if (c == '{') {
            out = parseObject();
        } else if (c == '[') {
            out = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; out = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; out = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; out = JSONValue(nullptr);
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            out = parseNumber();
        } else {
            fail("unexpected character");
        }
        --depth;
        return out;
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void appendValue(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                out += "null";
                return;
            }
            std::string num = fmt::format("{}", v);
            // Keep the value a double on re-parse
            if (num.find_first_of(".eE") == std::string::npos) {
                num += ".0";
            }
            out += num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                if (v[k]) { appendValue(out, *v[k]); } else { out += "null"; }
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (val) { appendValue(out, *val); } else { out += "null"; }
            }
            out.push_back('}');
        }
    }, value.get());
}

void appendId(std::string& out, const JSONRPCId& id) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else {
            out += "null";
        }
    }, id);
}

// Reads a top-level id member; returns false when present but not string/integer/null.
bool readId(const JSONValue& frame, JSONRPCId& id) {
    const JSONValue* idVal = frame.find("id");
    if (idVal == nullptr || idVal->isNull()) {
        id = nullptr;
        return true;
    }
    if (idVal->isInt()) {
        id = std::get<int64_t>(idVal->value);
        return true;
    }
    if (idVal->isString()) {
        id = std::get<std::string>(idVal->value);
        return true;
    }
    return false;
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("trailing characters after JSON document");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    appendValue(out, value);
    return out;
}

std::string ToDisplayString(const JSONValue& value) {
    if (value.isString()) {
        return std::get<std::string>(value.value);
    }
    return SerializeJSON(value);
}

FrameKind ClassifyFrame(const JSONValue& frame) {
    if (!frame.isObject()) {
        return FrameKind::Unknown;
    }
    const auto& obj = std::get<JSONValue::Object>(frame.value);
    if (obj.count("result") != 0 || obj.count("error") != 0) {
        return FrameKind::Response;
    }
    const JSONValue* method = frame.find("method");
    if (method != nullptr && method->isString()) {
        return obj.count("id") != 0 ? FrameKind::Request : FrameKind::Notification;
    }
    return FrameKind::Unknown;
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"id\":";
    appendId(out, id);
    out += ",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        appendValue(out, params.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue frame = ParseJSON(json);
        if (ClassifyFrame(frame) != FrameKind::Request) {
            return false;
        }
        if (!readId(frame, id)) {
            return false;
        }
        method = std::get<std::string>(frame.find("method")->value);
        if (const JSONValue* p = frame.find("params")) {
            params = *p;
        }
        return !method.empty();
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"id\":";
    appendId(out, id);
    if (error.has_value()) {
        out += ",\"error\":";
        appendValue(out, error.value());
    } else {
        out += ",\"result\":";
        if (result.has_value()) { appendValue(out, result.value()); } else { out += "null"; }
    }
    out.push_back('}');
    return out;
}

bool JSONRPCResponse::FromValue(const JSONValue& frame) {
    if (ClassifyFrame(frame) != FrameKind::Response) {
        return false;
    }
    if (!readId(frame, id)) {
        return false;
    }
    result.reset();
    error.reset();
    if (const JSONValue* e = frame.find("error"); e != nullptr && !e->isNull()) {
        error = *e;
    } else if (const JSONValue* r = frame.find("result")) {
        result = *r;
    } else {
        result = JSONValue(nullptr);
    }
    return true;
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        appendValue(out, params.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue frame = ParseJSON(json);
        if (ClassifyFrame(frame) != FrameKind::Notification) {
            return false;
        }
        method = std::get<std::string>(frame.find("method")->value);
        if (const JSONValue* p = frame.find("params")) {
            params = *p;
        }
        return !method.empty();
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

} // namespace toolhost
