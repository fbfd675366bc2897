#include "utils/json_parser.hpp"
#include "utils/errors.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <cstdint>

namespace wordbase {

namespace {

bool hexToInt(char c, uint32_t& value) {
    if (c >= '0' && c <= '9') {
        value = static_cast<uint32_t>(c - '0');
        return true;
    }
    if (c >= 'a' && c <= 'f') {
        value = static_cast<uint32_t>(10 + (c - 'a'));
        return true;
    }
    if (c >= 'A' && c <= 'F') {
        value = static_cast<uint32_t>(10 + (c - 'A'));
        return true;
    }
    return false;
}

bool parseHex4(const std::string& input, size_t start, uint32_t& codepoint) {
    if (start + 4 > input.size()) {
        return false;
    }
    codepoint = 0;
    for (size_t i = 0; i < 4; i++) {
        uint32_t nibble = 0;
        if (!hexToInt(input[start + i], nibble)) {
            return false;
        }
        codepoint = (codepoint << 4) | nibble;
    }
    return true;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint <= 0x7F) {
        out += static_cast<char>(codepoint);
    } else if (codepoint <= 0x7FF) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0xFFFF) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += '?';
    }
}

void appendEscapedChar(const std::string& input, size_t& pos, std::string& out) {
    if (pos + 1 >= input.size()) {
        out += '\\';
        pos++;
        return;
    }

    const char esc = input[pos + 1];
    switch (esc) {
        case '"': out += '"'; pos += 2; return;
        case '\\': out += '\\'; pos += 2; return;
        case '/': out += '/'; pos += 2; return;
        case 'n': out += '\n'; pos += 2; return;
        case 'r': out += '\r'; pos += 2; return;
        case 't': out += '\t'; pos += 2; return;
        case 'b': out += '\b'; pos += 2; return;
        case 'f': out += '\f'; pos += 2; return;
        case 'u': {
            uint32_t codepoint = 0;
            if (!parseHex4(input, pos + 2, codepoint)) {
                out += 'u';
                pos += 2;
                return;
            }
            pos += 6;
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                if (pos + 1 < input.size() && input[pos] == '\\' && input[pos + 1] == 'u') {
                    uint32_t low = 0;
                    if (parseHex4(input, pos + 2, low) && low >= 0xDC00 && low <= 0xDFFF) {
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    }
                }
            }
            appendUtf8(out, codepoint);
            return;
        }
        default:
            out += esc;
            pos += 2;
            return;
    }
}

void skipWhitespace(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        pos++;
    }
}

[[noreturn]] void malformed(const std::string& what, size_t pos) {
    throw ValidationError("Malformed JSON: " + what + " at offset " + std::to_string(pos));
}

// pos points at the opening quote; leaves pos after the closing quote
std::string readString(const std::string& s, size_t& pos) {
    std::string value;
    pos++;
    while (pos < s.size() && s[pos] != '"') {
        if (s[pos] == '\\') {
            appendEscapedChar(s, pos, value);
            continue;
        }
        value += s[pos];
        pos++;
    }
    if (pos >= s.size()) {
        malformed("unterminated string", pos);
    }
    pos++;
    return value;
}

// Skips one value of any kind and returns its raw text
std::string readRawValue(const std::string& s, size_t& pos) {
    const size_t start = pos;
    if (pos >= s.size()) {
        malformed("missing value", pos);
    }

    const char first = s[pos];
    if (first == '"') {
        readString(s, pos);
        return s.substr(start, pos - start);
    }

    if (first == '{' || first == '[') {
        int depth = 0;
        bool in_string = false;
        while (pos < s.size()) {
            const char c = s[pos];
            if (in_string) {
                if (c == '\\') {
                    pos += 2;
                    continue;
                }
                if (c == '"') in_string = false;
            } else if (c == '"') {
                in_string = true;
            } else if (c == '{' || c == '[') {
                depth++;
            } else if (c == '}' || c == ']') {
                depth--;
                if (depth == 0) {
                    pos++;
                    return s.substr(start, pos - start);
                }
            }
            pos++;
        }
        malformed("unterminated container", start);
    }

    while (pos < s.size() && s[pos] != ',' && s[pos] != '}' && s[pos] != ']' &&
           !std::isspace(static_cast<unsigned char>(s[pos]))) {
        pos++;
    }
    if (pos == start) {
        malformed("unexpected character", pos);
    }
    return s.substr(start, pos - start);
}

} // namespace

std::map<std::string, std::string> JsonParser::parse(const std::string& json) {
    std::map<std::string, std::string> result;
    size_t pos = 0;

    skipWhitespace(json, pos);
    if (pos >= json.size() || json[pos] != '{') {
        malformed("expected object", pos);
    }
    pos++;

    skipWhitespace(json, pos);
    if (pos < json.size() && json[pos] == '}') {
        pos++;
    } else {
        while (true) {
            skipWhitespace(json, pos);
            if (pos >= json.size() || json[pos] != '"') {
                malformed("expected key", pos);
            }
            std::string key = readString(json, pos);

            skipWhitespace(json, pos);
            if (pos >= json.size() || json[pos] != ':') {
                malformed("expected ':'", pos);
            }
            pos++;
            skipWhitespace(json, pos);

            std::string value;
            if (pos < json.size() && json[pos] == '"') {
                value = readString(json, pos);
            } else {
                value = readRawValue(json, pos);
            }
            result[key] = value;

            skipWhitespace(json, pos);
            if (pos < json.size() && json[pos] == ',') {
                pos++;
                continue;
            }
            if (pos < json.size() && json[pos] == '}') {
                pos++;
                break;
            }
            malformed("expected ',' or '}'", pos);
        }
    }

    skipWhitespace(json, pos);
    if (pos != json.size()) {
        malformed("trailing characters", pos);
    }
    return result;
}

std::vector<std::string> JsonParser::parseStringArray(const std::string& json) {
    std::vector<std::string> result;
    size_t pos = 0;

    skipWhitespace(json, pos);
    if (pos >= json.size() || json[pos] != '[') {
        malformed("expected array", pos);
    }
    pos++;

    skipWhitespace(json, pos);
    if (pos < json.size() && json[pos] == ']') {
        return result;
    }

    while (pos < json.size()) {
        skipWhitespace(json, pos);
        if (pos < json.size() && json[pos] == '"') {
            result.push_back(readString(json, pos));
        } else {
            result.push_back(readRawValue(json, pos));
        }

        skipWhitespace(json, pos);
        if (pos < json.size() && json[pos] == ',') {
            pos++;
            continue;
        }
        if (pos < json.size() && json[pos] == ']') {
            return result;
        }
        break;
    }
    malformed("expected ',' or ']'", pos);
}

bool JsonParser::looksLikeObject(const std::string& json) {
    size_t pos = 0;
    skipWhitespace(json, pos);
    return pos < json.size() && json[pos] == '{';
}

std::string JsonParser::stringify(const std::map<std::string, std::string>& data) {
    std::ostringstream oss;
    oss << "{";
    
    bool first = true;
    for (const auto& pair : data) {
        if (!first) oss << ",";
        first = false;
        oss << quote(pair.first) << ":" << quote(pair.second);
    }
    
    oss << "}";
    return oss.str();
}

std::string JsonParser::stringifyStringArray(const std::vector<std::string>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) oss << ",";
        oss << quote(values[i]);
    }
    oss << "]";
    return oss.str();
}

std::string JsonParser::quote(const std::string& str) {
    return "\"" + escapeJson(str) + "\"";
}

std::string JsonParser::escapeJson(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    result += hex.str();
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

std::string JsonParser::unescapeJson(const std::string& str) {
    std::string result;
    for (size_t i = 0; i < str.length();) {
        if (str[i] == '\\') {
            appendEscapedChar(str, i, result);
            continue;
        }
        result += str[i];
        i++;
    }
    return result;
}

} // namespace wordbase
