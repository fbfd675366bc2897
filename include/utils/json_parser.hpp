#ifndef WORDBASE_JSON_PARSER_HPP
#define WORDBASE_JSON_PARSER_HPP

#include <string>
#include <map>
#include <vector>

namespace wordbase {

/**
 * Minimal JSON helper for flat message payloads.
 *
 * parse() returns one entry per member of a top-level object. String members
 * are unescaped; nested objects and arrays are returned as their raw JSON
 * text so they can be parsed again; numbers, booleans and null are returned
 * as their literal text. Malformed input throws ValidationError.
 */
class JsonParser {
public:
    static std::map<std::string, std::string> parse(const std::string& json);
    static std::vector<std::string> parseStringArray(const std::string& json);
    static bool looksLikeObject(const std::string& json);

    static std::string stringify(const std::map<std::string, std::string>& data);
    static std::string stringifyStringArray(const std::vector<std::string>& values);
    static std::string quote(const std::string& str);
    static std::string escapeJson(const std::string& str);
    static std::string unescapeJson(const std::string& str);
};

} // namespace wordbase

#endif // WORDBASE_JSON_PARSER_HPP
