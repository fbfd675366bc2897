#ifndef WORDBASE_ENVELOPE_HPP
#define WORDBASE_ENVELOPE_HPP

#include <map>
#include <optional>
#include <string>

namespace wordbase {

enum class Purpose {
    AddUser,
    AddProfile,
    AddLocation,
    AddWord,
    CreatePayment
};

const char* purposeToString(Purpose purpose);
std::optional<Purpose> purposeFromString(const std::string& tag);

// Envelope member carrying the payload for this purpose ("user", "word", ...)
const char* payloadKey(Purpose purpose);

/**
 * Decoded message body: {"purpose": <tag>, "<payload-key>": <payload>}.
 * members holds every top-level member as text; a payload given as a JSON
 * string is unescaped, one given as an inline object is kept as raw JSON.
 */
struct Envelope {
    std::string purpose;
    std::map<std::string, std::string> members;

    std::optional<std::string> member(const std::string& key) const;
};

// Throws ValidationError when the body is not an object or has no string purpose
Envelope decodeEnvelope(const std::string& body);

// The payload JSON is embedded as a string value under payload_key
std::string encodeEnvelope(const std::string& purpose,
                           const std::string& payload_key,
                           const std::string& payload_json);

} // namespace wordbase

#endif // WORDBASE_ENVELOPE_HPP
