#include "messaging/envelope.hpp"
#include "utils/errors.hpp"
#include "utils/json_parser.hpp"

namespace wordbase {

const char* purposeToString(Purpose purpose) {
    switch (purpose) {
        case Purpose::AddUser: return "ADD_USER";
        case Purpose::AddProfile: return "ADD_PROFILE";
        case Purpose::AddLocation: return "ADD_LOCATION";
        case Purpose::AddWord: return "ADD_WORD";
        case Purpose::CreatePayment: return "CREATE_PAYMENT_PURPOSE";
    }
    return "";
}

std::optional<Purpose> purposeFromString(const std::string& tag) {
    for (Purpose p : {Purpose::AddUser, Purpose::AddProfile, Purpose::AddLocation,
                      Purpose::AddWord, Purpose::CreatePayment}) {
        if (tag == purposeToString(p)) {
            return p;
        }
    }
    return std::nullopt;
}

const char* payloadKey(Purpose purpose) {
    switch (purpose) {
        case Purpose::AddUser: return "user";
        case Purpose::AddProfile: return "profile";
        case Purpose::AddLocation: return "location";
        case Purpose::AddWord: return "word";
        case Purpose::CreatePayment: return "payment";
    }
    return "";
}

std::optional<std::string> Envelope::member(const std::string& key) const {
    auto it = members.find(key);
    if (it == members.end()) {
        return std::nullopt;
    }
    return it->second;
}

Envelope decodeEnvelope(const std::string& body) {
    if (!JsonParser::looksLikeObject(body)) {
        throw ValidationError("Message body is not a JSON object");
    }

    Envelope envelope;
    envelope.members = JsonParser::parse(body);

    auto it = envelope.members.find("purpose");
    if (it == envelope.members.end() || it->second.empty() || it->second == "null") {
        throw ValidationError("Message has no purpose");
    }
    envelope.purpose = it->second;
    return envelope;
}

std::string encodeEnvelope(const std::string& purpose,
                           const std::string& payload_key,
                           const std::string& payload_json) {
    return "{" + JsonParser::quote("purpose") + ":" + JsonParser::quote(purpose) + "," +
           JsonParser::quote(payload_key) + ":" + JsonParser::quote(payload_json) + "}";
}

} // namespace wordbase
