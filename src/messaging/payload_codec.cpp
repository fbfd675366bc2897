#include "messaging/payload_codec.hpp"
#include "utils/errors.hpp"
#include "utils/json_parser.hpp"
#include <cerrno>
#include <cstdlib>
#include <map>
#include <sstream>

namespace wordbase {

namespace {

using Members = std::map<std::string, std::string>;

Members parseObject(const std::string& json, const char* what) {
    if (!JsonParser::looksLikeObject(json)) {
        throw ValidationError(std::string(what) + " payload is not a JSON object");
    }
    return JsonParser::parse(json);
}

std::optional<std::string> optionalMember(const Members& m, const char* key) {
    auto it = m.find(key);
    if (it == m.end() || it->second == "null") {
        return std::nullopt;
    }
    return it->second;
}

// First present member among the names given
std::optional<std::string> optionalMember(const Members& m, const char* key, const char* alias) {
    auto value = optionalMember(m, key);
    return value ? value : optionalMember(m, alias);
}

std::string requiredMember(const Members& m, const char* key, const char* what) {
    auto value = optionalMember(m, key);
    if (!value) {
        throw ValidationError(std::string(what) + " payload is missing '" + key + "'");
    }
    return *value;
}

int64_t toInteger(const std::string& text, const char* key) {
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || errno != 0 || end == nullptr || *end != '\0') {
        throw ValidationError(std::string("'") + key + "' is not an integer: " + text);
    }
    return static_cast<int64_t>(value);
}

bool toBoolean(const std::string& text, const char* key) {
    if (text == "true") return true;
    if (text == "false") return false;
    throw ValidationError(std::string("'") + key + "' is not a boolean: " + text);
}

bool optionalBoolean(const Members& m, const char* key, bool fallback) {
    auto value = optionalMember(m, key);
    return value ? toBoolean(*value, key) : fallback;
}

int64_t requiredUserId(const Members& m, const char* what) {
    return toInteger(requiredMember(m, "user_id", what), "user_id");
}

void writeOptional(std::ostringstream& out, const char* key, const std::optional<std::string>& value) {
    if (value) {
        out << "," << JsonParser::quote(key) << ":" << JsonParser::quote(*value);
    }
}

} // namespace

User decodeUser(const std::string& json) {
    const Members m = parseObject(json, "user");

    User user;
    user.user_id = requiredUserId(m, "user");
    user.username = optionalMember(m, "username").value_or("");
    user.first_name = requiredMember(m, "first_name", "user");
    user.source = optionalMember(m, "camefrom", "source").value_or("");
    user.language = requiredMember(m, "language", "user");
    user.fluency = static_cast<int>(toInteger(requiredMember(m, "fluency", "user"), "fluency"));
    if (auto topics = optionalMember(m, "topics")) {
        user.topics = JsonParser::parseStringArray(*topics);
    }
    user.lang_code = requiredMember(m, "lang_code", "user");
    return user;
}

Profile decodeProfile(const std::string& json) {
    const Members m = parseObject(json, "profile");

    Profile profile;
    profile.user_id = requiredUserId(m, "profile");
    profile.nickname = requiredMember(m, "nickname", "profile");
    profile.email = requiredMember(m, "email", "profile");
    profile.birthday = requiredMember(m, "birthday", "profile");
    profile.gender = optionalMember(m, "gender").value_or("");
    profile.intro = optionalMember(m, "intro", "about").value_or("");
    profile.dating = optionalBoolean(m, "dating", false);
    profile.status = optionalMember(m, "status").value_or("rookie");
    return profile;
}

Location decodeLocation(const std::string& json) {
    const Members m = parseObject(json, "location");

    Location location;
    location.user_id = requiredUserId(m, "location");
    location.latitude = optionalMember(m, "latitude");
    location.longitude = optionalMember(m, "longitude");
    location.city = optionalMember(m, "city");
    location.country = optionalMember(m, "country");
    location.timezone = optionalMember(m, "tzone", "timezone");
    return location;
}

NewWord decodeWord(const std::string& json) {
    const Members m = parseObject(json, "word");

    NewWord word;
    word.user_id = requiredUserId(m, "word");
    word.word = requiredMember(m, "word", "word");
    word.is_public = optionalBoolean(m, "is_public", false);
    if (auto translations = optionalMember(m, "translations")) {
        for (const auto& entry : parseObject(*translations, "translations")) {
            word.translations.push_back(Translation{entry.first, entry.second});
        }
    }
    word.context = optionalMember(m, "context");
    word.audio_url = optionalMember(m, "audio", "audio_url");
    return word;
}

Payment decodePayment(const std::string& json) {
    const Members m = parseObject(json, "payment");

    Payment payment;
    payment.user_id = requiredUserId(m, "payment");
    payment.amount = requiredMember(m, "amount", "payment");
    payment.period = requiredMember(m, "period", "payment");
    payment.trial = optionalBoolean(m, "trial", false);
    payment.is_active = optionalBoolean(m, "is_active", true);
    payment.currency = optionalMember(m, "currency").value_or("RUB");

    const std::string until = requiredMember(m, "until", "payment");
    const auto parsed = parseIsoTimestamp(until);
    if (!parsed) {
        throw ValidationError("'until' is not an ISO 8601 timestamp: " + until);
    }
    payment.until = *parsed;
    return payment;
}

std::string encodeUser(const User& user) {
    std::ostringstream out;
    out << "{\"user_id\":" << user.user_id
        << ",\"username\":" << JsonParser::quote(user.username)
        << ",\"first_name\":" << JsonParser::quote(user.first_name)
        << ",\"camefrom\":" << JsonParser::quote(user.source)
        << ",\"language\":" << JsonParser::quote(user.language)
        << ",\"fluency\":" << user.fluency
        << ",\"topics\":" << JsonParser::stringifyStringArray(user.topics)
        << ",\"lang_code\":" << JsonParser::quote(user.lang_code)
        << "}";
    return out.str();
}

std::string encodeProfile(const Profile& profile) {
    std::ostringstream out;
    out << "{\"user_id\":" << profile.user_id
        << ",\"nickname\":" << JsonParser::quote(profile.nickname)
        << ",\"email\":" << JsonParser::quote(profile.email)
        << ",\"birthday\":" << JsonParser::quote(profile.birthday)
        << ",\"gender\":" << JsonParser::quote(profile.gender)
        << ",\"intro\":" << JsonParser::quote(profile.intro)
        << ",\"dating\":" << (profile.dating ? "true" : "false")
        << ",\"status\":" << JsonParser::quote(profile.status)
        << "}";
    return out.str();
}

std::string encodeLocation(const Location& location) {
    std::ostringstream out;
    out << "{\"user_id\":" << location.user_id;
    writeOptional(out, "latitude", location.latitude);
    writeOptional(out, "longitude", location.longitude);
    writeOptional(out, "city", location.city);
    writeOptional(out, "country", location.country);
    writeOptional(out, "tzone", location.timezone);
    out << "}";
    return out.str();
}

std::string encodeWord(const NewWord& word) {
    std::ostringstream out;
    out << "{\"user_id\":" << word.user_id
        << ",\"word\":" << JsonParser::quote(word.word)
        << ",\"is_public\":" << (word.is_public ? "true" : "false")
        << ",\"translations\":{";
    for (size_t i = 0; i < word.translations.size(); ++i) {
        if (i > 0) out << ",";
        out << JsonParser::quote(word.translations[i].translation) << ":"
            << JsonParser::quote(word.translations[i].part_of_speech);
    }
    out << "}";
    writeOptional(out, "context", word.context);
    writeOptional(out, "audio", word.audio_url);
    out << "}";
    return out.str();
}

std::string encodePayment(const Payment& payment) {
    std::ostringstream out;
    out << "{\"user_id\":" << payment.user_id
        << ",\"amount\":" << JsonParser::quote(payment.amount)
        << ",\"period\":" << JsonParser::quote(payment.period)
        << ",\"trial\":" << (payment.trial ? "true" : "false")
        << ",\"is_active\":" << (payment.is_active ? "true" : "false")
        << ",\"until\":" << JsonParser::quote(formatIsoTimestamp(payment.until))
        << ",\"currency\":" << JsonParser::quote(payment.currency)
        << "}";
    return out.str();
}

} // namespace wordbase
