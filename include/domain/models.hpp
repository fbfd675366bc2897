#ifndef WORDBASE_MODELS_HPP
#define WORDBASE_MODELS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "domain/learning_state.hpp"
#include "utils/time_utils.hpp"

namespace wordbase {

struct User {
    int64_t user_id = 0;
    std::string username;
    std::string first_name;
    std::string source;       // "camefrom" on the wire
    std::string language;
    int fluency = 0;
    std::vector<std::string> topics;
    std::string lang_code;
    bool is_active = true;
    bool blocked = false;
    std::optional<TimePoint> last_notified;
};

struct Profile {
    int64_t user_id = 0;
    std::string nickname;
    std::string email;
    std::string birthday;     // YYYY-MM-DD
    std::string gender;
    std::string intro;
    bool dating = false;
    std::string status = "rookie";
};

struct UserInfo {
    User user;
    std::optional<Profile> profile;
};

struct Location {
    int64_t user_id = 0;
    std::optional<std::string> latitude;
    std::optional<std::string> longitude;
    std::optional<std::string> city;
    std::optional<std::string> country;
    std::optional<std::string> timezone;
};

struct Translation {
    std::string translation;
    std::string part_of_speech;
};

// Input of the add-word operation
struct NewWord {
    int64_t user_id = 0;
    std::string word;
    bool is_public = false;
    std::vector<Translation> translations;
    std::optional<std::string> context;
    std::optional<std::string> audio_url;
};

struct Word {
    int64_t id = 0;
    int64_t user_id = 0;
    std::optional<std::string> nickname;
    std::string word;
    bool is_public = false;
    WordState state = WordState::New;
    TimePoint created_at;
    std::optional<std::string> context;
    std::optional<std::string> audio_url;
    std::vector<Translation> translations;
};

// A public word as seen by other users searching for it
struct PublicWord {
    int64_t word_id = 0;
    int64_t user_id = 0;
    std::string nickname;
    std::string word;
    TimePoint created_at;
    std::vector<Translation> translations;
};

struct Payment {
    int64_t user_id = 0;
    std::string amount;       // decimal text, e.g. "199.00"
    std::string period;
    bool trial = false;
    bool is_active = true;
    TimePoint until;
    std::string currency = "RUB";
};

struct WordStats {
    int64_t nouns = 0;
    int64_t verbs = 0;
    int64_t adjectives = 0;
    int64_t adverbs = 0;
    int64_t others = 0;

    int64_t total() const { return nouns + verbs + adjectives + adverbs + others; }
};

struct DueWords {
    int64_t user_id = 0;
    std::vector<std::string> words;
};

struct NotificationTarget {
    int64_t user_id = 0;
    TimePoint last_notified;
};

} // namespace wordbase

#endif // WORDBASE_MODELS_HPP
