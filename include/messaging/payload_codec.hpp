#ifndef WORDBASE_PAYLOAD_CODEC_HPP
#define WORDBASE_PAYLOAD_CODEC_HPP

#include <string>
#include "domain/models.hpp"

namespace wordbase {

/**
 * JSON payloads carried inside envelopes.
 *
 * Decoders throw ValidationError on a missing required member or a value of
 * the wrong shape. A member holding JSON null counts as absent.
 */

// user_id, username, first_name, camefrom (or source), language, fluency, topics[], lang_code
User decodeUser(const std::string& json);
// user_id, nickname, email, birthday, gender?, intro?, dating?, status?
Profile decodeProfile(const std::string& json);
// user_id, latitude?, longitude?, city?, country?, tzone (or timezone)?
Location decodeLocation(const std::string& json);
// user_id, word, is_public?, translations? {translation: part_of_speech}, context?, audio?
NewWord decodeWord(const std::string& json);
// user_id, amount, period, trial?, is_active?, until (ISO 8601), currency?
Payment decodePayment(const std::string& json);

std::string encodeUser(const User& user);
std::string encodeProfile(const Profile& profile);
std::string encodeLocation(const Location& location);
std::string encodeWord(const NewWord& word);
std::string encodePayment(const Payment& payment);

} // namespace wordbase

#endif // WORDBASE_PAYLOAD_CODEC_HPP
