#ifndef WORDBASE_USER_FIELDS_HPP
#define WORDBASE_USER_FIELDS_HPP

#include <string>
#include <vector>

namespace wordbase {

// Single user or profile columns that can be read or updated one at a time
enum class UserField {
    Username,
    Language,
    Fluency,
    Topics,
    Nickname,
    Email,
    Birthday,
    Dating,
    Gender,
    Intro
};

/**
 * Static description of one field. Every identifier in here is a compile-time
 * constant; the per-field statements are built from this table when a
 * connection is prepared and only ever receive values as bound parameters.
 *
 * select_expr renders the column as text (topics as a JSON array, birthday
 * as YYYY-MM-DD). param_cast is appended to $1 in the UPDATE.
 */
struct UserFieldInfo {
    UserField field;
    const char* name;
    const char* table;
    const char* column;
    const char* select_expr;
    const char* param_cast;
};

const std::vector<UserFieldInfo>& allUserFields();
const UserFieldInfo& userFieldInfo(UserField field);

// Accepts the field names plus "about" for intro; throws ValidationError otherwise
UserField userFieldFromString(const std::string& name);
const char* userFieldToString(UserField field);

std::string userFieldGetStatement(UserField field);
std::string userFieldSetStatement(UserField field);
std::string buildUserFieldSelect(const UserFieldInfo& info);
std::string buildUserFieldUpdate(const UserFieldInfo& info);

} // namespace wordbase

#endif // WORDBASE_USER_FIELDS_HPP
