#include "database/user_fields.hpp"
#include "utils/errors.hpp"

namespace wordbase {

const std::vector<UserFieldInfo>& allUserFields() {
    static const std::vector<UserFieldInfo> fields = {
        {UserField::Username, "username", "users", "username", "username", "::varchar"},
        {UserField::Language, "language", "users", "language", "language", "::varchar"},
        {UserField::Fluency, "fluency", "users", "fluency", "fluency::text", "::smallint"},
        {UserField::Topics, "topics", "users", "topics", "array_to_json(topics)::text", "::text[]"},
        {UserField::Nickname, "nickname", "profiles", "nickname", "nickname", "::varchar"},
        {UserField::Email, "email", "profiles", "email", "email", "::varchar"},
        {UserField::Birthday, "birthday", "profiles", "birthday", "to_char(birthday, 'YYYY-MM-DD')", "::date"},
        {UserField::Dating, "dating", "profiles", "dating", "dating::text", "::boolean"},
        {UserField::Gender, "gender", "profiles", "gender", "gender", "::varchar"},
        {UserField::Intro, "intro", "profiles", "intro", "intro", "::text"},
    };
    return fields;
}

const UserFieldInfo& userFieldInfo(UserField field) {
    for (const auto& info : allUserFields()) {
        if (info.field == field) {
            return info;
        }
    }
    throw ValidationError("Unknown user field");
}

UserField userFieldFromString(const std::string& name) {
    if (name == "about") {
        return UserField::Intro;
    }
    for (const auto& info : allUserFields()) {
        if (name == info.name) {
            return info.field;
        }
    }
    throw ValidationError("Unknown user field: " + name);
}

const char* userFieldToString(UserField field) {
    return userFieldInfo(field).name;
}

std::string userFieldGetStatement(UserField field) {
    return std::string("get_field_") + userFieldInfo(field).name;
}

std::string userFieldSetStatement(UserField field) {
    return std::string("set_field_") + userFieldInfo(field).name;
}

std::string buildUserFieldSelect(const UserFieldInfo& info) {
    return std::string("SELECT ") + info.select_expr + " FROM " + info.table + " WHERE user_id = $1";
}

std::string buildUserFieldUpdate(const UserFieldInfo& info) {
    return std::string("UPDATE ") + info.table + " SET " + info.column + " = $2" + info.param_cast +
           " WHERE user_id = $1";
}

} // namespace wordbase
