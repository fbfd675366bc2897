#include <catch2/catch.hpp>
#include "database/user_fields.hpp"
#include "utils/errors.hpp"
#include <set>

using namespace wordbase;

TEST_CASE("field names map to fields", "[user_fields]") {
    CHECK(userFieldFromString("username") == UserField::Username);
    CHECK(userFieldFromString("topics") == UserField::Topics);
    CHECK(userFieldFromString("birthday") == UserField::Birthday);
    CHECK(userFieldFromString("intro") == UserField::Intro);
    CHECK(userFieldFromString("about") == UserField::Intro);
    CHECK(std::string(userFieldToString(UserField::Dating)) == "dating");
}

TEST_CASE("unknown field names are rejected", "[user_fields]") {
    CHECK_THROWS_AS(userFieldFromString("password"), ValidationError);
    CHECK_THROWS_AS(userFieldFromString("users; DROP TABLE users"), ValidationError);
    CHECK_THROWS_AS(userFieldFromString(""), ValidationError);
    CHECK_THROWS_AS(userFieldFromString("Username"), ValidationError);
}

TEST_CASE("every field has its own statements", "[user_fields]") {
    std::set<std::string> names;
    for (const auto& info : allUserFields()) {
        names.insert(userFieldGetStatement(info.field));
        names.insert(userFieldSetStatement(info.field));
    }
    CHECK(names.size() == allUserFields().size() * 2);
    CHECK(userFieldGetStatement(UserField::Email) == "get_field_email");
    CHECK(userFieldSetStatement(UserField::Fluency) == "set_field_fluency");
}

TEST_CASE("field statements bind values as parameters", "[user_fields]") {
    CHECK(buildUserFieldSelect(userFieldInfo(UserField::Nickname)) ==
          "SELECT nickname FROM profiles WHERE user_id = $1");
    CHECK(buildUserFieldSelect(userFieldInfo(UserField::Topics)) ==
          "SELECT array_to_json(topics)::text FROM users WHERE user_id = $1");
    CHECK(buildUserFieldUpdate(userFieldInfo(UserField::Birthday)) ==
          "UPDATE profiles SET birthday = $2::date WHERE user_id = $1");
    CHECK(buildUserFieldUpdate(userFieldInfo(UserField::Topics)) ==
          "UPDATE users SET topics = $2::text[] WHERE user_id = $1");
}
