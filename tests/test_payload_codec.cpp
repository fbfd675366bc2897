#include <catch2/catch.hpp>
#include "messaging/payload_codec.hpp"
#include "utils/errors.hpp"

using namespace wordbase;

TEST_CASE("user payload uses camefrom for the source", "[payload]") {
    const User user = decodeUser(R"({"user_id": 1, "username": "a", "first_name": "A", "camefrom": "x",
                                     "language": "en", "fluency": 1, "topics": ["t"], "lang_code": "en"})");
    CHECK(user.user_id == 1);
    CHECK(user.username == "a");
    CHECK(user.first_name == "A");
    CHECK(user.source == "x");
    CHECK(user.language == "en");
    CHECK(user.fluency == 1);
    CHECK(user.topics == std::vector<std::string>{"t"});
    CHECK(user.lang_code == "en");
}

TEST_CASE("user payload accepts source and a null username", "[payload]") {
    const User user = decodeUser(R"({"user_id": 9, "username": null, "first_name": "B", "source": "ads",
                                     "language": "de", "fluency": 3, "lang_code": "de"})");
    CHECK(user.username.empty());
    CHECK(user.source == "ads");
    CHECK(user.topics.empty());
}

TEST_CASE("user payload validation", "[payload]") {
    CHECK_THROWS_AS(decodeUser(R"({"first_name": "A"})"), ValidationError);
    CHECK_THROWS_AS(decodeUser(R"({"user_id": "abc", "first_name": "A", "language": "en",
                                   "fluency": 1, "lang_code": "en"})"), ValidationError);
    CHECK_THROWS_AS(decodeUser(R"({"user_id": 1, "first_name": "A", "language": "en",
                                   "fluency": "high", "lang_code": "en"})"), ValidationError);
    CHECK_THROWS_AS(decodeUser(R"("just a string")"), ValidationError);
}

TEST_CASE("profile defaults", "[payload]") {
    const Profile profile = decodeProfile(R"({"user_id": 5, "nickname": "nick", "email": "n@x.io",
                                             "birthday": "03.01.2002"})");
    CHECK(profile.nickname == "nick");
    CHECK(profile.birthday == "03.01.2002");
    CHECK_FALSE(profile.dating);
    CHECK(profile.status == "rookie");
    CHECK(profile.gender.empty());

    const Profile dated = decodeProfile(R"({"user_id": 5, "nickname": "nick", "email": "n@x.io",
                                           "birthday": "2002-01-03", "dating": true, "status": "pro",
                                           "about": "hi"})");
    CHECK(dated.dating);
    CHECK(dated.status == "pro");
    CHECK(dated.intro == "hi");
}

TEST_CASE("location fields are optional and tzone maps to timezone", "[payload]") {
    const Location location = decodeLocation(R"({"user_id": 4, "city": "Kazan", "tzone": "Europe/Moscow",
                                                "latitude": null})");
    CHECK(location.user_id == 4);
    CHECK(location.city == std::string("Kazan"));
    CHECK(location.timezone == std::string("Europe/Moscow"));
    CHECK_FALSE(location.latitude.has_value());
    CHECK_FALSE(location.country.has_value());
}

TEST_CASE("word payload with translations", "[payload]") {
    const NewWord word = decodeWord(R"({"user_id": 2, "word": "run", "is_public": true,
                                       "translations": {"бежать": "verb", "пробежка": "noun"},
                                       "context": "I run daily", "audio": "https://a/run.ogg"})");
    CHECK(word.user_id == 2);
    CHECK(word.word == "run");
    CHECK(word.is_public);
    REQUIRE(word.translations.size() == 2);
    CHECK(word.context == std::string("I run daily"));
    CHECK(word.audio_url == std::string("https://a/run.ogg"));

    bool has_verb = false;
    for (const auto& t : word.translations) {
        if (t.part_of_speech == "verb") has_verb = true;
    }
    CHECK(has_verb);
}

TEST_CASE("payment payload parses until", "[payload]") {
    const Payment payment = decodePayment(R"({"user_id": 1, "amount": 499.00, "period": "month",
                                             "until": "2024-01-01T00:00:00Z"})");
    CHECK(payment.amount == "499.00");
    CHECK(payment.period == "month");
    CHECK_FALSE(payment.trial);
    CHECK(payment.is_active);
    CHECK(payment.currency == "RUB");
    CHECK(toUnixSeconds(payment.until) == 1704067200);

    CHECK_THROWS_AS(decodePayment(R"({"user_id": 1, "amount": "1", "period": "m", "until": "soon"})"),
                    ValidationError);
    CHECK_THROWS_AS(decodePayment(R"({"user_id": 1, "amount": "1", "period": "m"})"), ValidationError);
}

TEST_CASE("encoders produce payloads the decoders accept", "[payload]") {
    User user;
    user.user_id = 77;
    user.username = "u\"q";
    user.first_name = "F";
    user.source = "site";
    user.language = "en";
    user.fluency = 2;
    user.topics = {"a", "b"};
    user.lang_code = "en";
    const User back = decodeUser(encodeUser(user));
    CHECK(back.username == user.username);
    CHECK(back.source == "site");
    CHECK(back.topics == user.topics);

    Payment payment;
    payment.user_id = 77;
    payment.amount = "10.50";
    payment.period = "week";
    payment.trial = true;
    payment.until = fromUnixSeconds(1704067200);
    const Payment decoded = decodePayment(encodePayment(payment));
    CHECK(decoded.trial);
    CHECK(decoded.until == payment.until);

    Location location;
    location.user_id = 3;
    location.timezone = "UTC";
    const Location loc = decodeLocation(encodeLocation(location));
    CHECK(loc.timezone == std::string("UTC"));
    CHECK_FALSE(loc.city.has_value());
}
