#include <catch2/catch.hpp>
#include "messaging/dispatch_registry.hpp"
#include "utils/errors.hpp"

using namespace wordbase;

namespace {

PurposeRoute route(const std::string& tag, const std::string& key, int* calls) {
    return PurposeRoute{tag, key, [calls](const std::string&) { ++*calls; }};
}

} // namespace

TEST_CASE("routes are found by tag", "[dispatch]") {
    int user_calls = 0;
    int word_calls = 0;
    DispatchRegistry registry(std::vector<PurposeRoute>{route("ADD_WORD", "word", &word_calls),
                                                        route("ADD_USER", "user", &user_calls)});

    CHECK(registry.size() == 2);
    CHECK(registry.contains("ADD_USER"));
    CHECK_FALSE(registry.contains("ADD_PROFILE"));
    CHECK(registry.find("NOT_A_REAL_PURPOSE") == nullptr);
    CHECK(registry.tags() == std::vector<std::string>{"ADD_USER", "ADD_WORD"});

    const PurposeRoute* found = registry.find("ADD_WORD");
    REQUIRE(found != nullptr);
    CHECK(found->payload_key == "word");
    found->handler("{}");
    CHECK(word_calls == 1);
    CHECK(user_calls == 0);
}

TEST_CASE("a tag registered twice is a configuration error", "[dispatch]") {
    int calls = 0;
    std::vector<PurposeRoute> routes{route("ADD_USER", "user", &calls), route("ADD_USER", "profile", &calls)};
    CHECK_THROWS_AS(DispatchRegistry(std::move(routes)), ConfigurationError);
}

TEST_CASE("routes need a tag and a handler", "[dispatch]") {
    int calls = 0;
    std::vector<PurposeRoute> untagged{route("", "user", &calls)};
    CHECK_THROWS_AS(DispatchRegistry(std::move(untagged)), ConfigurationError);

    std::vector<PurposeRoute> unhandled{PurposeRoute{"ADD_USER", "user", PurposeHandler()}};
    CHECK_THROWS_AS(DispatchRegistry(std::move(unhandled)), ConfigurationError);
}

TEST_CASE("an empty registry routes nothing", "[dispatch]") {
    DispatchRegistry registry(std::vector<PurposeRoute>{});
    CHECK(registry.size() == 0);
    CHECK(registry.tags().empty());
    CHECK(registry.find("ADD_USER") == nullptr);
}
