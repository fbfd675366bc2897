#include <catch2/catch.hpp>
#include "domain/learning_state.hpp"
#include "utils/errors.hpp"
#include <cstdlib>
#include <string>

using namespace wordbase;
using std::chrono::hours;
using std::chrono::seconds;

TEST_CASE("ladder has a ceiling and a floor", "[learning_state]") {
    CHECK(nextState(WordState::Learned, true) == WordState::Learned);
    CHECK(nextState(WordState::New, false) == WordState::New);
}

TEST_CASE("four correct answers climb the whole ladder", "[learning_state]") {
    WordState state = WordState::New;
    state = nextState(state, true);
    CHECK(state == WordState::Repeated);
    state = nextState(state, true);
    CHECK(state == WordState::Reinforced);
    state = nextState(state, true);
    CHECK(state == WordState::Learned);
    state = nextState(state, true);
    CHECK(state == WordState::Learned);
}

TEST_CASE("four wrong answers walk back down to NEW", "[learning_state]") {
    WordState state = WordState::Learned;
    state = nextState(state, false);
    CHECK(state == WordState::Reinforced);
    state = nextState(state, false);
    CHECK(state == WordState::Repeated);
    state = nextState(state, false);
    CHECK(state == WordState::New);
    state = nextState(state, false);
    CHECK(state == WordState::New);
}

TEST_CASE("a transition never skips a rung", "[learning_state]") {
    for (WordState s : {WordState::New, WordState::Repeated, WordState::Reinforced, WordState::Learned}) {
        for (bool correct : {true, false}) {
            const int from = static_cast<int>(s);
            const int to = static_cast<int>(nextState(s, correct));
            CHECK(std::abs(to - from) <= 1);
            if (correct) {
                CHECK(to >= from);
            } else {
                CHECK(to <= from);
            }
        }
    }
}

TEST_CASE("review thresholds per state", "[learning_state]") {
    CHECK(reviewThreshold(WordState::New) == hours(24));
    CHECK(reviewThreshold(WordState::Repeated) == hours(24 * 5));
    CHECK(reviewThreshold(WordState::Reinforced) == hours(24 * 14));
    CHECK_FALSE(reviewThreshold(WordState::Learned).has_value());
}

TEST_CASE("due boundary is inclusive", "[learning_state]") {
    const TimePoint now = fromUnixSeconds(1700000000);

    SECTION("NEW at one day") {
        CHECK_FALSE(isDueForReview(WordState::New, now - hours(24) + seconds(1), now));
        CHECK(isDueForReview(WordState::New, now - hours(24), now));
        CHECK(isDueForReview(WordState::New, now - hours(30), now));
    }
    SECTION("REPEATED at five days") {
        CHECK_FALSE(isDueForReview(WordState::Repeated, now - hours(24 * 5) + seconds(1), now));
        CHECK(isDueForReview(WordState::Repeated, now - hours(24 * 5), now));
    }
    SECTION("REINFORCED at fourteen days") {
        CHECK_FALSE(isDueForReview(WordState::Reinforced, now - hours(24 * 14) + seconds(1), now));
        CHECK(isDueForReview(WordState::Reinforced, now - hours(24 * 14), now));
    }
    SECTION("LEARNED is never due") {
        CHECK_FALSE(isDueForReview(WordState::Learned, now - hours(24 * 3650), now));
    }
}

TEST_CASE("word state names round trip", "[learning_state]") {
    for (WordState s : {WordState::New, WordState::Repeated, WordState::Reinforced, WordState::Learned}) {
        CHECK(wordStateFromString(wordStateToString(s)) == s);
    }
    CHECK(std::string(wordStateToString(WordState::Reinforced)) == "REINFORCED");
    CHECK_THROWS_AS(wordStateFromString("FORGOTTEN"), ValidationError);
    CHECK_THROWS_AS(wordStateFromString("new"), ValidationError);
}
