#ifndef WORDBASE_LEARNING_STATE_HPP
#define WORDBASE_LEARNING_STATE_HPP

#include <chrono>
#include <optional>
#include <string>
#include "utils/time_utils.hpp"

namespace wordbase {

// Review ladder, lowest rung first
enum class WordState {
    New,
    Repeated,
    Reinforced,
    Learned
};

/**
 * One step up the ladder on a correct answer, one step down on a wrong one.
 * LEARNED is the ceiling and NEW the floor; both are fixed points.
 */
WordState nextState(WordState state, bool correct);

// Minimum age before a word in this state is due again; empty for LEARNED
std::optional<std::chrono::hours> reviewThreshold(WordState state);

// now - created_at >= threshold, never for LEARNED
bool isDueForReview(WordState state, TimePoint created_at, TimePoint now);

const char* wordStateToString(WordState state);
// Throws ValidationError for anything but NEW/REPEATED/REINFORCED/LEARNED
WordState wordStateFromString(const std::string& value);

} // namespace wordbase

#endif // WORDBASE_LEARNING_STATE_HPP
