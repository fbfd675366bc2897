#include "domain/learning_state.hpp"
#include "utils/errors.hpp"

namespace wordbase {

WordState nextState(WordState state, bool correct) {
    if (correct) {
        switch (state) {
            case WordState::New: return WordState::Repeated;
            case WordState::Repeated: return WordState::Reinforced;
            case WordState::Reinforced: return WordState::Learned;
            case WordState::Learned: return WordState::Learned;
        }
    } else {
        switch (state) {
            case WordState::New: return WordState::New;
            case WordState::Repeated: return WordState::New;
            case WordState::Reinforced: return WordState::Repeated;
            case WordState::Learned: return WordState::Reinforced;
        }
    }
    return state;
}

std::optional<std::chrono::hours> reviewThreshold(WordState state) {
    switch (state) {
        case WordState::New: return std::chrono::hours(24);
        case WordState::Repeated: return std::chrono::hours(24 * 5);
        case WordState::Reinforced: return std::chrono::hours(24 * 14);
        case WordState::Learned: return std::nullopt;
    }
    return std::nullopt;
}

bool isDueForReview(WordState state, TimePoint created_at, TimePoint now) {
    const auto threshold = reviewThreshold(state);
    if (!threshold) {
        return false;
    }
    return now - created_at >= *threshold;
}

const char* wordStateToString(WordState state) {
    switch (state) {
        case WordState::New: return "NEW";
        case WordState::Repeated: return "REPEATED";
        case WordState::Reinforced: return "REINFORCED";
        case WordState::Learned: return "LEARNED";
    }
    return "NEW";
}

WordState wordStateFromString(const std::string& value) {
    if (value == "NEW") return WordState::New;
    if (value == "REPEATED") return WordState::Repeated;
    if (value == "REINFORCED") return WordState::Reinforced;
    if (value == "LEARNED") return WordState::Learned;
    throw ValidationError("Unknown word state: " + value);
}

} // namespace wordbase
