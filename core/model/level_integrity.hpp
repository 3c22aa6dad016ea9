#pragma once

#include "model/puzzle_state.hpp"
#include <string>
#include <vector>

namespace decanter {

/// Result of a single integrity check.
struct IntegrityCheck {
    bool passed = false;
    std::string check_name;
    std::string message;
    int bottle_index = -1;  // -1 = state-level
};

/// Level Integrity: validates that a state is a well-formed puzzle.
/// Checks bottle shape, that every color volume fits some normal bottle
/// exactly, and that sinks only ever hold a single color.
class LevelIntegrity {
public:
    static std::vector<IntegrityCheck> check(const PuzzleState& state);

    /// True if every check passed.
    static bool isValid(const PuzzleState& state);

    /// Throws std::runtime_error naming the first failed check.
    static void validateOrThrow(const PuzzleState& state);

    /// First failure message, or empty if the state is valid.
    static std::string firstFailure(const PuzzleState& state);
};

} // namespace decanter
