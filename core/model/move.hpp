#pragma once

#include <string>

namespace decanter {

/// A pour of `amount` units from bottle `source` into bottle `target`.
/// Bottles are addressed by their index in the PuzzleState.
struct Move {
    int source = -1;
    int target = -1;
    int amount = 0;

    Move() = default;
    Move(int source, int target, int amount)
        : source(source), target(target), amount(amount) {}

    bool operator==(const Move& other) const {
        return source == other.source && target == other.target &&
               amount == other.amount;
    }
    bool operator!=(const Move& other) const { return !(*this == other); }

    std::string toString() const {
        return "(" + std::to_string(source) + "," + std::to_string(target) + "," +
               std::to_string(amount) + ")";
    }
};

} // namespace decanter
