#pragma once

#include "model/bottle.hpp"
#include "model/move.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace decanter {

// ─── Move Policy ───────────────────────────────────────────────
// Which pours an enumeration yields.
//   PLAY   - every pour the rules allow.
//   SEARCH - play pours minus relocations that only produce an
//            isomorphic state (a monochrome bottle poured whole into an
//            empty bottle of the same capacity and kind).

enum class MovePolicy {
    PLAY,
    SEARCH
};

// ─── Puzzle State ──────────────────────────────────────────────
// Bottles addressed by index plus the move counters and generation
// metadata of one puzzle instance. Copies are deep; every hypothetical
// or real move works on a copy.

struct PuzzleState {
    std::vector<Bottle> bottles;
    int moves_used = 0;
    int moves_allowed = 0;
    int optimal_moves = -1;
    int level_index = 0;
    uint64_t seed = 0;
    int scramble_moves = 0;

    PuzzleState() = default;
    explicit PuzzleState(std::vector<Bottle> bottles)
        : bottles(std::move(bottles)) {}

    int bottleCount() const { return static_cast<int>(bottles.size()); }
    bool validIndex(int index) const { return index >= 0 && index < bottleCount(); }

    /// Units the pour source -> target would move under the play rules
    /// (0 for out-of-range or equal indices).
    int pourAmount(int source, int target) const;

    /// True when the pour exists under the play rules but only relocates a
    /// monochrome bottle into an interchangeable empty one.
    bool isRelocation(int source, int target) const;

    /// Legal moves in ascending (source, target) order.
    std::vector<Move> legalMoves(MovePolicy policy = MovePolicy::PLAY,
                                 bool allow_sink_targets = true) const;

    /// Number of legal moves; avoids building the move list.
    int legalMoveCount(MovePolicy policy = MovePolicy::PLAY,
                       bool allow_sink_targets = true) const;

    bool hasLegalMove() const;

    /// Pour in place without touching the move counters.
    /// Throws std::runtime_error if the amount does not match the rules.
    void applyPour(const Move& move);

    /// Every bottle empty or monochrome, and no legal pour could empty a
    /// monochrome bottle into another bottle of the same color.
    bool isWin() const;

    /// Out of moves without having won.
    bool isFail() const { return moves_used >= moves_allowed && !isWin(); }

    /// Units per color across all bottles.
    std::map<ColorId, int> colorVolumes() const;

    std::string toString() const;
};

} // namespace decanter
