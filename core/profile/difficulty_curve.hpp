#pragma once

namespace decanter {

/// Inclusive range of optimal solution lengths a level may be built with.
struct OptimalWindow {
    int min_moves = 0;
    int max_moves = 0;

    bool empty() const { return min_moves > max_moves; }
    bool contains(int moves) const { return moves >= min_moves && moves <= max_moves; }
};

// ─── Difficulty Curve ──────────────────────────────────────────
// Level-indexed targets that make a run of levels get harder.
//
// A level's optimal length must fall in [target(L), target(L + 1)].
// Consecutive windows only touch at their edges, so every sequence of
// accepted levels has non-decreasing optimal lengths, whatever seed
// each level was generated from. Both curves rise linearly up to
// kPlateauLevel and stay flat beyond it.

class DifficultyCurve {
public:
    static constexpr int kPlateauLevel = 100;
    static constexpr int kFirstTargetMoves = 3;
    static constexpr int kPlateauTargetMoves = 10;
    static constexpr int kFirstTargetDifficulty = 20;
    static constexpr int kPlateauTargetDifficulty = 60;

    /// Throws std::invalid_argument for level_index < 1.
    static int targetOptimalMoves(int level_index);
    static OptimalWindow optimalWindow(int level_index);

    /// Intrinsic difficulty the generator steers toward.
    static int targetDifficulty(int level_index);

    /// Intrinsic difficulty clamped into [targetDifficulty(L), targetDifficulty(L + 1)].
    /// Non-decreasing in the level for any pair of instances.
    static int difficultyRating(int intrinsic_difficulty, int level_index);
};

} // namespace decanter
