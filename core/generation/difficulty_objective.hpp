#pragma once

#include "metrics/level_metrics.hpp"

namespace decanter {

// ─── Objective Weights ─────────────────────────────────────────

struct ObjectiveWeights {
    double branching    = 0.25;  // (ABF - 1) / 2, clamped
    double trap         = 0.30;  // trap score
    double decision     = 0.20;  // 1 / (1 + decision depth)
    double multiplicity = 0.15;  // (multiplicity - 1) / 2, clamped
    double empty_usage  = 0.10;  // 1 - empty-bottle usage
    double open_choice  = 0.15;  // 1 - forced-move ratio
};

// ─── Difficulty Objective ──────────────────────────────────────
// Scalar breaking ties between candidates equally near the level's
// difficulty target. Higher is more interesting to play.

class DifficultyObjective {
public:
    explicit DifficultyObjective(ObjectiveWeights weights = {}) : weights_(weights) {}

    double score(const LevelMetrics& metrics) const;

    /// Player-facing difficulty in [1, 100]: solution length (40),
    /// branching (25), trap risk squared (20), choice frequency (10),
    /// solution uniqueness (5).
    static int intrinsicDifficulty100(const LevelMetrics& metrics, int optimal_moves);

    const ObjectiveWeights& weights() const { return weights_; }

private:
    ObjectiveWeights weights_;
};

} // namespace decanter
