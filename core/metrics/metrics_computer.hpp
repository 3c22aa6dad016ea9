#pragma once

#include "metrics/level_metrics.hpp"
#include "model/puzzle_state.hpp"
#include "search/budget_manager.hpp"
#include "search/solver_types.hpp"

#include <vector>

namespace decanter {

/// Metrics Computer: scores a solved instance for decision density,
/// dead-end risk and solution flexibility.
///
/// Every search it runs is bounded by MetricsConfig node budgets, so the
/// counts are deterministic for a fixed state. A compute() call also runs
/// under one deadline; when a time cap binds first the result is flagged
/// with `time_truncated`.
class MetricsComputer {
public:
    explicit MetricsComputer(MetricsConfig config = {}) : config_(config) {}

    /// All metrics for `state` given its optimal path.
    /// Throws std::invalid_argument if the path does not apply to the state.
    LevelMetrics compute(const PuzzleState& state, const std::vector<Move>& optimal_path) const;

    /// Forced-move ratio, branching, decision depth and empty usage along the path.
    /// Fills only those fields of `out`.
    void computePathMetrics(const PuzzleState& state, const std::vector<Move>& path,
                            LevelMetrics& out) const;

    /// Fraction of sampled non-optimal opening moves that leave the puzzle
    /// unsolved within the trap node budget or longer than optimal.
    /// Samples cut off by a time cap are dropped rather than counted.
    double computeTrapScore(const PuzzleState& state, int optimal_moves,
                            const Move& optimal_first, bool* time_truncated = nullptr) const;

    /// Distinct move sequences reaching a win within optimal + margin, capped.
    /// Counted layer by layer with transposed states merged, so the work is
    /// bounded by distinct states rather than sequences. Never less than 1.
    int estimateSolutionMultiplicity(const PuzzleState& state, int optimal_moves,
                                     bool* time_truncated = nullptr) const;

    /// Mixed bottles, distinct signatures, top-color variety.
    static void computeStructural(const PuzzleState& state, LevelMetrics& out);

    const MetricsConfig& config() const { return config_; }

private:
    MetricsConfig config_;

    double trapScoreWithin(const PuzzleState& state, int optimal_moves, const Move& optimal_first,
                           const BudgetManager& deadline, bool& truncated) const;
    int multiplicityWithin(const PuzzleState& state, int optimal_moves,
                           const BudgetManager& deadline, bool& truncated) const;
};

} // namespace decanter
