#pragma once

#include "metrics/level_metrics.hpp"
#include "model/puzzle_state.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace decanter {

/// How an accepted instance was produced and what it measured.
struct GenerationReport {
    int level_index = 0;
    uint64_t seed = 0;
    int attempts = 0;                   // attempts started, fallback included
    int candidates_evaluated = 0;
    LevelMetrics metrics;
    int optimal_moves = -1;
    int moves_allowed = 0;
    int scramble_moves = 0;
    double total_millis = 0.0;
    double solver_millis = 0.0;
    double metrics_millis = 0.0;
    double objective_score = 0.0;
    int intrinsic_difficulty = 0;       // 1..100
    int target_difficulty = 0;          // curve target the selection steered to
    int difficulty_rating = 0;          // intrinsic clamped onto the level curve
    int min_optimal_moves = 0;          // optimal-length window of the level
    int max_optimal_moves = 0;
    bool quality_gates_applied = true;  // false = accepted by the relaxed fallback
    std::string last_rejection_reason;
};

/// Generator outcome. `state` is empty when every attempt, the relaxed
/// fallback included, was rejected.
struct GenerationResult {
    std::optional<PuzzleState> state;
    GenerationReport report;
    std::string failure_reason;

    bool ok() const { return state.has_value(); }
};

} // namespace decanter
