#pragma once

namespace decanter {

// ─── Level Metrics ─────────────────────────────────────────────
// Decision-density measurements of one generated instance, taken
// along its optimal path, plus structural counts of the start state.

struct LevelMetrics {
    double forced_move_ratio        = 1.0;  // path states with exactly one move
    double average_branching_factor = 1.0;  // mean legal moves per path state
    int    decision_depth           = 0;    // steps before the first real choice
    double empty_bottle_usage_ratio = 0.0;  // path moves poured into an empty bottle
    double trap_score               = 0.0;  // sampled deviations that cost moves
    int    solution_multiplicity    = 1;    // distinct near-optimal solutions, capped

    int mixed_bottle_count          = 0;    // bottles holding more than one color
    int distinct_signature_count    = 0;    // distinct bottle signatures
    int top_color_variety           = 0;    // distinct top colors

    bool time_truncated             = false; // a time cap cut sampling short
};

/// Budgets and sample sizes for the metrics computer.
/// Node caps bound the work and keep results reproducible; the time caps
/// are a safety net for slow hosts and only bind when those would overrun.
struct MetricsConfig {
    int max_millis = 80;                    // Deadline for one compute() call
    int trap_sample_count = 8;              // Max deviating root moves sampled
    int trap_max_nodes = 500;               // Solver budget per trap sample
    int trap_max_millis = 8;
    int multiplicity_cap = 3;               // Stop counting solutions here
    int multiplicity_margin = 1;            // Accept solutions up to optimal + margin
    int multiplicity_max_nodes = 1200;      // States expanded while counting
    int multiplicity_max_millis = 40;
};

} // namespace decanter
