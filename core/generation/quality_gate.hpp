#pragma once

#include "metrics/level_metrics.hpp"
#include "profile/difficulty_profile.hpp"

#include <string>
#include <vector>

namespace decanter {

// ─── Quality Thresholds ────────────────────────────────────────
// Acceptance limits for one difficulty band. Ceilings tighten and
// floors rise from band A to band E.

struct QualityThresholds {
    double max_forced_move_ratio = 1.0;
    int    max_decision_depth = 1000;
    double min_branching_factor = 0.0;
    double min_trap_score = 0.0;
    int    min_solution_multiplicity = 1;
    double max_empty_bottle_usage = 1.0;

    // Structural floor
    int min_mixed_bottles = 1;
    int min_distinct_signatures = 2;
    int min_top_color_variety = 1;

    static QualityThresholds forBand(LevelBand band);

    /// Structural floor only; used by the fallback generation phase.
    static QualityThresholds relaxed();
};

/// Gate verdict with one reason per failed check.
struct GateDecision {
    bool accepted = false;
    std::vector<std::string> reasons;

    std::string summary() const;
};

/// Quality Gate: pure acceptance predicate over level metrics.
class QualityGate {
public:
    static GateDecision evaluate(const LevelMetrics& metrics, const QualityThresholds& thresholds);

    static bool accept(const LevelMetrics& metrics, const QualityThresholds& thresholds) {
        return evaluate(metrics, thresholds).accepted;
    }

    /// Structural checks alone (mixed bottles, signatures, top colors).
    static GateDecision evaluateStructure(const LevelMetrics& metrics,
                                          const QualityThresholds& thresholds);
};

} // namespace decanter
