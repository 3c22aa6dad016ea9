#include "generation/difficulty_objective.hpp"

#include <algorithm>
#include <cmath>

namespace decanter {

namespace {

double clamp01(double v) {
    return std::clamp(v, 0.0, 1.0);
}

} // namespace

double DifficultyObjective::score(const LevelMetrics& m) const {
    double branching = clamp01((m.average_branching_factor - 1.0) / 2.0);
    double trap = clamp01(m.trap_score);
    double decision = 1.0 / (1.0 + std::max(0, m.decision_depth));
    double multiplicity = clamp01((m.solution_multiplicity - 1) / 2.0);
    double empty_usage = 1.0 - clamp01(m.empty_bottle_usage_ratio);
    double open_choice = 1.0 - clamp01(m.forced_move_ratio);

    return weights_.branching * branching +
           weights_.trap * trap +
           weights_.decision * decision +
           weights_.multiplicity * multiplicity +
           weights_.empty_usage * empty_usage +
           weights_.open_choice * open_choice;
}

int DifficultyObjective::intrinsicDifficulty100(const LevelMetrics& m, int optimal_moves) {
    double length = clamp01(optimal_moves / 30.0) * 40.0;
    double branching = clamp01((m.average_branching_factor - 1.0) / 3.0) * 25.0;
    double trap = clamp01(m.trap_score);
    double trap_points = trap * trap * 20.0;
    double choice = (1.0 - clamp01(m.forced_move_ratio)) * 10.0;
    double uniqueness = (1.0 - clamp01((m.solution_multiplicity - 1) / 2.0)) * 5.0;

    long total = std::lround(length + branching + trap_points + choice + uniqueness);
    return static_cast<int>(std::clamp(total, 1L, 100L));
}

} // namespace decanter
