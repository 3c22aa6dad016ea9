#include "profile/difficulty_curve.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace decanter {

namespace {

double rampPosition(int level_index) {
    if (level_index < 1) {
        throw std::invalid_argument("Level index must be >= 1, got " +
                                    std::to_string(level_index));
    }
    int clamped = std::min(level_index, DifficultyCurve::kPlateauLevel);
    return static_cast<double>(clamped - 1) / (DifficultyCurve::kPlateauLevel - 1);
}

/// Next level on the curve; beyond the plateau every level is the same.
int nextLevel(int level_index) {
    return level_index < DifficultyCurve::kPlateauLevel ? level_index + 1 : level_index;
}

int ramp(int from, int to, int level_index) {
    double t = rampPosition(level_index);
    return static_cast<int>(std::lround(from + (to - from) * t));
}

} // namespace

int DifficultyCurve::targetOptimalMoves(int level_index) {
    return ramp(kFirstTargetMoves, kPlateauTargetMoves, level_index);
}

OptimalWindow DifficultyCurve::optimalWindow(int level_index) {
    OptimalWindow window;
    window.min_moves = targetOptimalMoves(level_index);
    window.max_moves = targetOptimalMoves(nextLevel(level_index));
    return window;
}

int DifficultyCurve::targetDifficulty(int level_index) {
    return ramp(kFirstTargetDifficulty, kPlateauTargetDifficulty, level_index);
}

int DifficultyCurve::difficultyRating(int intrinsic_difficulty, int level_index) {
    return std::clamp(intrinsic_difficulty, targetDifficulty(level_index),
                      targetDifficulty(nextLevel(level_index)));
}

} // namespace decanter
