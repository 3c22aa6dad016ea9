#include "profile/move_allowance.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace decanter {

double MoveAllowance::slackFactor(int level_index) {
    int clamped = std::clamp(level_index, 1, kSlackFloorLevel);
    double t = static_cast<double>(clamped - 1) / (kSlackFloorLevel - 1);
    return 2.0 - t;
}

int MoveAllowance::movesAllowed(int optimal_moves, int level_index) {
    if (optimal_moves < 0) {
        throw std::invalid_argument("Optimal move count must be known: " +
                                    std::to_string(optimal_moves));
    }
    // Small epsilon keeps exact products (e.g. 10 * 1.2) from rounding up
    double scaled = std::ceil(optimal_moves * slackFactor(level_index) - 1e-9);
    return std::max({1, optimal_moves, static_cast<int>(scaled)});
}

} // namespace decanter
