#pragma once

namespace decanter {

/// Move budget handed to the player: the optimal count scaled by a slack
/// factor that shrinks from 2.0 at level 1 to 1.0 at kSlackFloorLevel.
class MoveAllowance {
public:
    static constexpr int kSlackFloorLevel = 500;

    static double slackFactor(int level_index);

    /// max(optimal, ceil(optimal * slack)), and at least 1.
    /// Throws std::invalid_argument for a negative optimal count.
    static int movesAllowed(int optimal_moves, int level_index);
};

} // namespace decanter
