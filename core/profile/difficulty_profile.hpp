#pragma once

#include <string>
#include <vector>

namespace decanter {

/// Difficulty band of a level. Selects the quality thresholds.
enum class LevelBand {
    A,  // levels 1-10
    B,  // 11-25
    C,  // 26-50
    D,  // 51-75
    E   // 76 and beyond
};

std::string bandName(LevelBand band);

// ─── Fragmentation Targets ─────────────────────────────────────
// How broken up the scrambled colors should be.

struct FragmentationTargets {
    double average_fragments = 1.0;     // mean same-color runs per occupied bottle
    double fragment_variance = 0.0;     // tolerance below the mean
    int min_mixed_bottles = 1;          // bottles holding more than one color
};

// ─── Difficulty Profile ────────────────────────────────────────
// Level-indexed generation parameters. A pure value; recomputed on
// demand and never mutated by the generator.

struct DifficultyProfile {
    int level_index = 1;
    LevelBand band = LevelBand::A;

    int color_count = 3;
    int empty_bottle_count = 2;         // sinks are counted among the empties
    int sink_count = 0;

    std::vector<int> capacity_pool;     // allowed bottle capacities, ascending
    int min_distinct_capacities = 1;
    int min_small_capacities = 0;       // bottles with capacity <= kSmallCapacity
    int min_large_capacities = 0;       // bottles with capacity >= kLargeCapacity

    FragmentationTargets fragmentation;
    int reverse_move_count = 6;

    static constexpr int kSmallCapacity = 3;
    static constexpr int kLargeCapacity = 6;

    int bottleCount() const { return color_count + empty_bottle_count; }

    /// Throws std::invalid_argument if the parameters cannot describe a puzzle.
    void validate() const;

    /// Equal generation parameters; level_index is not compared.
    bool sameParameters(const DifficultyProfile& other) const;
};

// ─── Profile Engine ────────────────────────────────────────────
// Parameters interpolate linearly from level 1 to kPlateauLevel and
// stay flat beyond it; only the seed varies generation after that.

class ProfileEngine {
public:
    static constexpr int kPlateauLevel = 100;

    /// Throws std::invalid_argument for level_index < 1.
    static DifficultyProfile forLevel(int level_index);

    static LevelBand bandForLevel(int level_index);

    /// Interpolation parameter in [0, 1] for a level.
    static double rampPosition(int level_index);
};

} // namespace decanter
