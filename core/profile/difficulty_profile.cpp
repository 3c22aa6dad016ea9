#include "profile/difficulty_profile.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace decanter {

namespace {

double lerp(double from, double to, double t) {
    return from + (to - from) * t;
}

int lerpRound(double from, double to, double t) {
    return static_cast<int>(std::lround(lerp(from, to, t)));
}

} // namespace

std::string bandName(LevelBand band) {
    switch (band) {
        case LevelBand::A: return "A";
        case LevelBand::B: return "B";
        case LevelBand::C: return "C";
        case LevelBand::D: return "D";
        case LevelBand::E: return "E";
    }
    return "?";
}

void DifficultyProfile::validate() const {
    auto fail = [](const std::string& what) {
        throw std::invalid_argument("Malformed difficulty profile: " + what);
    };

    if (color_count < 1) fail("color_count < 1");
    if (empty_bottle_count < 1) fail("empty_bottle_count < 1");
    if (sink_count < 0 || sink_count >= empty_bottle_count) {
        fail("sink_count must leave at least one normal empty bottle");
    }
    if (capacity_pool.empty()) fail("empty capacity pool");
    if (!std::is_sorted(capacity_pool.begin(), capacity_pool.end()) ||
        std::adjacent_find(capacity_pool.begin(), capacity_pool.end()) != capacity_pool.end()) {
        fail("capacity pool must be strictly ascending");
    }
    if (capacity_pool.front() < 1) fail("capacity below 1");
    if (min_distinct_capacities > static_cast<int>(capacity_pool.size()) ||
        min_distinct_capacities > color_count) {
        fail("min_distinct_capacities exceeds pool or color count");
    }
    if (min_small_capacities + min_large_capacities > color_count) {
        fail("small and large minimums exceed color count");
    }
    if (min_small_capacities > 0 && capacity_pool.front() > kSmallCapacity) {
        fail("small capacities required but none in pool");
    }
    if (min_large_capacities > 0 && capacity_pool.back() < kLargeCapacity) {
        fail("large capacities required but none in pool");
    }
    if (reverse_move_count < 1) fail("reverse_move_count < 1");
    if (fragmentation.min_mixed_bottles > bottleCount()) fail("min_mixed_bottles exceeds bottles");
}

bool DifficultyProfile::sameParameters(const DifficultyProfile& other) const {
    return band == other.band &&
           color_count == other.color_count &&
           empty_bottle_count == other.empty_bottle_count &&
           sink_count == other.sink_count &&
           capacity_pool == other.capacity_pool &&
           min_distinct_capacities == other.min_distinct_capacities &&
           min_small_capacities == other.min_small_capacities &&
           min_large_capacities == other.min_large_capacities &&
           fragmentation.average_fragments == other.fragmentation.average_fragments &&
           fragmentation.fragment_variance == other.fragmentation.fragment_variance &&
           fragmentation.min_mixed_bottles == other.fragmentation.min_mixed_bottles &&
           reverse_move_count == other.reverse_move_count;
}

// ─── Profile Engine ────────────────────────────────────────────

LevelBand ProfileEngine::bandForLevel(int level_index) {
    if (level_index <= 10) return LevelBand::A;
    if (level_index <= 25) return LevelBand::B;
    if (level_index <= 50) return LevelBand::C;
    if (level_index <= 75) return LevelBand::D;
    return LevelBand::E;
}

double ProfileEngine::rampPosition(int level_index) {
    int clamped = std::clamp(level_index, 1, kPlateauLevel);
    return static_cast<double>(clamped - 1) / (kPlateauLevel - 1);
}

DifficultyProfile ProfileEngine::forLevel(int level_index) {
    if (level_index < 1) {
        throw std::invalid_argument("Level index must be >= 1: " + std::to_string(level_index));
    }

    double t = rampPosition(level_index);

    DifficultyProfile p;
    p.level_index = level_index;
    p.band = bandForLevel(std::min(level_index, kPlateauLevel));

    p.color_count = lerpRound(3, 7, t);
    p.empty_bottle_count = 2;
    p.sink_count = lerpRound(0, 1, t);

    int pool_min = lerpRound(4, 2, t);
    int pool_max = lerpRound(4, 7, t);
    for (int c = pool_min; c <= pool_max; c++) {
        p.capacity_pool.push_back(c);
    }

    p.min_distinct_capacities = std::min(lerpRound(1, 4, t),
                                         static_cast<int>(p.capacity_pool.size()));
    p.min_small_capacities = pool_min <= DifficultyProfile::kSmallCapacity ? lerpRound(0, 2, t) : 0;
    p.min_large_capacities = pool_max >= DifficultyProfile::kLargeCapacity ? lerpRound(0, 1, t) : 0;

    p.fragmentation.average_fragments = lerp(1.0, 1.8, t);
    p.fragmentation.fragment_variance = lerp(0.0, 0.5, t);
    p.fragmentation.min_mixed_bottles = lerpRound(1, 4, t);

    p.reverse_move_count = lerpRound(6, 16, t);

    p.validate();
    return p;
}

} // namespace decanter
