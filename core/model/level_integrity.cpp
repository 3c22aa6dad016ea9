#include "model/level_integrity.hpp"

#include <stdexcept>

namespace decanter {

std::vector<IntegrityCheck> LevelIntegrity::check(const PuzzleState& state) {
    std::vector<IntegrityCheck> results;

    if (state.bottles.empty()) {
        results.push_back({false, "has_bottles", "State has no bottles", -1});
        return results;
    }

    for (int i = 0; i < state.bottleCount(); i++) {
        const Bottle& b = state.bottles[i];
        if (b.capacity() <= 0) {
            results.push_back({false, "bottle_capacity",
                "Bottle " + std::to_string(i) + " has non-positive capacity", i});
        }
        if (b.count() > b.capacity()) {
            results.push_back({false, "bottle_overflow",
                "Bottle " + std::to_string(i) + " holds " + std::to_string(b.count()) +
                " units in capacity " + std::to_string(b.capacity()), i});
        }
        if (b.isSink() && !b.isMonochrome()) {
            results.push_back({false, "sink_monochrome",
                "Sink " + std::to_string(i) + " holds more than one color", i});
        }
    }

    auto volumes = state.colorVolumes();

    // Each color must fill some normal bottle exactly, otherwise no win
    // state can hold it.
    for (const auto& [color, volume] : volumes) {
        bool fits = false;
        for (const auto& b : state.bottles) {
            if (!b.isSink() && b.capacity() == volume) {
                fits = true;
                break;
            }
        }
        if (!fits) {
            results.push_back({false, "color_volume_fits",
                "Color " + std::to_string(color) + " volume " + std::to_string(volume) +
                " matches no bottle capacity", -1});
        }
    }

    // A full sink can no longer change, so it must already hold a whole color.
    for (int i = 0; i < state.bottleCount(); i++) {
        const Bottle& b = state.bottles[i];
        if (!b.isSink() || !b.isFull() || b.isEmpty()) continue;
        ColorId color = *b.topColor();
        if (!b.isMonochrome() || volumes[color] != b.count()) {
            results.push_back({false, "sealed_sink_complete",
                "Full sink " + std::to_string(i) + " does not hold all of color " +
                std::to_string(color), i});
        }
    }

    if (results.empty()) {
        results.push_back({true, "level_integrity", "All integrity checks passed", -1});
    }
    return results;
}

bool LevelIntegrity::isValid(const PuzzleState& state) {
    for (const auto& r : check(state)) {
        if (!r.passed) return false;
    }
    return true;
}

std::string LevelIntegrity::firstFailure(const PuzzleState& state) {
    for (const auto& r : check(state)) {
        if (!r.passed) return r.check_name + ": " + r.message;
    }
    return "";
}

void LevelIntegrity::validateOrThrow(const PuzzleState& state) {
    std::string failure = firstFailure(state);
    if (!failure.empty()) {
        throw std::runtime_error("Level integrity violated: " + failure);
    }
}

} // namespace decanter
