#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace decanter {

/// SplitMix64 finalizer. Spreads nearby seeds across the state space.
inline uint64_t mixSeed(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

/// Seed for one generation candidate. Mixing in the level keeps equal
/// seeds on different levels from producing related scrambles.
inline uint64_t deriveSeed(uint64_t seed, int level_index, int attempt, int candidate) {
    uint64_t h = mixSeed(seed);
    h = mixSeed(h ^ static_cast<uint64_t>(level_index));
    h = mixSeed(h ^ (static_cast<uint64_t>(attempt) << 32 | static_cast<uint32_t>(candidate)));
    return h;
}

// ─── Deterministic RNG ─────────────────────────────────────────
// xorshift64 sequence. Identical seeds give identical sequences on
// every platform, which std:: distributions do not guarantee.

class DeterministicRng {
public:
    explicit DeterministicRng(uint64_t seed)
        : state_(seed == 0 ? 0x2545F4914F6CDD1DULL : seed) {}

    uint64_t next() {
        uint64_t x = state_;
        x ^= x << 13;
        x ^= x >> 7;
        x ^= x << 17;
        state_ = x;
        return x;
    }

    /// Uniform integer in [min, max]. Throws std::invalid_argument if max < min.
    int nextInt(int min, int max) {
        if (max < min) {
            throw std::invalid_argument("nextInt: invalid interval [" + std::to_string(min) +
                                        "," + std::to_string(max) + "]");
        }
        auto span = static_cast<uint64_t>(static_cast<int64_t>(max) - min + 1);
        return min + static_cast<int>(next() % span);
    }

    /// Fisher-Yates shuffle.
    template <typename T>
    void shuffle(std::vector<T>& items) {
        for (int i = static_cast<int>(items.size()) - 1; i > 0; i--) {
            int j = nextInt(0, i);
            std::swap(items[i], items[j]);
        }
    }

    template <typename T>
    const T& pick(const std::vector<T>& items) {
        if (items.empty()) throw std::invalid_argument("pick: empty range");
        return items[nextInt(0, static_cast<int>(items.size()) - 1)];
    }

private:
    uint64_t state_;
};

} // namespace decanter
