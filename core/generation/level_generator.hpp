#pragma once

#include "generation/deterministic_rng.hpp"
#include "generation/difficulty_objective.hpp"
#include "generation/generation_report.hpp"
#include "generation/quality_gate.hpp"
#include "metrics/metrics_computer.hpp"
#include "profile/difficulty_curve.hpp"
#include "profile/difficulty_profile.hpp"
#include "search/solver_types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace decanter {

// ─── Log Function ──────────────────────────────────────────────
// Optional sink for single-line key=value diagnostics. Unset = silent.

using LogFn = std::function<void(const std::string&)>;

/// Generator configuration parameters.
struct GeneratorConfig {
    int max_attempts = 6;               // Gated attempts before the fallback
    int candidates_per_attempt = 3;     // Scrambles hill-climbed per attempt
    int relaxed_attempts = 6;           // Fallback attempts with relaxed gates
    double relaxed_reverse_factor = 0.6; // Reverse moves kept by the fallback
    int scramble_headroom = 4;          // Pushes beyond the window's upper edge
    int min_optimal_moves = 2;
    int solver_max_nodes = 100000;      // Node budget binds; time is a safety net
    int solver_max_millis = 30000;
    int break_solved_max_level = 6;     // Levels that break leftover solved bottles
    MetricsConfig metrics;
    ObjectiveWeights weights;
};

// ─── Level Generator ───────────────────────────────────────────
// Reverse construction: start from a solved configuration matching the
// profile and apply exact inverse pours drawn from a seeded sequence.
// Every scramble is solvable by construction; the solver then measures
// its optimal depth and the quality gate decides whether to keep it.
//
// The optimal depth is held to the level's DifficultyCurve window. A
// scramble that overshoots is cut back along its push trail: undoing the
// last j pushes costs at most j moves, so dropping exactly the excess
// never lands below the window's upper edge.
//
// Rejections are values, not exceptions. Exhausting every attempt,
// relaxed fallback included, yields a GenerationResult without a state.

class LevelGenerator {
public:
    explicit LevelGenerator(GeneratorConfig config = {});

    void setLog(LogFn fn) { log_ = std::move(fn); }

    /// Throws std::invalid_argument for level_index < 1.
    GenerationResult generate(uint64_t seed, int level_index) const;

    /// Throws std::invalid_argument for a malformed profile.
    GenerationResult generate(uint64_t seed, const DifficultyProfile& profile) const;

    /// Solved configuration matching the profile: one full bottle per
    /// color, then normal empties and sinks, in shuffled order.
    static PuzzleState buildSolved(const DifficultyProfile& profile, DeterministicRng& rng);

    /// Inverse pours valid from `state`, ascending (source, target, amount).
    /// Pushing k units from S onto T is valid when the forward pour T -> S
    /// would move exactly those k units back.
    static std::vector<Move> validInversePours(const PuzzleState& state);

    /// Apply up to `count` random inverse pours, appending each to `trail`
    /// when given. Returns the number applied.
    static int scramble(PuzzleState& state, int count, DeterministicRng& rng,
                        std::vector<Move>* trail = nullptr);

    /// `solved` with the first `count` pushes of `trail` applied.
    static PuzzleState replay(const PuzzleState& solved, const std::vector<Move>& trail,
                              int count);

    /// Too many bottles that a single pour into a free empty would unmix.
    static bool hasChainRisk(const PuzzleState& state, int color_count);

    const GeneratorConfig& config() const { return config_; }

private:
    struct Candidate {
        PuzzleState state;
        SolverResult solution;
        LevelMetrics metrics;
        double score = 0.0;
        int intrinsic_difficulty = 0;
    };

    struct Timings {
        double solver_millis = 0.0;
        double metrics_millis = 0.0;
    };

    GeneratorConfig config_;
    MetricsComputer metrics_;
    DifficultyObjective objective_;
    LogFn log_;

    std::optional<Candidate> buildCandidate(const DifficultyProfile& profile, DeterministicRng& rng,
                                            bool relaxed, Timings& timings,
                                            std::string& rejection) const;
    SolverResult solveForCandidate(const PuzzleState& state, Timings& timings) const;

    static void pushInverse(PuzzleState& state, const Move& push);
    static int reduceEmptyCount(PuzzleState& state, int normal_empties, DeterministicRng& rng,
                                std::vector<Move>& trail);
    static int breakSolvedBottles(PuzzleState& state, DeterministicRng& rng,
                                  std::vector<Move>& trail);
    static bool closerToTarget(const Candidate& a, const Candidate& b, int target);
    static std::string checkFragmentation(const PuzzleState& state,
                                          const FragmentationTargets& targets);

    void log(const std::string& line) const {
        if (log_) log_(line);
    }
};

} // namespace decanter
