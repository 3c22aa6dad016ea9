#include <gtest/gtest.h>
#include "metrics/metrics_computer.hpp"
#include "search/bfs_solver.hpp"
#include "generation/level_generator.hpp"

#include <chrono>

using namespace decanter;

namespace {

constexpr ColorId A = 0;
constexpr ColorId B = 1;

PuzzleState swapState() {
    return PuzzleState({Bottle(2, {A, B}), Bottle(2, {B, A}), Bottle(2)});
}

/// Optimal path goes 0->1 then 0->3; every other opening costs a move.
PuzzleState trapState() {
    return PuzzleState({Bottle(2, {B, A}), Bottle(2, {A}), Bottle(1), Bottle(2, {B})});
}

/// Deeply scrambled plateau-sized state: far too large to search within a few ms.
PuzzleState largeState() {
    DifficultyProfile profile = ProfileEngine::forLevel(100);
    DeterministicRng rng(3);
    PuzzleState s = LevelGenerator::buildSolved(profile, rng);
    LevelGenerator::scramble(s, 30, rng);
    return s;
}

double millisSince(std::chrono::steady_clock::time_point start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(now - start).count();
}

std::vector<Move> optimalPath(const PuzzleState& s) {
    SolverConfig config;
    config.record_path = true;
    return BfsSolver().solve(s, config).path;
}

} // namespace

// ─── Path Metrics ──────────────────────────────────────────────

TEST(MetricsTest, EmptyPathDefaults) {
    MetricsComputer mc;
    LevelMetrics m = mc.compute(PuzzleState({Bottle(2, {A, A}), Bottle(2)}), {});
    EXPECT_DOUBLE_EQ(m.forced_move_ratio, 1.0);
    EXPECT_DOUBLE_EQ(m.average_branching_factor, 1.0);
    EXPECT_EQ(m.decision_depth, 0);
    EXPECT_DOUBLE_EQ(m.empty_bottle_usage_ratio, 0.0);
    EXPECT_DOUBLE_EQ(m.trap_score, 0.0);
    EXPECT_EQ(m.solution_multiplicity, 1);
}

TEST(MetricsTest, PathMetricsAlongSwap) {
    PuzzleState s = swapState();
    auto path = optimalPath(s);
    ASSERT_EQ(path.size(), 3u);
    EXPECT_EQ(path[0], Move(0, 2, 1));
    EXPECT_EQ(path[1], Move(1, 0, 1));
    EXPECT_EQ(path[2], Move(1, 2, 1));

    // Branching along the path: 2, 1, 2
    MetricsComputer mc;
    LevelMetrics m;
    mc.computePathMetrics(s, path, m);
    EXPECT_NEAR(m.forced_move_ratio, 1.0 / 3.0, 1e-9);
    EXPECT_NEAR(m.average_branching_factor, 5.0 / 3.0, 1e-9);
    EXPECT_EQ(m.decision_depth, 0);
    EXPECT_NEAR(m.empty_bottle_usage_ratio, 1.0 / 3.0, 1e-9);
}

TEST(MetricsTest, DecisionDepthCountsForcedOpening) {
    // Only 0->1 is possible at first; then two options appear
    PuzzleState s({Bottle(2, {A, B}), Bottle(2, {B}, true), Bottle(2, {A})});
    std::vector<Move> path = {Move(0, 1, 1), Move(0, 2, 1)};
    MetricsComputer mc;
    LevelMetrics m;
    mc.computePathMetrics(s, path, m);
    EXPECT_EQ(m.decision_depth, 1);
    EXPECT_DOUBLE_EQ(m.forced_move_ratio, 0.5);
}

TEST(MetricsTest, RejectsIllegalPath) {
    MetricsComputer mc;
    std::vector<Move> bogus = {Move(2, 0, 1)};
    EXPECT_THROW(mc.compute(swapState(), bogus), std::invalid_argument);
}

// ─── Trap Score ────────────────────────────────────────────────

TEST(MetricsTest, TrapScoreAllDeviationsCostly) {
    PuzzleState s = trapState();
    auto path = optimalPath(s);
    ASSERT_EQ(path.size(), 2u);
    EXPECT_EQ(path[0], Move(0, 1, 1));

    MetricsComputer mc;
    EXPECT_DOUBLE_EQ(mc.computeTrapScore(s, 2, path[0]), 1.0);
}

TEST(MetricsTest, TrapScoreZeroWhenDeviationIsEquivalent) {
    // Either opening of the swap finishes in three moves
    MetricsComputer mc;
    EXPECT_DOUBLE_EQ(mc.computeTrapScore(swapState(), 3, Move(0, 2, 1)), 0.0);
}

TEST(MetricsTest, TrapScoreRespectsSampleCount) {
    MetricsConfig config;
    config.trap_sample_count = 0;
    MetricsComputer mc(config);
    EXPECT_DOUBLE_EQ(mc.computeTrapScore(trapState(), 2, Move(0, 1, 1)), 0.0);
}

// ─── Solution Multiplicity ─────────────────────────────────────

TEST(MetricsTest, MultiplicityCountsSequences) {
    // Either bottle can be poured into the other
    PuzzleState s({Bottle(4, {A, A}), Bottle(4, {A, A})});
    MetricsComputer mc;
    EXPECT_EQ(mc.estimateSolutionMultiplicity(s, 1), 2);
}

TEST(MetricsTest, MultiplicityIsCapped) {
    MetricsComputer mc;
    EXPECT_EQ(mc.estimateSolutionMultiplicity(swapState(), 3), 3);

    MetricsConfig config;
    config.multiplicity_cap = 2;
    EXPECT_EQ(MetricsComputer(config).estimateSolutionMultiplicity(swapState(), 3), 2);
}

TEST(MetricsTest, MultiplicityAtLeastOne) {
    MetricsConfig config;
    config.multiplicity_max_nodes = 1;
    config.multiplicity_margin = 0;
    MetricsComputer mc(config);
    EXPECT_GE(mc.estimateSolutionMultiplicity(swapState(), 3), 1);
    EXPECT_EQ(mc.estimateSolutionMultiplicity(swapState(), 0), 1);
}

// ─── Time Caps ─────────────────────────────────────────────────

TEST(MetricsTest, TrapSamplingStopsAtTimeCap) {
    MetricsConfig config;
    config.max_millis = 30;
    config.trap_sample_count = 50;
    config.trap_max_nodes = 10000000;
    config.trap_max_millis = 3;
    MetricsComputer mc(config);

    bool truncated = false;
    auto start = std::chrono::steady_clock::now();
    double score = mc.computeTrapScore(largeState(), 40, Move(-1, -1, 0), &truncated);
    double elapsed = millisSince(start);

    EXPECT_TRUE(truncated);
    EXPECT_GE(score, 0.0);
    EXPECT_LE(score, 1.0);
    EXPECT_LT(elapsed, 1000.0);
}

TEST(MetricsTest, MultiplicityStopsAtTimeCap) {
    MetricsConfig config;
    config.max_millis = 1000;
    config.multiplicity_cap = 1000000;
    config.multiplicity_margin = 10;
    config.multiplicity_max_nodes = 10000000;
    config.multiplicity_max_millis = 5;
    MetricsComputer mc(config);

    bool truncated = false;
    auto start = std::chrono::steady_clock::now();
    int count = mc.estimateSolutionMultiplicity(largeState(), 20, &truncated);
    double elapsed = millisSince(start);

    EXPECT_TRUE(truncated);
    EXPECT_GE(count, 1);
    EXPECT_LT(elapsed, 1000.0);
}

TEST(MetricsTest, NodeCapsDoNotFlagTruncation) {
    PuzzleState s = trapState();
    MetricsComputer mc;
    LevelMetrics m = mc.compute(s, optimalPath(s));
    EXPECT_FALSE(m.time_truncated);
}

// ─── Structural ────────────────────────────────────────────────

TEST(MetricsTest, StructuralCounts) {
    LevelMetrics m;
    MetricsComputer::computeStructural(swapState(), m);
    EXPECT_EQ(m.mixed_bottle_count, 2);
    EXPECT_EQ(m.distinct_signature_count, 3);
    EXPECT_EQ(m.top_color_variety, 2);
}

TEST(MetricsTest, ComputeIsDeterministic) {
    PuzzleState s = trapState();
    auto path = optimalPath(s);
    MetricsComputer mc;
    LevelMetrics a = mc.compute(s, path);
    LevelMetrics b = mc.compute(s, path);
    EXPECT_DOUBLE_EQ(a.trap_score, b.trap_score);
    EXPECT_EQ(a.solution_multiplicity, b.solution_multiplicity);
    EXPECT_DOUBLE_EQ(a.average_branching_factor, b.average_branching_factor);
}
