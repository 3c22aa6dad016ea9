#include "generation/level_generator.hpp"
#include "model/level_integrity.hpp"
#include "profile/move_allowance.hpp"
#include "search/bfs_solver.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <set>
#include <sstream>
#include <stdexcept>

namespace decanter {

namespace {

double millisSince(std::chrono::steady_clock::time_point start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(now - start).count();
}

int normalEmptyCount(const PuzzleState& state) {
    int n = 0;
    for (const auto& b : state.bottles) {
        if (b.isEmpty() && !b.isSink()) n++;
    }
    return n;
}

} // namespace

LevelGenerator::LevelGenerator(GeneratorConfig config)
    : config_(config), metrics_(config.metrics), objective_(config.weights) {
    if (config_.max_attempts < 0 || config_.relaxed_attempts < 0 ||
        config_.max_attempts + config_.relaxed_attempts < 1) {
        throw std::invalid_argument("Generator needs at least one attempt");
    }
    if (config_.candidates_per_attempt < 1) {
        throw std::invalid_argument("candidates_per_attempt must be >= 1");
    }
    if (config_.solver_max_nodes <= 0 || config_.solver_max_millis <= 0) {
        throw std::invalid_argument("Generator solver budgets must be positive");
    }
}

// ─── Solved Configuration ──────────────────────────────────────

PuzzleState LevelGenerator::buildSolved(const DifficultyProfile& profile, DeterministicRng& rng) {
    profile.validate();

    const auto& pool = profile.capacity_pool;
    std::vector<int> smalls;
    std::vector<int> larges;
    for (int c : pool) {
        if (c <= DifficultyProfile::kSmallCapacity) smalls.push_back(c);
        if (c >= DifficultyProfile::kLargeCapacity) larges.push_back(c);
    }

    std::vector<int> caps;
    auto pickPreferUnused = [&](const std::vector<int>& options) {
        std::vector<int> unused;
        for (int c : options) {
            if (std::find(caps.begin(), caps.end(), c) == caps.end()) unused.push_back(c);
        }
        return unused.empty() ? rng.pick(options) : rng.pick(unused);
    };
    auto distinctCount = [&]() {
        return static_cast<int>(std::set<int>(caps.begin(), caps.end()).size());
    };

    for (int i = 0; i < profile.min_small_capacities; i++) caps.push_back(pickPreferUnused(smalls));
    for (int i = 0; i < profile.min_large_capacities; i++) caps.push_back(pickPreferUnused(larges));
    while (static_cast<int>(caps.size()) < profile.color_count &&
           distinctCount() < profile.min_distinct_capacities) {
        caps.push_back(pickPreferUnused(pool));
    }
    while (static_cast<int>(caps.size()) < profile.color_count) {
        caps.push_back(rng.pick(pool));
    }
    rng.shuffle(caps);

    std::vector<Bottle> bottles;
    for (int color = 0; color < profile.color_count; color++) {
        int cap = caps[color];
        bottles.emplace_back(cap, std::vector<ColorId>(cap, color));
    }

    // The first normal empty can hold any color whole
    int normal_empties = profile.empty_bottle_count - profile.sink_count;
    int largest = *std::max_element(caps.begin(), caps.end());
    for (int i = 0; i < normal_empties; i++) {
        bottles.emplace_back(i == 0 ? largest : rng.pick(caps));
    }
    for (int i = 0; i < profile.sink_count; i++) {
        bottles.emplace_back(rng.pick(caps), std::vector<ColorId>{}, true);
    }

    rng.shuffle(bottles);

    PuzzleState state(std::move(bottles));
    state.level_index = profile.level_index;
    return state;
}

// ─── Inverse Pours ─────────────────────────────────────────────

std::vector<Move> LevelGenerator::validInversePours(const PuzzleState& state) {
    std::vector<Move> pushes;
    int n = state.bottleCount();
    for (int s = 0; s < n; s++) {
        const Bottle& from = state.bottles[s];
        // A sink source could never be poured back into
        if (from.isEmpty() || from.isSink()) continue;
        ColorId color = *from.topColor();
        int run = from.contiguousTopCount();

        for (int t = 0; t < n; t++) {
            const Bottle& to = state.bottles[t];
            // A sink target would have to be lifted to pour back
            if (s == t || to.isSink()) continue;

            int target_run = to.topColor() == color ? to.contiguousTopCount() : 0;
            int max_k = std::min(run, to.freeSpace());
            for (int k = 1; k <= max_k; k++) {
                // Source must be left empty or still topped by the pushed color
                if (k == run && k != from.count()) continue;
                int forward = std::min(k + target_run, from.freeSpace() + k);
                if (forward != k) continue;
                pushes.emplace_back(s, t, k);
            }
        }
    }
    return pushes;
}

void LevelGenerator::pushInverse(PuzzleState& state, const Move& push) {
    ColorId color = *state.bottles[push.source].topColor();
    state.bottles[push.source].pop(push.amount);
    state.bottles[push.target].push(color, push.amount);
}

int LevelGenerator::scramble(PuzzleState& state, int count, DeterministicRng& rng,
                             std::vector<Move>* trail) {
    int applied = 0;
    std::optional<Move> last;
    for (int step = 0; step < count; step++) {
        auto pushes = validInversePours(state);
        if (last) {
            Move undo(last->target, last->source, last->amount);
            pushes.erase(std::remove(pushes.begin(), pushes.end(), undo), pushes.end());
        }
        if (pushes.empty()) break;

        Move push = rng.pick(pushes);
        pushInverse(state, push);
        if (trail) trail->push_back(push);
        last = push;
        applied++;
    }
    return applied;
}

PuzzleState LevelGenerator::replay(const PuzzleState& solved, const std::vector<Move>& trail,
                                   int count) {
    if (count < 0 || count > static_cast<int>(trail.size())) {
        throw std::invalid_argument("replay: " + std::to_string(count) + " of " +
                                    std::to_string(trail.size()) + " pushes");
    }
    PuzzleState state = solved;
    for (int i = 0; i < count; i++) pushInverse(state, trail[i]);
    state.scramble_moves = count;
    return state;
}

int LevelGenerator::reduceEmptyCount(PuzzleState& state, int normal_empties, DeterministicRng& rng,
                                     std::vector<Move>& trail) {
    int applied = 0;
    for (int guard = 0; guard < state.bottleCount() * 2; guard++) {
        if (normalEmptyCount(state) <= normal_empties) break;

        std::vector<Move> fills;
        for (const Move& push : validInversePours(state)) {
            const Bottle& to = state.bottles[push.target];
            if (to.isEmpty() && push.amount < state.bottles[push.source].count()) {
                fills.push_back(push);
            }
        }
        if (fills.empty()) break;

        const Move& fill = rng.pick(fills);
        pushInverse(state, fill);
        trail.push_back(fill);
        applied++;
    }
    return applied;
}

int LevelGenerator::breakSolvedBottles(PuzzleState& state, DeterministicRng& rng,
                                       std::vector<Move>& trail) {
    int applied = 0;
    for (int i = 0; i < state.bottleCount(); i++) {
        const Bottle& b = state.bottles[i];
        if (b.isSink() || !b.isSolvedFull()) continue;

        std::vector<Move> splits;
        for (const Move& push : validInversePours(state)) {
            if (push.source == i && push.amount < b.count()) splits.push_back(push);
        }
        if (splits.empty()) continue;

        const Move& split = rng.pick(splits);
        pushInverse(state, split);
        trail.push_back(split);
        applied++;
    }
    return applied;
}

// ─── Candidate Checks ──────────────────────────────────────────

bool LevelGenerator::hasChainRisk(const PuzzleState& state, int color_count) {
    int normal_empties = 0;
    int largest_empty = 0;
    for (const auto& b : state.bottles) {
        if (b.isEmpty() && !b.isSink()) {
            normal_empties++;
            largest_empty = std::max(largest_empty, b.capacity());
        }
    }
    if (normal_empties < 2) return false;

    // Bottles left monochrome by dumping their top run into an empty
    int obvious = 0;
    for (const auto& b : state.bottles) {
        if (b.isSink() || b.isEmpty()) continue;
        if (b.runCount() == 2 && b.contiguousTopCount() <= largest_empty) obvious++;
    }
    return obvious > std::max(1, color_count / 3);
}

std::string LevelGenerator::checkFragmentation(const PuzzleState& state,
                                               const FragmentationTargets& targets) {
    int occupied = 0;
    int runs = 0;
    int mixed = 0;
    for (const auto& b : state.bottles) {
        if (b.isEmpty()) continue;
        occupied++;
        runs += b.runCount();
        if (!b.isMonochrome()) mixed++;
    }

    if (mixed < targets.min_mixed_bottles) {
        return "mixed " + std::to_string(mixed) + " < " + std::to_string(targets.min_mixed_bottles);
    }
    double average = occupied > 0 ? static_cast<double>(runs) / occupied : 0.0;
    double floor = targets.average_fragments - targets.fragment_variance;
    if (average + 1e-9 < floor) {
        std::ostringstream out;
        out << "average runs " << average << " < " << floor;
        return out.str();
    }
    return "";
}

SolverResult LevelGenerator::solveForCandidate(const PuzzleState& state, Timings& timings) const {
    // Path mode: the metrics walk the optimal line
    SolverConfig solver_config;
    solver_config.max_nodes = config_.solver_max_nodes;
    solver_config.max_millis = config_.solver_max_millis;
    solver_config.allow_sink_moves = true;
    solver_config.record_path = true;

    SolverResult solution = BfsSolver().solve(state, solver_config);
    timings.solver_millis += solution.elapsed_millis;
    return solution;
}

std::optional<LevelGenerator::Candidate> LevelGenerator::buildCandidate(
    const DifficultyProfile& profile, DeterministicRng& rng, bool relaxed,
    Timings& timings, std::string& rejection) const {

    OptimalWindow window = DifficultyCurve::optimalWindow(profile.level_index);
    window.min_moves = std::max(window.min_moves, config_.min_optimal_moves);
    if (window.empty()) {
        rejection = "optimal:window [" + std::to_string(window.min_moves) + "," +
                    std::to_string(window.max_moves) + "] is empty";
        return std::nullopt;
    }

    PuzzleState solved = buildSolved(profile, rng);

    int reverse_moves = profile.reverse_move_count;
    if (relaxed) {
        reverse_moves = std::max(1, static_cast<int>(std::lround(
            reverse_moves * config_.relaxed_reverse_factor)));
    }
    reverse_moves = std::max(reverse_moves, window.max_moves + config_.scramble_headroom);

    PuzzleState state = solved;
    std::vector<Move> trail;
    scramble(state, reverse_moves, rng, &trail);
    reduceEmptyCount(state, profile.empty_bottle_count - profile.sink_count, rng, trail);
    if (profile.level_index <= config_.break_solved_max_level) {
        breakSolvedBottles(state, rng, trail);
    }
    state.scramble_moves = static_cast<int>(trail.size());

    std::string integrity = LevelIntegrity::firstFailure(state);
    if (!integrity.empty()) {
        rejection = "integrity:" + integrity;
        return std::nullopt;
    }

    SolverResult solution = solveForCandidate(state, timings);
    if (!solution.solved()) {
        rejection = "solver:" + statusName(solution.status);
        return std::nullopt;
    }
    if (solution.optimal_moves < window.min_moves) {
        rejection = "optimal:" + std::to_string(solution.optimal_moves) + " < " +
                    std::to_string(window.min_moves);
        return std::nullopt;
    }

    // Cut the trail back by the excess until the optimum is in the window
    int kept = state.scramble_moves;
    while (solution.optimal_moves > window.max_moves) {
        kept -= solution.optimal_moves - window.max_moves;
        state = replay(solved, trail, kept);
        solution = solveForCandidate(state, timings);
        if (!solution.solved()) {
            rejection = "solver:" + statusName(solution.status) + " at " +
                        std::to_string(kept) + " pushes";
            return std::nullopt;
        }
    }

    if (state.isWin()) {
        rejection = "start:already_solved";
        return std::nullopt;
    }
    if (!state.hasLegalMove()) {
        rejection = "start:no_moves";
        return std::nullopt;
    }
    if (!relaxed) {
        if (hasChainRisk(state, profile.color_count)) {
            rejection = "chain_risk";
            return std::nullopt;
        }
        std::string fragmentation = checkFragmentation(state, profile.fragmentation);
        if (!fragmentation.empty()) {
            rejection = "fragmentation:" + fragmentation;
            return std::nullopt;
        }
    }

    auto metrics_start = std::chrono::steady_clock::now();
    LevelMetrics metrics = metrics_.compute(state, solution.path);
    timings.metrics_millis += millisSince(metrics_start);

    QualityThresholds thresholds = relaxed ? QualityThresholds::relaxed()
                                           : QualityThresholds::forBand(profile.band);
    GateDecision decision = QualityGate::evaluate(metrics, thresholds);
    if (!decision.accepted) {
        rejection = "gate:" + decision.summary();
        return std::nullopt;
    }

    Candidate candidate;
    candidate.state = std::move(state);
    candidate.solution = std::move(solution);
    candidate.metrics = metrics;
    candidate.score = objective_.score(metrics);
    candidate.intrinsic_difficulty =
        DifficultyObjective::intrinsicDifficulty100(metrics, candidate.solution.optimal_moves);
    return candidate;
}

bool LevelGenerator::closerToTarget(const Candidate& a, const Candidate& b, int target) {
    int da = std::abs(a.intrinsic_difficulty - target);
    int db = std::abs(b.intrinsic_difficulty - target);
    if (da != db) return da < db;
    return a.score > b.score;
}

// ─── Generation ────────────────────────────────────────────────

GenerationResult LevelGenerator::generate(uint64_t seed, int level_index) const {
    return generate(seed, ProfileEngine::forLevel(level_index));
}

GenerationResult LevelGenerator::generate(uint64_t seed, const DifficultyProfile& profile) const {
    profile.validate();
    auto start = std::chrono::steady_clock::now();

    GenerationResult result;
    GenerationReport& report = result.report;
    report.level_index = profile.level_index;
    report.seed = seed;
    Timings timings;

    std::string tag = "level=" + std::to_string(profile.level_index) +
                      " seed=" + std::to_string(seed);
    int target_difficulty = DifficultyCurve::targetDifficulty(profile.level_index);
    OptimalWindow window = DifficultyCurve::optimalWindow(profile.level_index);
    report.target_difficulty = target_difficulty;
    report.min_optimal_moves = std::max(window.min_moves, config_.min_optimal_moves);
    report.max_optimal_moves = window.max_moves;

    for (int phase = 0; phase < 2; phase++) {
        bool relaxed = phase == 1;
        int first = relaxed ? config_.max_attempts : 0;
        int count = relaxed ? config_.relaxed_attempts : config_.max_attempts;
        if (relaxed && count > 0) {
            log("LevelGenerator.Fallback " + tag + " last_reason=" + report.last_rejection_reason);
        }

        for (int attempt = first; attempt < first + count; attempt++) {
            report.attempts++;
            std::optional<Candidate> best;

            // Keep the accepted scramble nearest the level's difficulty target
            for (int c = 0; c < config_.candidates_per_attempt; c++) {
                DeterministicRng rng(deriveSeed(seed, profile.level_index, attempt, c));
                std::string rejection;
                auto candidate = buildCandidate(profile, rng, relaxed, timings, rejection);
                report.candidates_evaluated++;
                if (!candidate) {
                    report.last_rejection_reason = rejection;
                    log("LevelGenerator.Reject " + tag + " attempt=" + std::to_string(attempt) +
                        " candidate=" + std::to_string(c) + " reason=" + rejection);
                    continue;
                }
                if (!best || closerToTarget(*candidate, *best, target_difficulty)) {
                    best = std::move(candidate);
                }
            }

            if (!best) continue;

            PuzzleState state = std::move(best->state);
            int optimal = best->solution.optimal_moves;
            state.moves_used = 0;
            state.optimal_moves = optimal;
            state.moves_allowed = MoveAllowance::movesAllowed(optimal, profile.level_index);
            state.level_index = profile.level_index;
            state.seed = seed;

            report.metrics = best->metrics;
            report.optimal_moves = optimal;
            report.moves_allowed = state.moves_allowed;
            report.scramble_moves = state.scramble_moves;
            report.objective_score = best->score;
            report.intrinsic_difficulty = best->intrinsic_difficulty;
            report.difficulty_rating =
                DifficultyCurve::difficultyRating(best->intrinsic_difficulty, profile.level_index);
            report.quality_gates_applied = !relaxed;
            report.solver_millis = timings.solver_millis;
            report.metrics_millis = timings.metrics_millis;
            report.total_millis = millisSince(start);

            log("LevelGenerator.Accept " + tag + " attempts=" + std::to_string(report.attempts) +
                " optimal=" + std::to_string(optimal) +
                " allowed=" + std::to_string(state.moves_allowed) +
                " difficulty=" + std::to_string(report.intrinsic_difficulty) +
                " target=" + std::to_string(target_difficulty) +
                " truncated=" + (best->metrics.time_truncated ? "true" : "false") +
                " relaxed=" + (relaxed ? "true" : "false"));

            result.state = std::move(state);
            return result;
        }
    }

    report.solver_millis = timings.solver_millis;
    report.metrics_millis = timings.metrics_millis;
    report.total_millis = millisSince(start);
    result.failure_reason = "exhausted " + std::to_string(report.attempts) +
                            " attempts; last rejection: " + report.last_rejection_reason;
    log("LevelGenerator.Failure " + tag + " reason=" + result.failure_reason);
    return result;
}

} // namespace decanter
