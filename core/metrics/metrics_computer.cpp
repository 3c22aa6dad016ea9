#include "metrics/metrics_computer.hpp"
#include "model/state_encoder.hpp"
#include "search/bfs_solver.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

namespace decanter {

LevelMetrics MetricsComputer::compute(const PuzzleState& state,
                                      const std::vector<Move>& optimal_path) const {
    LevelMetrics metrics;
    computePathMetrics(state, optimal_path, metrics);
    computeStructural(state, metrics);

    int optimal = static_cast<int>(optimal_path.size());
    if (optimal > 0) {
        BudgetManager deadline(config_.max_millis);
        deadline.start();
        bool truncated = false;
        metrics.trap_score =
            trapScoreWithin(state, optimal, optimal_path.front(), deadline, truncated);
        metrics.solution_multiplicity = multiplicityWithin(state, optimal, deadline, truncated);
        metrics.time_truncated = truncated;
    }
    return metrics;
}

void MetricsComputer::computePathMetrics(const PuzzleState& state, const std::vector<Move>& path,
                                         LevelMetrics& out) const {
    if (path.empty()) {
        out.forced_move_ratio = 1.0;
        out.average_branching_factor = 1.0;
        out.decision_depth = 0;
        out.empty_bottle_usage_ratio = 0.0;
        return;
    }

    PuzzleState current(state.bottles);
    int forced = 0;
    int total_branching = 0;
    int empty_pours = 0;
    int decision_depth = -1;
    int steps = static_cast<int>(path.size());

    // States before each move: the root and every intermediate state,
    // never the final win.
    for (int i = 0; i < steps; i++) {
        const Move& move = path[i];
        if (current.pourAmount(move.source, move.target) != move.amount || move.amount == 0) {
            throw std::invalid_argument("Path move " + std::to_string(i) + " " +
                                        move.toString() + " is not legal");
        }

        int branching = current.legalMoveCount(MovePolicy::SEARCH);
        total_branching += branching;
        if (branching == 1) forced++;
        if (branching >= 2 && decision_depth < 0) decision_depth = i;
        if (current.bottles[move.target].isEmpty()) empty_pours++;

        current.applyPour(move);
    }

    out.forced_move_ratio = static_cast<double>(forced) / steps;
    out.average_branching_factor = static_cast<double>(total_branching) / steps;
    out.decision_depth = decision_depth < 0 ? steps : decision_depth;
    out.empty_bottle_usage_ratio = static_cast<double>(empty_pours) / steps;
}

double MetricsComputer::computeTrapScore(const PuzzleState& state, int optimal_moves,
                                         const Move& optimal_first, bool* time_truncated) const {
    BudgetManager deadline(config_.max_millis);
    deadline.start();
    bool truncated = false;
    double score = trapScoreWithin(state, optimal_moves, optimal_first, deadline, truncated);
    if (time_truncated) *time_truncated = truncated;
    return score;
}

int MetricsComputer::estimateSolutionMultiplicity(const PuzzleState& state, int optimal_moves,
                                                  bool* time_truncated) const {
    BudgetManager deadline(config_.max_millis);
    deadline.start();
    bool truncated = false;
    int count = multiplicityWithin(state, optimal_moves, deadline, truncated);
    if (time_truncated) *time_truncated = truncated;
    return count;
}

double MetricsComputer::trapScoreWithin(const PuzzleState& state, int optimal_moves,
                                        const Move& optimal_first, const BudgetManager& deadline,
                                        bool& truncated) const {
    if (optimal_moves <= 0 || config_.trap_sample_count <= 0) return 0.0;

    PuzzleState root(state.bottles);
    BfsSolver solver;
    SolverConfig trap_budget;
    trap_budget.max_nodes = config_.trap_max_nodes;

    int samples = 0;
    int traps = 0;
    int considered = 0;
    for (const Move& move : root.legalMoves(MovePolicy::SEARCH)) {
        if (considered >= config_.trap_sample_count) break;
        if (move.source == optimal_first.source && move.target == optimal_first.target) continue;
        considered++;

        PuzzleState child = root;
        child.applyPour(move);
        if (child.isWin()) {
            samples++;
            continue;
        }

        trap_budget.max_millis = deadline.sliceMillis(config_.trap_max_millis);
        if (trap_budget.max_millis <= 0) {
            truncated = true;
            break;
        }
        SolverResult r = solver.solve(child, trap_budget);

        // Out of time before the node budget ran out: no verdict
        if (r.status == SolverStatus::BUDGET_EXHAUSTED && r.nodes_visited < trap_budget.max_nodes) {
            truncated = true;
            continue;
        }
        samples++;
        if (!r.solved() || 1 + r.optimal_moves > optimal_moves) traps++;
    }

    return samples == 0 ? 0.0 : static_cast<double>(traps) / samples;
}

int MetricsComputer::multiplicityWithin(const PuzzleState& state, int optimal_moves,
                                        const BudgetManager& deadline, bool& truncated) const {
    if (optimal_moves <= 0) return 1;

    int cap = std::max(1, config_.multiplicity_cap);
    int limit = optimal_moves + std::max(0, config_.multiplicity_margin);
    int found = 0;

    BudgetManager budget(deadline.sliceMillis(config_.multiplicity_max_millis),
                         config_.multiplicity_max_nodes);
    budget.start();

    // Layer: canonical key -> (representative state, number of sequences reaching it)
    std::map<std::string, std::pair<PuzzleState, int>> layer;
    PuzzleState root(state.bottles);
    layer.emplace(StateEncoder::encodeCanonical(root), std::make_pair(root, 1));

    for (int depth = 0; depth < limit && !layer.empty() && found < cap; depth++) {
        std::map<std::string, std::pair<PuzzleState, int>> next_layer;
        for (const auto& [key, entry] : layer) {
            if (found >= cap || !budget.canContinue()) break;
            budget.recordNode();

            const auto& [current, sequences] = entry;
            for (const Move& move : current.legalMoves(MovePolicy::SEARCH)) {
                PuzzleState child = current;
                child.applyPour(move);
                if (child.isWin()) {
                    found = std::min(cap, found + sequences);
                    continue;
                }
                std::string child_key = StateEncoder::encodeCanonical(child);
                auto it = next_layer.find(child_key);
                if (it == next_layer.end()) {
                    next_layer.emplace(std::move(child_key), std::make_pair(std::move(child), sequences));
                } else {
                    it->second.second = std::min(cap, it->second.second + sequences);
                }
            }
        }
        if (!budget.canContinue()) {
            if (!budget.isNodeExhausted() && found < cap) truncated = true;
            break;
        }
        layer = std::move(next_layer);
    }

    return std::max(1, std::min(found, cap));
}

void MetricsComputer::computeStructural(const PuzzleState& state, LevelMetrics& out) {
    std::set<std::string> signatures;
    std::set<ColorId> top_colors;
    int mixed = 0;

    for (const auto& b : state.bottles) {
        signatures.insert(StateEncoder::bottleSignature(b));
        if (b.isEmpty()) continue;
        if (!b.isMonochrome()) mixed++;
        top_colors.insert(*b.topColor());
    }

    out.mixed_bottle_count = mixed;
    out.distinct_signature_count = static_cast<int>(signatures.size());
    out.top_color_variety = static_cast<int>(top_colors.size());
}

} // namespace decanter
