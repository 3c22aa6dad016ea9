#include "search/bfs_solver.hpp"
#include "model/state_encoder.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace decanter {

namespace {

struct Frontier {
    PuzzleState state;
    int depth = 0;
    int trace = -1;
};

} // namespace

SolverResult BfsSolver::solve(const PuzzleState& initial, const SolverConfig& config) const {
    if (initial.bottles.empty()) {
        throw std::invalid_argument("Cannot solve a state without bottles");
    }
    if (config.max_nodes <= 0 || config.max_millis <= 0) {
        throw std::invalid_argument("Solver budgets must be positive: nodes=" +
                                    std::to_string(config.max_nodes) + " millis=" +
                                    std::to_string(config.max_millis));
    }

    BudgetManager budget(config.max_millis, config.max_nodes);
    budget.start();

    SolverResult result;
    auto finish = [&](SolverStatus status, int depth) {
        result.status = status;
        result.optimal_moves = status == SolverStatus::SOLVED ? depth : -1;
        result.nodes_visited = budget.nodes();
        result.elapsed_millis = budget.elapsedMillis();
        return result;
    };

    // Only the bottles matter to the search
    PuzzleState root(initial.bottles);
    budget.recordNode();

    if (root.isWin()) return finish(SolverStatus::SOLVED, 0);
    if (!root.hasLegalMove()) return finish(SolverStatus::UNSOLVABLE, -1);

    std::unordered_set<std::string> visited;
    visited.insert(StateEncoder::encodeCanonical(root));

    std::vector<TraceEntry> trace;
    std::deque<Frontier> queue;
    queue.push_back({std::move(root), 0, -1});

    while (!queue.empty()) {
        if (!budget.canContinue()) {
            return finish(SolverStatus::BUDGET_EXHAUSTED, -1);
        }

        Frontier current = std::move(queue.front());
        queue.pop_front();

        auto moves = current.state.legalMoves(MovePolicy::SEARCH, config.allow_sink_moves);
        for (const Move& move : moves) {
            PuzzleState next = current.state;
            next.applyPour(move);

            std::string key = StateEncoder::encodeCanonical(next);
            if (visited.count(key)) continue;
            if (budget.isNodeExhausted()) {
                return finish(SolverStatus::BUDGET_EXHAUSTED, -1);
            }
            visited.insert(std::move(key));
            budget.recordNode();

            int trace_index = -1;
            if (config.record_path) {
                trace.push_back({current.trace, move});
                trace_index = static_cast<int>(trace.size()) - 1;
            }

            if (next.isWin()) {
                if (config.record_path) result.path = rebuildPath(trace, trace_index);
                return finish(SolverStatus::SOLVED, current.depth + 1);
            }

            queue.push_back({std::move(next), current.depth + 1, trace_index});
        }
    }

    return finish(SolverStatus::UNSOLVABLE, -1);
}

std::vector<Move> BfsSolver::rebuildPath(const std::vector<TraceEntry>& trace, int leaf) {
    std::vector<Move> path;
    for (int i = leaf; i >= 0; i = trace[i].parent) {
        path.push_back(trace[i].move);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace decanter
