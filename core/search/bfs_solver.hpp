#pragma once

#include "search/solver_types.hpp"
#include "search/budget_manager.hpp"
#include "model/puzzle_state.hpp"

#include <vector>

namespace decanter {

// ─── BFS Solver ────────────────────────────────────────────────
// Breadth-first search from a state to the nearest win. Every pour
// costs one move, so the BFS depth of the first win reached is the
// optimal move count.
//
// - Moves are enumerated in ascending (source, target) order, which
//   makes depth and path repeatable for a fixed state and budget.
// - States are deduplicated on their canonical encoding.
// - With record_path, each visited state keeps a back-pointer to its
//   parent and the path is rebuilt by walking them from the win.

class BfsSolver {
public:
    /// Run the search. Throws std::invalid_argument for an empty state or
    /// non-positive budgets.
    SolverResult solve(const PuzzleState& initial, const SolverConfig& config) const;

private:
    struct TraceEntry {
        int parent = -1;    // -1 = root
        Move move;
    };

    static std::vector<Move> rebuildPath(const std::vector<TraceEntry>& trace, int leaf);
};

} // namespace decanter
