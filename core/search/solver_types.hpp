#pragma once

#include "model/move.hpp"
#include <string>
#include <vector>

namespace decanter {

/// Outcome class of a solver run.
enum class SolverStatus {
    SOLVED,             // optimal_moves holds the BFS depth of the nearest win
    UNSOLVABLE,         // state space exhausted without reaching a win
    BUDGET_EXHAUSTED    // node or time budget hit first; result unknown
};

inline std::string statusName(SolverStatus status) {
    switch (status) {
        case SolverStatus::SOLVED: return "solved";
        case SolverStatus::UNSOLVABLE: return "unsolvable";
        case SolverStatus::BUDGET_EXHAUSTED: return "budget_exhausted";
    }
    return "unknown";
}

/// Solver configuration parameters.
struct SolverConfig {
    int max_nodes = 200000;         // Maximum visited states
    int max_millis = 1000;          // Maximum wall-clock time
    bool allow_sink_moves = true;   // Enumerate pours into sink bottles
    bool record_path = false;       // Keep back-pointers and rebuild the path
};

/// Result of a solver run.
struct SolverResult {
    int optimal_moves = -1;         // -1 = unknown or unsolvable
    std::vector<Move> path;         // Filled only when a path was requested
    SolverStatus status = SolverStatus::BUDGET_EXHAUSTED;
    int nodes_visited = 0;
    double elapsed_millis = 0.0;

    bool solved() const { return status == SolverStatus::SOLVED; }
};

} // namespace decanter
