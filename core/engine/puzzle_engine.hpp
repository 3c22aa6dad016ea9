#pragma once

#include "generation/level_generator.hpp"
#include "model/puzzle_state.hpp"
#include "search/bfs_solver.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace decanter {

/// Raised by PuzzleEngine::generate when every attempt was rejected.
/// Callers retry with a perturbed seed.
class GenerationError : public std::runtime_error {
public:
    GenerationError(const std::string& what, GenerationReport report)
        : std::runtime_error(what), report_(std::move(report)) {}

    const GenerationReport& report() const { return report_; }

private:
    GenerationReport report_;
};

/// Post-move state and the number of units poured (0 = no-op).
struct MoveOutcome {
    PuzzleState state;
    int poured = 0;
};

// ─── Puzzle Engine ─────────────────────────────────────────────
// The entry points the session layer calls. Every call takes value
// snapshots and returns new values; the engine keeps no mutable state
// between calls, so one instance may serve several threads.

class PuzzleEngine {
public:
    explicit PuzzleEngine(GeneratorConfig config = {}) : generator_(config) {}

    /// Route generator diagnostics to `fn`. Configure before sharing the engine.
    void setLog(LogFn fn) { generator_.setLog(std::move(fn)); }

    /// Throws GenerationError if no conforming instance was found and
    /// std::invalid_argument for level_index < 1.
    PuzzleState generate(uint64_t seed, int level_index) const;

    /// Non-throwing variant that also returns the generation report.
    GenerationResult tryGenerate(uint64_t seed, int level_index) const;

    /// Optimal depth only. Sink targets are enumerable.
    SolverResult solve(const PuzzleState& state, int max_nodes, int max_millis) const;

    /// Optimal depth and move path.
    SolverResult solveWithPath(const PuzzleState& state, int max_nodes, int max_millis,
                               bool allow_sink_moves) const;

    /// Pour source -> target on a copy. Illegal pours and bad indices return
    /// the state unchanged with poured = 0; a legal pour counts one move.
    static MoveOutcome tryApplyMove(const PuzzleState& state, int source, int target);

private:
    LevelGenerator generator_;
    BfsSolver solver_;
};

} // namespace decanter
