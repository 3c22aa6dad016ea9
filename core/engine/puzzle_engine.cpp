#include "engine/puzzle_engine.hpp"

namespace decanter {

PuzzleState PuzzleEngine::generate(uint64_t seed, int level_index) const {
    GenerationResult result = generator_.generate(seed, level_index);
    if (!result.ok()) {
        throw GenerationError("Generation failed for level " + std::to_string(level_index) +
                              " seed " + std::to_string(seed) + ": " + result.failure_reason,
                              result.report);
    }
    return *result.state;
}

GenerationResult PuzzleEngine::tryGenerate(uint64_t seed, int level_index) const {
    return generator_.generate(seed, level_index);
}

SolverResult PuzzleEngine::solve(const PuzzleState& state, int max_nodes, int max_millis) const {
    SolverConfig config;
    config.max_nodes = max_nodes;
    config.max_millis = max_millis;
    config.allow_sink_moves = true;
    config.record_path = false;
    return solver_.solve(state, config);
}

SolverResult PuzzleEngine::solveWithPath(const PuzzleState& state, int max_nodes, int max_millis,
                                         bool allow_sink_moves) const {
    SolverConfig config;
    config.max_nodes = max_nodes;
    config.max_millis = max_millis;
    config.allow_sink_moves = allow_sink_moves;
    config.record_path = true;
    return solver_.solve(state, config);
}

MoveOutcome PuzzleEngine::tryApplyMove(const PuzzleState& state, int source, int target) {
    MoveOutcome outcome;
    outcome.state = state;

    int amount = state.pourAmount(source, target);
    if (amount == 0) return outcome;

    outcome.state.applyPour(Move(source, target, amount));
    outcome.state.moves_used++;
    outcome.poured = amount;
    return outcome;
}

} // namespace decanter
