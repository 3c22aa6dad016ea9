// PyBind11 bindings for the decanter core.
// Exposes the state model, solver, metrics, profiles and generator to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "model/bottle.hpp"
#include "model/move.hpp"
#include "model/puzzle_state.hpp"
#include "model/state_encoder.hpp"
#include "model/level_integrity.hpp"
#include "search/solver_types.hpp"
#include "metrics/level_metrics.hpp"
#include "profile/difficulty_profile.hpp"
#include "profile/move_allowance.hpp"
#include "profile/difficulty_curve.hpp"
#include "generation/generation_report.hpp"
#include "generation/level_generator.hpp"
#include "engine/puzzle_engine.hpp"

namespace py = pybind11;

PYBIND11_MODULE(decanter_bindings, m) {
    m.doc() = "Decanter liquid-sort puzzle engine bindings";

    // ── Bottle ──
    py::class_<decanter::Bottle>(m, "Bottle")
        .def(py::init<int>(), py::arg("capacity"))
        .def(py::init<int, std::vector<decanter::ColorId>, bool>(),
             py::arg("capacity"), py::arg("units"), py::arg("is_sink") = false)
        .def_static("from_slots", &decanter::Bottle::fromSlots,
                    py::arg("slots"), py::arg("is_sink") = false)
        .def_property_readonly("capacity", &decanter::Bottle::capacity)
        .def_property_readonly("count", &decanter::Bottle::count)
        .def_property_readonly("is_sink", &decanter::Bottle::isSink)
        .def_property_readonly("units", &decanter::Bottle::units)
        .def("top_color", &decanter::Bottle::topColor)
        .def("contiguous_top_count", &decanter::Bottle::contiguousTopCount)
        .def("is_monochrome", &decanter::Bottle::isMonochrome)
        .def("__eq__", &decanter::Bottle::operator==)
        .def("__repr__", &decanter::Bottle::toString);

    // ── Move ──
    py::class_<decanter::Move>(m, "Move")
        .def(py::init<>())
        .def(py::init<int, int, int>())
        .def_readwrite("source", &decanter::Move::source)
        .def_readwrite("target", &decanter::Move::target)
        .def_readwrite("amount", &decanter::Move::amount)
        .def("__eq__", &decanter::Move::operator==)
        .def("__repr__", &decanter::Move::toString);

    // ── PuzzleState ──
    py::class_<decanter::PuzzleState>(m, "PuzzleState")
        .def(py::init<>())
        .def(py::init<std::vector<decanter::Bottle>>())
        .def_readwrite("bottles", &decanter::PuzzleState::bottles)
        .def_readwrite("moves_used", &decanter::PuzzleState::moves_used)
        .def_readwrite("moves_allowed", &decanter::PuzzleState::moves_allowed)
        .def_readwrite("optimal_moves", &decanter::PuzzleState::optimal_moves)
        .def_readwrite("level_index", &decanter::PuzzleState::level_index)
        .def_readwrite("seed", &decanter::PuzzleState::seed)
        .def_readwrite("scramble_moves", &decanter::PuzzleState::scramble_moves)
        .def("is_win", &decanter::PuzzleState::isWin)
        .def("is_fail", &decanter::PuzzleState::isFail)
        .def("legal_moves", [](const decanter::PuzzleState& s) { return s.legalMoves(); })
        .def("encode", [](const decanter::PuzzleState& s) {
            return decanter::StateEncoder::encodeCanonical(s);
        })
        .def("is_valid", [](const decanter::PuzzleState& s) {
            return decanter::LevelIntegrity::isValid(s);
        })
        .def("__repr__", &decanter::PuzzleState::toString);

    // ── SolverResult ──
    py::enum_<decanter::SolverStatus>(m, "SolverStatus")
        .value("SOLVED", decanter::SolverStatus::SOLVED)
        .value("UNSOLVABLE", decanter::SolverStatus::UNSOLVABLE)
        .value("BUDGET_EXHAUSTED", decanter::SolverStatus::BUDGET_EXHAUSTED);

    py::class_<decanter::SolverResult>(m, "SolverResult")
        .def(py::init<>())
        .def_readonly("optimal_moves", &decanter::SolverResult::optimal_moves)
        .def_readonly("path", &decanter::SolverResult::path)
        .def_readonly("status", &decanter::SolverResult::status)
        .def_readonly("nodes_visited", &decanter::SolverResult::nodes_visited)
        .def_readonly("elapsed_millis", &decanter::SolverResult::elapsed_millis);

    // ── LevelMetrics ──
    py::class_<decanter::LevelMetrics>(m, "LevelMetrics")
        .def(py::init<>())
        .def_readonly("forced_move_ratio", &decanter::LevelMetrics::forced_move_ratio)
        .def_readonly("average_branching_factor", &decanter::LevelMetrics::average_branching_factor)
        .def_readonly("decision_depth", &decanter::LevelMetrics::decision_depth)
        .def_readonly("empty_bottle_usage_ratio", &decanter::LevelMetrics::empty_bottle_usage_ratio)
        .def_readonly("trap_score", &decanter::LevelMetrics::trap_score)
        .def_readonly("solution_multiplicity", &decanter::LevelMetrics::solution_multiplicity)
        .def_readonly("mixed_bottle_count", &decanter::LevelMetrics::mixed_bottle_count)
        .def_readonly("distinct_signature_count", &decanter::LevelMetrics::distinct_signature_count)
        .def_readonly("top_color_variety", &decanter::LevelMetrics::top_color_variety)
        .def_readonly("time_truncated", &decanter::LevelMetrics::time_truncated);

    // ── DifficultyProfile ──
    py::class_<decanter::DifficultyProfile>(m, "DifficultyProfile")
        .def_readonly("level_index", &decanter::DifficultyProfile::level_index)
        .def_readonly("color_count", &decanter::DifficultyProfile::color_count)
        .def_readonly("empty_bottle_count", &decanter::DifficultyProfile::empty_bottle_count)
        .def_readonly("sink_count", &decanter::DifficultyProfile::sink_count)
        .def_readonly("capacity_pool", &decanter::DifficultyProfile::capacity_pool)
        .def_readonly("reverse_move_count", &decanter::DifficultyProfile::reverse_move_count)
        .def_property_readonly("band", [](const decanter::DifficultyProfile& p) {
            return decanter::bandName(p.band);
        });

    // ── GenerationReport ──
    py::class_<decanter::GenerationReport>(m, "GenerationReport")
        .def_readonly("level_index", &decanter::GenerationReport::level_index)
        .def_readonly("seed", &decanter::GenerationReport::seed)
        .def_readonly("attempts", &decanter::GenerationReport::attempts)
        .def_readonly("candidates_evaluated", &decanter::GenerationReport::candidates_evaluated)
        .def_readonly("metrics", &decanter::GenerationReport::metrics)
        .def_readonly("optimal_moves", &decanter::GenerationReport::optimal_moves)
        .def_readonly("moves_allowed", &decanter::GenerationReport::moves_allowed)
        .def_readonly("scramble_moves", &decanter::GenerationReport::scramble_moves)
        .def_readonly("objective_score", &decanter::GenerationReport::objective_score)
        .def_readonly("intrinsic_difficulty", &decanter::GenerationReport::intrinsic_difficulty)
        .def_readonly("target_difficulty", &decanter::GenerationReport::target_difficulty)
        .def_readonly("difficulty_rating", &decanter::GenerationReport::difficulty_rating)
        .def_readonly("min_optimal_moves", &decanter::GenerationReport::min_optimal_moves)
        .def_readonly("max_optimal_moves", &decanter::GenerationReport::max_optimal_moves)
        .def_readonly("quality_gates_applied", &decanter::GenerationReport::quality_gates_applied)
        .def_readonly("last_rejection_reason", &decanter::GenerationReport::last_rejection_reason)
        .def_readonly("total_millis", &decanter::GenerationReport::total_millis);

    py::class_<decanter::GenerationResult>(m, "GenerationResult")
        .def_readonly("state", &decanter::GenerationResult::state)
        .def_readonly("report", &decanter::GenerationResult::report)
        .def_readonly("failure_reason", &decanter::GenerationResult::failure_reason)
        .def("ok", &decanter::GenerationResult::ok);

    // ── PuzzleEngine ──
    py::class_<decanter::MoveOutcome>(m, "MoveOutcome")
        .def_readonly("state", &decanter::MoveOutcome::state)
        .def_readonly("poured", &decanter::MoveOutcome::poured);

    py::class_<decanter::PuzzleEngine>(m, "PuzzleEngine")
        .def(py::init<>())
        .def("set_log", &decanter::PuzzleEngine::setLog)
        .def("generate", &decanter::PuzzleEngine::generate,
             py::arg("seed"), py::arg("level_index"))
        .def("try_generate", &decanter::PuzzleEngine::tryGenerate,
             py::arg("seed"), py::arg("level_index"))
        .def("solve", &decanter::PuzzleEngine::solve,
             py::arg("state"), py::arg("max_nodes"), py::arg("max_millis"),
             py::call_guard<py::gil_scoped_release>())
        .def("solve_with_path", &decanter::PuzzleEngine::solveWithPath,
             py::arg("state"), py::arg("max_nodes"), py::arg("max_millis"),
             py::arg("allow_sink_moves") = true,
             py::call_guard<py::gil_scoped_release>())
        .def_static("try_apply_move", &decanter::PuzzleEngine::tryApplyMove,
                    py::arg("state"), py::arg("source"), py::arg("target"));

    m.def("profile_for_level", &decanter::ProfileEngine::forLevel, py::arg("level_index"));
    m.def("target_difficulty", &decanter::DifficultyCurve::targetDifficulty,
          py::arg("level_index"));
    m.def("optimal_window", [](int level_index) {
        decanter::OptimalWindow w = decanter::DifficultyCurve::optimalWindow(level_index);
        return py::make_tuple(w.min_moves, w.max_moves);
    }, py::arg("level_index"));
    m.def("moves_allowed", &decanter::MoveAllowance::movesAllowed,
          py::arg("optimal_moves"), py::arg("level_index"));

    py::register_exception<decanter::GenerationError>(m, "GenerationError");
}
