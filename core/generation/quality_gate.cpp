#include "generation/quality_gate.hpp"

#include <iomanip>
#include <sstream>

namespace decanter {

namespace {

std::string fmt(double v) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << v;
    return out.str();
}

} // namespace

QualityThresholds QualityThresholds::forBand(LevelBand band) {
    QualityThresholds t;
    switch (band) {
        case LevelBand::A:
            t.max_forced_move_ratio = 0.70; t.max_decision_depth = 4;
            t.min_branching_factor = 1.2;   t.min_trap_score = 0.05;
            t.max_empty_bottle_usage = 0.80;
            t.min_mixed_bottles = 1; t.min_distinct_signatures = 2; t.min_top_color_variety = 1;
            break;
        case LevelBand::B:
            t.max_forced_move_ratio = 0.60; t.max_decision_depth = 3;
            t.min_branching_factor = 1.3;   t.min_trap_score = 0.10;
            t.max_empty_bottle_usage = 0.70;
            t.min_mixed_bottles = 2; t.min_distinct_signatures = 3; t.min_top_color_variety = 2;
            break;
        case LevelBand::C:
            t.max_forced_move_ratio = 0.55; t.max_decision_depth = 2;
            t.min_branching_factor = 1.4;   t.min_trap_score = 0.15;
            t.max_empty_bottle_usage = 0.60;
            t.min_mixed_bottles = 2; t.min_distinct_signatures = 3; t.min_top_color_variety = 2;
            break;
        case LevelBand::D:
            t.max_forced_move_ratio = 0.50; t.max_decision_depth = 2;
            t.min_branching_factor = 1.5;   t.min_trap_score = 0.18;
            t.max_empty_bottle_usage = 0.55;
            t.min_mixed_bottles = 3; t.min_distinct_signatures = 4; t.min_top_color_variety = 2;
            break;
        case LevelBand::E:
            t.max_forced_move_ratio = 0.45; t.max_decision_depth = 2;
            t.min_branching_factor = 1.5;   t.min_trap_score = 0.20;
            t.max_empty_bottle_usage = 0.50;
            t.min_mixed_bottles = 3; t.min_distinct_signatures = 4; t.min_top_color_variety = 3;
            break;
    }
    t.min_solution_multiplicity = 1;
    return t;
}

QualityThresholds QualityThresholds::relaxed() {
    QualityThresholds t;
    t.min_mixed_bottles = 1;
    t.min_distinct_signatures = 2;
    t.min_top_color_variety = 1;
    return t;
}

std::string GateDecision::summary() const {
    if (accepted) return "accepted";
    std::string out;
    for (size_t i = 0; i < reasons.size(); i++) {
        if (i > 0) out += "; ";
        out += reasons[i];
    }
    return out;
}

GateDecision QualityGate::evaluateStructure(const LevelMetrics& m, const QualityThresholds& t) {
    GateDecision d;
    if (m.mixed_bottle_count < t.min_mixed_bottles) {
        d.reasons.push_back("MixedBottles " + std::to_string(m.mixed_bottle_count) +
                            " < " + std::to_string(t.min_mixed_bottles));
    }
    if (m.distinct_signature_count < t.min_distinct_signatures) {
        d.reasons.push_back("DistinctSignatures " + std::to_string(m.distinct_signature_count) +
                            " < " + std::to_string(t.min_distinct_signatures));
    }
    if (m.top_color_variety < t.min_top_color_variety) {
        d.reasons.push_back("TopColorVariety " + std::to_string(m.top_color_variety) +
                            " < " + std::to_string(t.min_top_color_variety));
    }
    d.accepted = d.reasons.empty();
    return d;
}

GateDecision QualityGate::evaluate(const LevelMetrics& m, const QualityThresholds& t) {
    GateDecision d;
    if (m.forced_move_ratio > t.max_forced_move_ratio) {
        d.reasons.push_back("ForcedMoveRatio " + fmt(m.forced_move_ratio) +
                            " > " + fmt(t.max_forced_move_ratio));
    }
    if (m.decision_depth > t.max_decision_depth) {
        d.reasons.push_back("DecisionDepth " + std::to_string(m.decision_depth) +
                            " > " + std::to_string(t.max_decision_depth));
    }
    if (m.average_branching_factor < t.min_branching_factor) {
        d.reasons.push_back("BranchingFactor " + fmt(m.average_branching_factor) +
                            " < " + fmt(t.min_branching_factor));
    }
    if (m.trap_score < t.min_trap_score) {
        d.reasons.push_back("TrapScore " + fmt(m.trap_score) + " < " + fmt(t.min_trap_score));
    }
    if (m.solution_multiplicity < t.min_solution_multiplicity) {
        d.reasons.push_back("SolutionMultiplicity " + std::to_string(m.solution_multiplicity) +
                            " < " + std::to_string(t.min_solution_multiplicity));
    }
    if (m.empty_bottle_usage_ratio > t.max_empty_bottle_usage) {
        d.reasons.push_back("EmptyBottleUsage " + fmt(m.empty_bottle_usage_ratio) +
                            " > " + fmt(t.max_empty_bottle_usage));
    }

    GateDecision structure = evaluateStructure(m, t);
    d.reasons.insert(d.reasons.end(), structure.reasons.begin(), structure.reasons.end());
    d.accepted = d.reasons.empty();
    return d;
}

} // namespace decanter
