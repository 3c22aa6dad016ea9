#include "model/puzzle_state.hpp"

#include <sstream>
#include <stdexcept>

namespace decanter {

int PuzzleState::pourAmount(int source, int target) const {
    if (!validIndex(source) || !validIndex(target) || source == target) return 0;
    return bottles[source].maxPourAmountInto(bottles[target]);
}

bool PuzzleState::isRelocation(int source, int target) const {
    int amount = pourAmount(source, target);
    if (amount == 0) return false;
    const Bottle& from = bottles[source];
    const Bottle& to = bottles[target];
    return to.isEmpty() && from.isMonochrome() && amount == from.count() &&
           to.capacity() == from.capacity() && to.isSink() == from.isSink();
}

std::vector<Move> PuzzleState::legalMoves(MovePolicy policy, bool allow_sink_targets) const {
    std::vector<Move> moves;
    int n = bottleCount();
    for (int s = 0; s < n; s++) {
        if (bottles[s].isEmpty() || bottles[s].isSink()) continue;
        for (int t = 0; t < n; t++) {
            if (s == t) continue;
            if (!allow_sink_targets && bottles[t].isSink()) continue;
            int amount = pourAmount(s, t);
            if (amount == 0) continue;
            if (policy == MovePolicy::SEARCH && isRelocation(s, t)) continue;
            moves.emplace_back(s, t, amount);
        }
    }
    return moves;
}

int PuzzleState::legalMoveCount(MovePolicy policy, bool allow_sink_targets) const {
    int total = 0;
    int n = bottleCount();
    for (int s = 0; s < n; s++) {
        if (bottles[s].isEmpty() || bottles[s].isSink()) continue;
        for (int t = 0; t < n; t++) {
            if (s == t) continue;
            if (!allow_sink_targets && bottles[t].isSink()) continue;
            if (pourAmount(s, t) == 0) continue;
            if (policy == MovePolicy::SEARCH && isRelocation(s, t)) continue;
            total++;
        }
    }
    return total;
}

bool PuzzleState::hasLegalMove() const {
    int n = bottleCount();
    for (int s = 0; s < n; s++) {
        for (int t = 0; t < n; t++) {
            if (pourAmount(s, t) > 0) return true;
        }
    }
    return false;
}

void PuzzleState::applyPour(const Move& move) {
    int amount = pourAmount(move.source, move.target);
    if (amount == 0 || amount != move.amount) {
        throw std::runtime_error("Illegal pour " + move.toString() +
                                 " (rules allow " + std::to_string(amount) + ")");
    }
    ColorId color = *bottles[move.source].topColor();
    bottles[move.source].pop(amount);
    bottles[move.target].push(color, amount);
}

bool PuzzleState::isWin() const {
    for (const auto& b : bottles) {
        if (!b.isMonochrome()) return false;
    }

    // A monochrome bottle that can be emptied entirely into a same-colored
    // bottle means the colors are not yet maximally merged.
    int n = bottleCount();
    for (int s = 0; s < n; s++) {
        const Bottle& from = bottles[s];
        if (from.isEmpty() || from.isSink()) continue;
        for (int t = 0; t < n; t++) {
            if (s == t || bottles[t].isEmpty()) continue;
            if (pourAmount(s, t) == from.count()) return false;
        }
    }
    return true;
}

std::map<ColorId, int> PuzzleState::colorVolumes() const {
    std::map<ColorId, int> volumes;
    for (const auto& b : bottles) {
        for (ColorId c : b.units()) volumes[c]++;
    }
    return volumes;
}

std::string PuzzleState::toString() const {
    std::ostringstream out;
    for (size_t i = 0; i < bottles.size(); i++) {
        if (i > 0) out << " ";
        out << bottles[i].toString();
    }
    return out.str();
}

} // namespace decanter
