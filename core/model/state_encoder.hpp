#pragma once

#include "model/puzzle_state.hpp"
#include <string>

namespace decanter {

// ─── State Encoder ─────────────────────────────────────────────
// Deduplication keys for search. Keys depend on bottle contents only,
// never on move counters or generation metadata.
//
// A bottle signature encodes:
// - kind (S = sink, N = normal)
// - capacity
// - slot colors, bottom to top
//
// e.g. "N4:0.0.2" for a capacity-4 bottle holding 0,0,2.

class StateEncoder {
public:
    /// Positional key: bottle signatures in index order.
    static std::string encode(const PuzzleState& state);

    /// Order-independent key: bottle signatures sorted, so states that differ
    /// only by a permutation of bottles map to the same key.
    static std::string encodeCanonical(const PuzzleState& state);

    static std::string bottleSignature(const Bottle& bottle);
};

} // namespace decanter
