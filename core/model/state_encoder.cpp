#include "model/state_encoder.hpp"

#include <algorithm>
#include <vector>

namespace decanter {

std::string StateEncoder::bottleSignature(const Bottle& bottle) {
    std::string sig;
    sig.reserve(4 + bottle.count() * 2);
    sig += bottle.isSink() ? 'S' : 'N';
    sig += std::to_string(bottle.capacity());
    sig += ':';
    const auto& units = bottle.units();
    for (size_t i = 0; i < units.size(); i++) {
        if (i > 0) sig += '.';
        sig += std::to_string(units[i]);
    }
    return sig;
}

std::string StateEncoder::encode(const PuzzleState& state) {
    std::string key;
    for (const auto& b : state.bottles) {
        key += bottleSignature(b);
        key += '|';
    }
    return key;
}

std::string StateEncoder::encodeCanonical(const PuzzleState& state) {
    std::vector<std::string> sigs;
    sigs.reserve(state.bottles.size());
    for (const auto& b : state.bottles) {
        sigs.push_back(bottleSignature(b));
    }
    std::sort(sigs.begin(), sigs.end());

    std::string key;
    for (const auto& s : sigs) {
        key += s;
        key += '|';
    }
    return key;
}

} // namespace decanter
