#include "model/bottle.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace decanter {

Bottle::Bottle(int capacity)
    : Bottle(capacity, {}, false) {}

Bottle::Bottle(int capacity, std::vector<ColorId> units, bool is_sink)
    : capacity_(capacity), is_sink_(is_sink) {
    if (capacity <= 0) {
        throw std::invalid_argument("Bottle capacity must be positive: " +
                                    std::to_string(capacity));
    }
    if (static_cast<int>(units.size()) > capacity) {
        throw std::invalid_argument("Bottle holds " + std::to_string(units.size()) +
                                    " units but capacity is " + std::to_string(capacity));
    }
    for (ColorId c : units) {
        if (c < 0) {
            throw std::invalid_argument("Invalid color id: " + std::to_string(c));
        }
    }
    units_ = std::move(units);
}

Bottle Bottle::fromSlots(const std::vector<std::optional<ColorId>>& slots, bool is_sink) {
    std::vector<ColorId> units;
    bool seen_gap = false;
    for (const auto& s : slots) {
        if (!s) {
            seen_gap = true;
            continue;
        }
        if (seen_gap) {
            throw std::invalid_argument("Bottle slots contain a gap below an occupied slot");
        }
        units.push_back(*s);
    }
    return Bottle(static_cast<int>(slots.size()), std::move(units), is_sink);
}

std::optional<ColorId> Bottle::slot(int index) const {
    if (index < 0 || index >= count()) return std::nullopt;
    return units_[index];
}

std::optional<ColorId> Bottle::topColor() const {
    if (units_.empty()) return std::nullopt;
    return units_.back();
}

int Bottle::contiguousTopCount() const {
    if (units_.empty()) return 0;
    ColorId top = units_.back();
    int run = 0;
    for (auto it = units_.rbegin(); it != units_.rend() && *it == top; ++it) {
        run++;
    }
    return run;
}

int Bottle::runCount() const {
    int runs = 0;
    for (size_t i = 0; i < units_.size(); i++) {
        if (i == 0 || units_[i] != units_[i - 1]) runs++;
    }
    return runs;
}

bool Bottle::isMonochrome() const {
    return runCount() <= 1;
}

bool Bottle::isSolvedFull() const {
    return isFull() && isMonochrome();
}

int Bottle::maxPourAmountInto(const Bottle& target) const {
    if (is_sink_ || units_.empty() || target.isFull()) return 0;
    if (!target.isEmpty() && target.topColor() != topColor()) return 0;
    return std::min(contiguousTopCount(), target.freeSpace());
}

void Bottle::push(ColorId color, int amount) {
    if (amount < 0 || amount > freeSpace()) {
        throw std::runtime_error("Bottle overflow: pushing " + std::to_string(amount) +
                                 " into " + std::to_string(freeSpace()) + " free slots");
    }
    units_.insert(units_.end(), amount, color);
}

void Bottle::pop(int amount) {
    if (amount < 0 || amount > count()) {
        throw std::runtime_error("Bottle underflow: popping " + std::to_string(amount) +
                                 " of " + std::to_string(count()) + " units");
    }
    units_.resize(units_.size() - amount);
}

std::string Bottle::toString() const {
    std::ostringstream out;
    out << (is_sink_ ? "S" : "") << "[";
    for (size_t i = 0; i < units_.size(); i++) {
        if (i > 0) out << ",";
        out << units_[i];
    }
    for (int i = count(); i < capacity_; i++) {
        out << (i > 0 ? ",_" : "_");
    }
    out << "]";
    return out.str();
}

} // namespace decanter
