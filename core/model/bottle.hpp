#pragma once

#include <optional>
#include <string>
#include <vector>

namespace decanter {

/// Identifier of a liquid color. Valid colors are non-negative.
using ColorId = int;

// ─── Bottle ────────────────────────────────────────────────────
// Fixed-capacity stack of color units, stored bottom to top.
// Occupied slots are contiguous from the bottom, so the stack holds
// no gaps and never more units than its capacity.
//
// A sink bottle accepts pours but can never be the source of one.

class Bottle {
public:
    explicit Bottle(int capacity);
    Bottle(int capacity, std::vector<ColorId> units, bool is_sink = false);

    /// Build from a slot view (bottom to top, nullopt = empty slot).
    /// Throws std::invalid_argument if an occupied slot sits above an empty one.
    static Bottle fromSlots(const std::vector<std::optional<ColorId>>& slots,
                            bool is_sink = false);

    int capacity() const { return capacity_; }
    int count() const { return static_cast<int>(units_.size()); }
    int freeSpace() const { return capacity_ - count(); }
    bool isSink() const { return is_sink_; }
    bool isEmpty() const { return units_.empty(); }
    bool isFull() const { return count() == capacity_; }

    const std::vector<ColorId>& units() const { return units_; }

    /// Color in slot `index` (0 = bottom), or nullopt if the slot is empty.
    std::optional<ColorId> slot(int index) const;

    std::optional<ColorId> topColor() const;

    /// Length of the run of equal colors at the top of the stack.
    int contiguousTopCount() const;

    /// Number of same-color runs in the stack (0 for an empty bottle).
    int runCount() const;

    /// True when every occupied slot holds the same color (vacuously true when empty).
    bool isMonochrome() const;

    /// Full and monochrome.
    bool isSolvedFull() const;

    /// Units a pour from this bottle into `target` would move under the play rules.
    /// Zero if this bottle is a sink or empty, the target is full, or the target
    /// top color differs from this bottle's top color.
    int maxPourAmountInto(const Bottle& target) const;

    void push(ColorId color, int amount);
    void pop(int amount);

    std::string toString() const;

    bool operator==(const Bottle& other) const {
        return capacity_ == other.capacity_ && is_sink_ == other.is_sink_ &&
               units_ == other.units_;
    }
    bool operator!=(const Bottle& other) const { return !(*this == other); }

private:
    int capacity_ = 0;
    bool is_sink_ = false;
    std::vector<ColorId> units_;
};

} // namespace decanter
