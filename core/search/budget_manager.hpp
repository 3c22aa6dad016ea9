#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace decanter {

/// Node and wall-clock budget of one bounded computation.
///
/// Budgets nest: a run started under a deadline asks `sliceMillis` for
/// its own time cap and never outlives the parent. A budget built
/// without a node limit is a pure deadline.
class BudgetManager {
public:
    static constexpr int kUnlimitedNodes = std::numeric_limits<int>::max();

    explicit BudgetManager(int max_millis, int max_nodes = kUnlimitedNodes)
        : max_millis_(max_millis), max_nodes_(max_nodes) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        nodes_ = 0;
    }

    void recordNode() { nodes_++; }

    bool canContinue() const {
        return !isNodeExhausted() && !isTimeExhausted();
    }

    double elapsedMillis() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(now - start_time_).count();
    }

    /// Whole milliseconds left before the deadline, never negative.
    int remainingMillis() const {
        double left = max_millis_ - elapsedMillis();
        return left <= 0.0 ? 0 : static_cast<int>(std::floor(left));
    }

    /// Time cap for a nested run: `cap`, or what is left if that is less.
    /// Zero means the deadline has passed.
    int sliceMillis(int cap) const { return std::max(0, std::min(cap, remainingMillis())); }

    int nodes() const { return nodes_; }
    int maxNodes() const { return max_nodes_; }
    int maxMillis() const { return max_millis_; }
    bool isTimeExhausted() const { return elapsedMillis() >= max_millis_; }
    bool isNodeExhausted() const { return nodes_ >= max_nodes_; }

private:
    int max_millis_;
    int max_nodes_;
    int nodes_ = 0;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace decanter
