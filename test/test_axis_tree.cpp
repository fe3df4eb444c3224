#include "test_support.hpp"
#include "geocut/axis_tree.hpp"

#include <algorithm>
#include <iostream>
#include <random>
#include <vector>

using namespace geocut;
using geocut::test::Checker;

namespace {

struct Interval {
    double low;
    double high;
};

std::vector<std::size_t> bruteForce(const std::vector<Interval>& intervals, double minValue, double maxValue) {
    std::vector<std::size_t> result;
    for (std::size_t i = 0; i < intervals.size(); i++) {
        if (intervals[i].low <= maxValue && intervals[i].high >= minValue) {
            result.push_back(i);
        }
    }
    return result;
}

std::vector<std::size_t> collect(const AxisTree& tree, double minValue, double maxValue) {
    std::vector<std::size_t> result;
    tree.traverse([&](std::size_t edgeIndex) {
        result.push_back(edgeIndex);
        return TraversalAction::Continue;
    }, minValue, maxValue);
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace

int main() {
    Checker check("GeoCut Axis Tree Test");

    AxisTree empty(Axis::Y);
    int visits = 0;
    TraversalResult emptyResult = empty.traverse([&](std::size_t) {
        visits++;
        return TraversalAction::Continue;
    }, -1.0, 1.0);
    check.expect(empty.empty() && emptyResult == TraversalResult::Completed && visits == 0,
                 "empty tree completes without visits");
    check.expect(empty.getAxis() == Axis::Y, "tree remembers its axis");

    // Random intervals: short ones like edges of a detailed ring, plus some long ones
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> position(-1.0, 1.0);
    std::uniform_real_distribution<double> shortLength(0.0, 0.02);
    std::uniform_real_distribution<double> longLength(0.0, 0.8);

    std::vector<Interval> intervals;
    AxisTree tree(Axis::X);
    for (std::size_t i = 0; i < 2000; i++) {
        double low = position(rng);
        double high = low + (i % 10 == 0 ? longLength(rng) : shortLength(rng));
        intervals.push_back({low, high});
        tree.add(i, low, high);
    }
    check.expect(tree.size() == intervals.size(), "every interval was inserted");

    bool allMatch = true;
    for (int query = 0; query < 500; query++) {
        double minValue = position(rng);
        double maxValue = minValue + (query % 5 == 0 ? 0.0 : shortLength(rng) * 5.0);
        if (collect(tree, minValue, maxValue) != bruteForce(intervals, minValue, maxValue)) {
            allMatch = false;
            std::cerr << "    mismatch for [" << minValue << ", " << maxValue << "]\n";
        }
    }
    check.expect(allMatch, "traversal finds exactly the overlapping intervals");

    check.expect(collect(tree, 5.0, 6.0).empty(), "query beyond every interval finds nothing");
    check.expect(collect(tree, -10.0, 10.0).size() == intervals.size(), "query covering everything finds everything");

    // Ring-ordered intervals degenerate the tree into a chain
    AxisTree chain(Axis::Z);
    std::vector<Interval> sorted;
    for (std::size_t i = 0; i < 5000; i++) {
        double low = i * 0.001;
        sorted.push_back({low, low + 0.0015});
        chain.add(i, low, low + 0.0015);
    }
    check.expect(collect(chain, 2.5, 2.5) == bruteForce(sorted, 2.5, 2.5), "deep chain traversal is complete");

    // Early stop
    int seen = 0;
    TraversalResult stopped = tree.traverse([&](std::size_t) {
        seen++;
        return TraversalAction::Stop;
    }, -10.0, 10.0);
    check.expect(stopped == TraversalResult::Stopped && seen == 1, "Stop ends the traversal at the first visit");

    TraversalResult completed = tree.traverse([](std::size_t) { return TraversalAction::Continue; }, -10.0, 10.0);
    check.expect(completed == TraversalResult::Completed, "Continue throughout completes");

    return check.finish();
}
