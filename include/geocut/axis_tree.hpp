#pragma once

#include "geocut/vector.hpp"

#include <cstddef>
#include <limits>
#include <vector>

namespace geocut {

/**
 * What a visitor wants the traversal to do after seeing an edge
 */
enum class TraversalAction {
    Continue,
    Stop
};

/**
 * Outcome of a whole traversal
 */
enum class TraversalResult {
    Completed,  // every overlapping edge was visited
    Stopped     // a visitor returned TraversalAction::Stop
};

/**
 * Interval tree over the edges' extent along one axis.
 *
 * Each node holds one edge. A new edge goes to the node's "lesser" side if it
 * lies entirely below the node's range, to the "greater" side if entirely
 * above, and down the "overlaps" chain otherwise. Nodes also carry the range
 * covered by their whole subtree, so traversal can skip subtrees that cannot
 * contain a match.
 *
 * No rebalancing: edges are inserted in ring order.
 */
class AxisTree {
public:
    static constexpr std::size_t NONE = std::numeric_limits<std::size_t>::max();

    explicit AxisTree(Axis axis) : axis(axis) {}

    Axis getAxis() const { return axis; }
    std::size_t size() const { return nodes.size(); }
    bool empty() const { return nodes.empty(); }

    /**
     * Insert an edge covering [low, high] along this tree's axis
     */
    void add(std::size_t edgeIndex, double low, double high);

    /**
     * Call visitor(edgeIndex) for every edge whose range overlaps [minValue, maxValue].
     * The visitor returns a TraversalAction; Stop ends the walk immediately.
     */
    template <typename Visitor>
    TraversalResult traverse(Visitor&& visitor, double minValue, double maxValue) const {
        if (nodes.empty()) {
            return TraversalResult::Completed;
        }

        // Explicit stack: an unbalanced tree can be as deep as the edge count
        std::vector<std::size_t> pending;
        pending.push_back(0);

        while (!pending.empty()) {
            const Node& node = nodes[pending.back()];
            pending.pop_back();

            if (node.subtreeLow > maxValue || node.subtreeHigh < minValue) {
                continue;
            }

            int result = compare(node, minValue, maxValue);
            if (result == 0) {
                if (visitor(node.edgeIndex) == TraversalAction::Stop) {
                    return TraversalResult::Stopped;
                }
            }

            // Overlapping edges may reach into the query from either side
            if (node.overlaps != NONE) {
                pending.push_back(node.overlaps);
            }
            if (node.lesser != NONE && minValue < node.low) {
                pending.push_back(node.lesser);
            }
            if (node.greater != NONE && maxValue > node.high) {
                pending.push_back(node.greater);
            }
        }
        return TraversalResult::Completed;
    }

private:
    struct Node {
        std::size_t edgeIndex;
        double low, high;                   // this edge's range
        double subtreeLow, subtreeHigh;     // range of every edge below here
        std::size_t lesser = NONE;
        std::size_t greater = NONE;
        std::size_t overlaps = NONE;

        Node(std::size_t edgeIndex_, double low_, double high_)
            : edgeIndex(edgeIndex_), low(low_), high(high_), subtreeLow(low_), subtreeHigh(high_) {}
    };

    /**
     * -1 if the node lies above the range (go lesser), 1 if below (go greater), 0 if overlapping
     */
    static int compare(const Node& node, double minValue, double maxValue) {
        if (node.low > maxValue) {
            return -1;
        } else if (node.high < minValue) {
            return 1;
        }
        return 0;
    }

    Axis axis;
    std::vector<Node> nodes;
};

} // namespace geocut
