#include "geocut/axis_tree.hpp"

#include <algorithm>

namespace geocut {

void AxisTree::add(std::size_t edgeIndex, double low, double high) {
    std::size_t newIndex = nodes.size();
    if (nodes.empty()) {
        nodes.emplace_back(edgeIndex, low, high);
        return;
    }

    std::size_t current = 0;
    while (true) {
        // Widen every subtree the new edge passes through
        Node& node = nodes[current];
        node.subtreeLow = std::min(node.subtreeLow, low);
        node.subtreeHigh = std::max(node.subtreeHigh, high);

        int result = compare(node, low, high);
        std::size_t& child = result < 0 ? node.lesser : (result > 0 ? node.greater : node.overlaps);
        if (child == NONE) {
            child = newIndex;
            break;
        }
        current = child;
    }
    // Only grow the arena after the last reference into it is done with
    nodes.emplace_back(edgeIndex, low, high);
}

} // namespace geocut
