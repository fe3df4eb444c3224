#include "geocut/edge_set.hpp"

#include <stdexcept>
#include <string>

namespace geocut {

EdgeSet::EdgeSet(const PlanetModel& planetModel, const RingList& rings) {
    if (rings.empty()) {
        throw std::invalid_argument("A polygon needs at least one ring");
    }

    std::size_t totalPoints = 0;
    for (const Ring& ring : rings) {
        totalPoints += ring.size();
    }
    edges.reserve(totalPoints);
    ringStarts.reserve(rings.size());
    ringSizes.reserve(rings.size());
    edgePoints.reserve(rings.size());

    for (std::size_t r = 0; r < rings.size(); r++) {
        const Ring& ring = rings[r];
        if (ring.size() < 3) {
            throw std::invalid_argument("Ring " + std::to_string(r) + " has " +
                                        std::to_string(ring.size()) + " points; at least 3 are required");
        }

        ringStarts.push_back(edges.size());
        ringSizes.push_back(ring.size());
        edgePoints.push_back(ring.front());

        for (std::size_t i = 0; i < ring.size(); i++) {
            const GeoPoint& start = ring[i];
            const GeoPoint& end = ring[(i + 1) % ring.size()];
            try {
                edges.emplace_back(planetModel, start, end, r);
            } catch (const std::invalid_argument& e) {
                throw std::invalid_argument("Ring " + std::to_string(r) + ", edge " + std::to_string(i) +
                                            ": " + e.what());
            }
        }
    }

    for (std::size_t i = 0; i < edges.size(); i++) {
        const XYZBounds& bounds = edges[i].bounds;
        xTree.add(i, bounds.getMinimumX(), bounds.getMaximumX());
        yTree.add(i, bounds.getMinimumY(), bounds.getMaximumY());
        zTree.add(i, bounds.getMinimumZ(), bounds.getMaximumZ());
    }
}

std::size_t EdgeSet::next(std::size_t index) const {
    const std::size_t first = ringStarts[edges[index].ring];
    const std::size_t count = ringSizes[edges[index].ring];
    return first + (index - first + 1) % count;
}

std::size_t EdgeSet::previous(std::size_t index) const {
    const std::size_t first = ringStarts[edges[index].ring];
    const std::size_t count = ringSizes[edges[index].ring];
    return first + (index - first + count - 1) % count;
}

const AxisTree& EdgeSet::tree(Axis axis) const {
    switch (axis) {
        case Axis::X: return xTree;
        case Axis::Y: return yTree;
        default: return zTree;
    }
}

} // namespace geocut
