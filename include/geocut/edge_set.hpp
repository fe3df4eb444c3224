#pragma once

#include "geocut/axis_tree.hpp"
#include "geocut/edge.hpp"
#include "geocut/geo_point.hpp"
#include "geocut/planet_model.hpp"

#include <cstddef>
#include <vector>

namespace geocut {

using Ring = std::vector<GeoPoint>;
using RingList = std::vector<Ring>;

/**
 * All edges of a multi-ring polygon, stored ring after ring in one array,
 * plus one axis tree per coordinate indexing them.
 *
 * Ring r owns edges [ringStartEdge(r), ringStartEdge(r) + ringEdgeCount(r)).
 * Edge i of a ring runs from point i to point (i + 1) mod N, so N points make
 * N edges and next()/previous() wrap around within the ring.
 */
class EdgeSet {
public:
    /**
     * Build edges for every ring and register each one in all three trees.
     * Throws std::invalid_argument for an empty ring list, a ring with fewer
     * than 3 points, or adjacent points that do not define an edge plane.
     */
    EdgeSet(const PlanetModel& planetModel, const RingList& rings);

    std::size_t edgeCount() const { return edges.size(); }
    const Edge& edge(std::size_t index) const { return edges[index]; }

    std::size_t next(std::size_t index) const;
    std::size_t previous(std::size_t index) const;

    std::size_t ringCount() const { return ringStarts.size(); }
    std::size_t ringStartEdge(std::size_t ring) const { return ringStarts[ring]; }
    std::size_t ringEdgeCount(std::size_t ring) const { return ringSizes[ring]; }

    // First point of each ring
    const std::vector<GeoPoint>& getEdgePoints() const { return edgePoints; }

    const AxisTree& tree(Axis axis) const;

private:
    std::vector<Edge> edges;
    std::vector<std::size_t> ringStarts;
    std::vector<std::size_t> ringSizes;
    std::vector<GeoPoint> edgePoints;

    AxisTree xTree{Axis::X};
    AxisTree yTree{Axis::Y};
    AxisTree zTree{Axis::Z};
};

} // namespace geocut
