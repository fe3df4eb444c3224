#pragma once

#include "geocut/axis_tree.hpp"
#include "geocut/edge_set.hpp"
#include "geocut/plane.hpp"
#include "geocut/planet_model.hpp"

#include <cstddef>

namespace geocut {

/**
 * Tree visitor counting how often the polygon boundary crosses the arc of a
 * cutting plane between bound1 and bound2.
 *
 * A crossing that lands exactly on a ring vertex is reported by both edges
 * meeting there. It is counted once, by the earlier edge, and only when the
 * two edges leave the plane toward opposite sides.
 *
 * Also watches for checkPoint lying on a visited edge; when it does the
 * visitor stops the traversal and isOnEdge() becomes true.
 */
class CrossingCounter {
public:
    CrossingCounter(const PlanetModel& planetModel, const EdgeSet& edges, const Plane& plane,
                    const SidedPlane& bound1, const SidedPlane& bound2, const Vector& checkPoint);

    TraversalAction operator()(std::size_t edgeIndex);

    int getCrossingCount() const { return crossingCount; }
    bool isOnEdge() const { return onEdge; }

private:
    enum class Side {
        None,
        Above,
        Below
    };

    void countCrossingPoint(const GeoPoint& crossingPoint, std::size_t edgeIndex);

    bool isAtVertex(const GeoPoint& crossingPoint, const Vector& vertex) const;

    // Side the edge heads toward when leaving the plane at vertex
    Side departureSide(const Edge& edge, const Vector& vertex) const;

    // Walk along the ring to the nearest edge that actually leaves the plane
    std::size_t findDepartingNeighbor(std::size_t edgeIndex, bool forward, Side& side) const;

    const PlanetModel& planetModel;
    const EdgeSet& edges;
    const Plane& plane;
    Plane abovePlane;
    Plane belowPlane;
    const SidedPlane& bound1;
    const SidedPlane& bound2;
    Vector checkPoint;

    int crossingCount = 0;
    bool onEdge = false;
};

/**
 * Tree visitor that stops at the first edge intersecting a bounded plane
 */
class EdgeIntersector {
public:
    EdgeIntersector(const PlanetModel& planetModel, const EdgeSet& edges, const Plane& plane,
                    const std::vector<GeoPoint>& notablePoints, const MembershipList& bounds);

    TraversalAction operator()(std::size_t edgeIndex) const;

private:
    const PlanetModel& planetModel;
    const EdgeSet& edges;
    const Plane& plane;
    const std::vector<GeoPoint>& notablePoints;
    const MembershipList& bounds;
};

} // namespace geocut
