#pragma once

#include "geocut/geo_point.hpp"
#include "geocut/plane.hpp"
#include "geocut/planet_model.hpp"
#include "geocut/xyz_bounds.hpp"

#include <cstddef>
#include <vector>

namespace geocut {

/**
 * One directed boundary segment of a ring.
 *
 * The segment is the part of plane between startPoint and endPoint that lies
 * inside both startPlane and endPlane. Ring neighbors are not stored here;
 * EdgeSet derives them from the edge's position in its ring.
 */
struct Edge {
    GeoPoint startPoint;
    GeoPoint endPoint;
    std::vector<GeoPoint> notablePoints;
    Plane plane;
    SidedPlane startPlane;   // through startPoint, endPoint inside
    SidedPlane endPlane;     // through endPoint, startPoint inside
    XYZBounds bounds;
    std::size_t ring;

    // Throws std::invalid_argument if the points are identical or antipodal
    Edge(const PlanetModel& planetModel, const GeoPoint& start, const GeoPoint& end, std::size_t ringIndex);

    // Membership list restricting a search to this segment
    MembershipList segmentBounds() const { return {&startPlane, &endPlane}; }

    // True when point lies on this segment, endpoints included
    bool contains(const Vector& point) const {
        return plane.evaluateIsZero(point) && startPlane.isWithin(point) && endPlane.isWithin(point);
    }
};

} // namespace geocut
