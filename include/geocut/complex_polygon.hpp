#pragma once

#include "geocut/edge_set.hpp"
#include "geocut/geo_point.hpp"
#include "geocut/plane.hpp"
#include "geocut/planet_model.hpp"
#include "geocut/xyz_bounds.hpp"

#include <optional>
#include <vector>

namespace geocut {

/**
 * Polygon with any number of rings (outer boundaries and holes) and a very
 * large number of edges.
 *
 * Setup is O(N). Queries only look at the edges that an axis tree selects, so
 * evaluation is O(log N) in the best case instead of a scan of every edge.
 *
 * Containment uses the even/odd rule relative to a test point whose state is
 * known: the polygon boundary is crossed an even number of times between two
 * points that are both inside or both outside.
 *
 * Immutable after construction; all queries are const and may run concurrently.
 */
class ComplexPolygon {
public:
    /**
     * @param planetModel the surface all points live on
     * @param pointsList one point list per ring; each ring is implicitly closed,
     *        so N points describe N edges. Adjacent points must differ, and no
     *        two edges may intersect.
     * @param testPoint a point whose in/out state is known
     * @param testPointInSet true if testPoint is inside the polygon
     *
     * Throws std::invalid_argument when a ring cannot form edges.
     */
    ComplexPolygon(const PlanetModel& planetModel, const RingList& pointsList,
                   const GeoPoint& testPoint, bool testPointInSet);

    /**
     * Points on an edge count as inside.
     * Throws ImpossiblePolygonError if the rings violate the construction contract.
     */
    bool isWithin(double x, double y, double z) const;
    bool isWithin(const Vector& point) const;

    /**
     * True if any polygon edge meets the part of plane inside bounds
     */
    bool intersects(const Plane& plane, const std::vector<GeoPoint>& notablePoints,
                    const MembershipList& bounds = {}) const;

    // Add every edge's bounds to the caller's accumulator
    void getBounds(XYZBounds& bounds) const;

    // One point per ring
    const std::vector<GeoPoint>& getEdgePoints() const { return edgeSet.getEdgePoints(); }

    const GeoPoint& getTestPoint() const { return testPoint; }
    bool isTestPointInSet() const { return testPointInSet; }
    const PlanetModel& getPlanetModel() const { return planetModel; }
    const EdgeSet& edges() const { return edgeSet; }

private:
    /**
     * Arc of an axis-fixed plane running from one point to another, fenced in
     * by a cutoff plane at each end
     */
    struct Leg {
        Plane plane;
        Axis fixedAxis;
        SidedPlane fromCutoff;
        SidedPlane toCutoff;
    };

    struct CrossingTally {
        int count;
        bool onEdge;
    };

    // Empty when the two points are opposite each other on the plane's circle
    static std::optional<Leg> buildLeg(const Plane& plane, Axis fixedAxis, const Vector& from, const Vector& to);

    CrossingTally countCrossings(const Leg& leg, const Vector& checkPoint) const;

    bool isWithinTwoPlanes(const Vector& point) const;

    bool isOnBoundary(const Vector& point) const;

    bool fromParity(int crossingCount) const {
        return (crossingCount & 1) == 0 ? testPointInSet : !testPointInSet;
    }

    const Plane& testPointPlane(Axis axis) const;

    PlanetModel planetModel;
    EdgeSet edgeSet;
    GeoPoint testPoint;
    bool testPointInSet;

    // Fixed-coordinate planes through the test point; Z is the horizontal default
    Plane testPointFixedXPlane;
    Plane testPointFixedYPlane;
    Plane testPointFixedZPlane;
};

} // namespace geocut
