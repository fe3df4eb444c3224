#include "geocut/complex_polygon.hpp"
#include "geocut/crossing_counter.hpp"
#include "geocut/errors.hpp"

#include <sstream>

namespace geocut {

namespace {

const Axis PLANE_ORDER[] = {Axis::Z, Axis::X, Axis::Y};

/**
 * Tree for a search along an axis-fixed plane: whichever of the other two
 * axes spans less of the arc
 */
Axis chooseTreeAxis(const XYZBounds& bounds, Axis fixedAxis) {
    Axis first, second;
    switch (fixedAxis) {
        case Axis::X: first = Axis::Y; second = Axis::Z; break;
        case Axis::Y: first = Axis::X; second = Axis::Z; break;
        default: first = Axis::X; second = Axis::Y; break;
    }
    return bounds.getDelta(first) <= bounds.getDelta(second) ? first : second;
}

} // namespace

ComplexPolygon::ComplexPolygon(const PlanetModel& planetModel_, const RingList& pointsList,
                               const GeoPoint& testPoint_, bool testPointInSet_)
    : planetModel(planetModel_)
    , edgeSet(planetModel_, pointsList)
    , testPoint(testPoint_)
    , testPointInSet(testPointInSet_)
    , testPointFixedXPlane(Plane::constructFixed(Axis::X, testPoint_.x))
    , testPointFixedYPlane(Plane::constructFixed(Axis::Y, testPoint_.y))
    , testPointFixedZPlane(Plane::constructFixed(Axis::Z, testPoint_.z))
{
}

bool ComplexPolygon::isWithin(double x, double y, double z) const {
    return isWithin(Vector(x, y, z));
}

bool ComplexPolygon::isWithin(const Vector& point) const {
    if (testPoint.isNumericallyIdentical(point)) {
        return testPointInSet;
    }

    // A point sharing one of the test point's planes needs a single cutting plane
    for (Axis axis : PLANE_ORDER) {
        const Plane& plane = testPointPlane(axis);
        if (!plane.evaluateIsZero(point)) {
            continue;
        }
        std::optional<Leg> leg = buildLeg(plane, axis, testPoint, point);
        if (!leg) {
            continue;
        }
        CrossingTally tally = countCrossings(*leg, point);
        if (tally.onEdge) {
            return true;
        }
        return fromParity(tally.count);
    }

    return isWithinTwoPlanes(point);
}

bool ComplexPolygon::isWithinTwoPlanes(const Vector& point) const {
    struct Path {
        Leg first;
        Leg second;
        double length;
    };
    std::optional<Path> best;

    // Route test point -> intermediate -> point, turning where a test-point
    // plane meets a plane through the query point
    for (Axis testAxis : PLANE_ORDER) {
        const Plane& testPlane = testPointPlane(testAxis);
        for (Axis travelAxis : PLANE_ORDER) {
            if (travelAxis == testAxis) {
                continue;
            }
            Plane travelPlane = Plane::constructFixed(travelAxis, point.component(travelAxis));
            for (const GeoPoint& intermediate : testPlane.findIntersections(planetModel, travelPlane)) {
                if (intermediate.isNumericallyIdentical(testPoint) || intermediate.isNumericallyIdentical(point)) {
                    continue;
                }
                double length = testPoint.linearDistance(intermediate) + intermediate.linearDistance(point);
                if (best && length >= best->length) {
                    continue;
                }
                std::optional<Leg> first = buildLeg(testPlane, testAxis, testPoint, intermediate);
                if (!first) {
                    continue;
                }
                std::optional<Leg> second = buildLeg(travelPlane, travelAxis, intermediate, point);
                if (!second) {
                    continue;
                }
                // A boundary through the turning point would be seen by both legs
                if (isOnBoundary(intermediate)) {
                    continue;
                }
                best = Path{*first, *second, length};
            }
        }
    }

    if (!best) {
        std::ostringstream message;
        message << "No cutting path from the test point reaches (" << point.x << ", " << point.y << ", " << point.z << ")";
        throw ImpossiblePolygonError(message.str());
    }

    CrossingTally first = countCrossings(best->first, point);
    if (first.onEdge) {
        return true;
    }
    CrossingTally second = countCrossings(best->second, point);
    if (second.onEdge) {
        return true;
    }
    return fromParity(first.count + second.count);
}

std::optional<ComplexPolygon::Leg> ComplexPolygon::buildLeg(const Plane& plane, Axis fixedAxis,
                                                            const Vector& from, const Vector& to) {
    std::optional<SidedPlane> fromCutoff = SidedPlane::constructPerpendicular(to, plane, from);
    if (!fromCutoff) {
        return std::nullopt;
    }
    std::optional<SidedPlane> toCutoff = SidedPlane::constructPerpendicular(from, plane, to);
    if (!toCutoff) {
        return std::nullopt;
    }
    return Leg{plane, fixedAxis, *fromCutoff, *toCutoff};
}

ComplexPolygon::CrossingTally ComplexPolygon::countCrossings(const Leg& leg, const Vector& checkPoint) const {
    XYZBounds legBounds;
    leg.plane.recordBounds(planetModel, legBounds, {&leg.fromCutoff, &leg.toCutoff});

    CrossingCounter counter(planetModel, edgeSet, leg.plane, leg.fromCutoff, leg.toCutoff, checkPoint);
    Axis axis = chooseTreeAxis(legBounds, leg.fixedAxis);
    edgeSet.tree(axis).traverse(counter, legBounds.getMinimum(axis), legBounds.getMaximum(axis));

    return CrossingTally{counter.getCrossingCount(), counter.isOnEdge()};
}

bool ComplexPolygon::isOnBoundary(const Vector& point) const {
    TraversalResult result = edgeSet.tree(Axis::X).traverse(
        [&](std::size_t edgeIndex) {
            return edgeSet.edge(edgeIndex).contains(point) ? TraversalAction::Stop : TraversalAction::Continue;
        },
        point.x, point.x);
    return result == TraversalResult::Stopped;
}

bool ComplexPolygon::intersects(const Plane& plane, const std::vector<GeoPoint>& notablePoints,
                                const MembershipList& bounds) const {
    XYZBounds planeBounds;
    plane.recordBounds(planetModel, planeBounds);
    if (planeBounds.isEmpty()) {
        return false;
    }

    // Drill down along whichever axis the plane spans least
    double xDelta = planeBounds.getDelta(Axis::X);
    double yDelta = planeBounds.getDelta(Axis::Y);
    double zDelta = planeBounds.getDelta(Axis::Z);
    Axis axis;
    if (xDelta <= yDelta && xDelta <= zDelta) {
        axis = Axis::X;
    } else if (yDelta <= zDelta) {
        axis = Axis::Y;
    } else {
        axis = Axis::Z;
    }

    EdgeIntersector intersector(planetModel, edgeSet, plane, notablePoints, bounds);
    return edgeSet.tree(axis).traverse(intersector, planeBounds.getMinimum(axis), planeBounds.getMaximum(axis)) ==
           TraversalResult::Stopped;
}

void ComplexPolygon::getBounds(XYZBounds& bounds) const {
    for (std::size_t ring = 0; ring < edgeSet.ringCount(); ring++) {
        const std::size_t startEdge = edgeSet.ringStartEdge(ring);
        std::size_t current = startEdge;
        do {
            bounds.addBounds(edgeSet.edge(current).bounds);
            current = edgeSet.next(current);
        } while (current != startEdge);
    }
}

const Plane& ComplexPolygon::testPointPlane(Axis axis) const {
    switch (axis) {
        case Axis::X: return testPointFixedXPlane;
        case Axis::Y: return testPointFixedYPlane;
        default: return testPointFixedZPlane;
    }
}

} // namespace geocut
