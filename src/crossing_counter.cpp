#include "geocut/crossing_counter.hpp"
#include "geocut/errors.hpp"

#include <limits>
#include <string>

namespace geocut {

namespace {

double nearestDistance(const std::vector<GeoPoint>& points, const Vector& vertex) {
    double nearest = std::numeric_limits<double>::infinity();
    for (const GeoPoint& point : points) {
        double distance = point.linearDistance(vertex);
        if (distance < nearest) {
            nearest = distance;
        }
    }
    return nearest;
}

} // namespace

bool CrossingCounter::isAtVertex(const GeoPoint& crossingPoint, const Vector& vertex) const {
    if (crossingPoint.isNumericallyIdentical(vertex)) {
        return true;
    }
    // A shallow crossing can land well past MINIMUM_RESOLUTION from a vertex on the plane
    return plane.evaluateIsZero(vertex) && crossingPoint.linearDistance(vertex) < DEPARTURE_OFFSET;
}

CrossingCounter::CrossingCounter(const PlanetModel& planetModel_, const EdgeSet& edges_, const Plane& plane_,
                                 const SidedPlane& bound1_, const SidedPlane& bound2_, const Vector& checkPoint_)
    : planetModel(planetModel_)
    , edges(edges_)
    , plane(plane_)
    , abovePlane(Plane::constructParallel(plane_, true))
    , belowPlane(Plane::constructParallel(plane_, false))
    , bound1(bound1_)
    , bound2(bound2_)
    , checkPoint(checkPoint_)
{
}

TraversalAction CrossingCounter::operator()(std::size_t edgeIndex) {
    const Edge& edge = edges.edge(edgeIndex);

    if (edge.contains(checkPoint)) {
        onEdge = true;
        return TraversalAction::Stop;
    }

    const MembershipList crossingBounds = {&bound1, &bound2, &edge.startPlane, &edge.endPlane};
    for (const GeoPoint& crossingPoint : plane.findCrossings(planetModel, edge.plane, crossingBounds)) {
        countCrossingPoint(crossingPoint, edgeIndex);
    }
    return TraversalAction::Continue;
}

void CrossingCounter::countCrossingPoint(const GeoPoint& crossingPoint, std::size_t edgeIndex) {
    const Edge& edge = edges.edge(edgeIndex);

    if (isAtVertex(crossingPoint, edge.startPoint)) {
        // The previous edge reports this vertex too
        Side edgeSide = departureSide(edge, edge.startPoint);
        if (edgeSide == Side::None) {
            return;
        }

        Side assessSide = Side::None;
        std::size_t assessIndex = findDepartingNeighbor(edgeIndex, false, assessSide);
        const Edge& assessEdge = edges.edge(assessIndex);

        // The earlier edge owns the decision whenever it sees the crossing at its own end
        const MembershipList assessBounds = {&bound1, &bound2, &assessEdge.startPlane, &assessEdge.endPlane};
        for (const GeoPoint& otherCrossing : plane.findCrossings(planetModel, assessEdge.plane, assessBounds)) {
            if (isAtVertex(otherCrossing, assessEdge.endPoint)) {
                return;
            }
        }

        if (assessSide != edgeSide) {
            crossingCount++;
        }
    } else if (isAtVertex(crossingPoint, edge.endPoint)) {
        // This is the earlier edge at the vertex; the next one defers to us
        Side edgeSide = departureSide(edge, edge.endPoint);
        if (edgeSide == Side::None) {
            return;
        }

        Side assessSide = Side::None;
        findDepartingNeighbor(edgeIndex, true, assessSide);

        if (assessSide != edgeSide) {
            crossingCount++;
        }
    } else {
        crossingCount++;
    }
}

CrossingCounter::Side CrossingCounter::departureSide(const Edge& edge, const Vector& vertex) const {
    const MembershipList segment = edge.segmentBounds();
    std::vector<GeoPoint> aboveIntersections = abovePlane.findIntersections(planetModel, edge.plane, segment);
    std::vector<GeoPoint> belowIntersections = belowPlane.findIntersections(planetModel, edge.plane, segment);

    if (aboveIntersections.empty() && belowIntersections.empty()) {
        return Side::None;
    }
    if (belowIntersections.empty()) {
        return Side::Above;
    }
    if (aboveIntersections.empty()) {
        return Side::Below;
    }

    // Edge comes back across the plane; what matters is the side next to this vertex
    double aboveDistance = nearestDistance(aboveIntersections, vertex);
    double belowDistance = nearestDistance(belowIntersections, vertex);
    if (aboveDistance < belowDistance) {
        return Side::Above;
    }
    if (belowDistance < aboveDistance) {
        return Side::Below;
    }
    throw ImpossiblePolygonError("Edge of ring " + std::to_string(edge.ring) +
                                 " leaves the cutting plane toward both sides at once");
}

std::size_t CrossingCounter::findDepartingNeighbor(std::size_t edgeIndex, bool forward, Side& side) const {
    const std::size_t ring = edges.edge(edgeIndex).ring;
    const std::size_t ringSize = edges.ringEdgeCount(ring);

    std::size_t current = edgeIndex;
    for (std::size_t step = 1; step < ringSize; step++) {
        current = forward ? edges.next(current) : edges.previous(current);
        const Edge& candidate = edges.edge(current);
        // Measure at the end that joins the chain we came along
        side = departureSide(candidate, forward ? candidate.startPoint : candidate.endPoint);
        if (side != Side::None) {
            return current;
        }
    }
    throw ImpossiblePolygonError("No edge of ring " + std::to_string(ring) + " leaves the cutting plane");
}

EdgeIntersector::EdgeIntersector(const PlanetModel& planetModel_, const EdgeSet& edges_, const Plane& plane_,
                                 const std::vector<GeoPoint>& notablePoints_, const MembershipList& bounds_)
    : planetModel(planetModel_)
    , edges(edges_)
    , plane(plane_)
    , notablePoints(notablePoints_)
    , bounds(bounds_)
{
}

TraversalAction EdgeIntersector::operator()(std::size_t edgeIndex) const {
    const Edge& edge = edges.edge(edgeIndex);
    if (plane.intersects(planetModel, edge.plane, notablePoints, edge.notablePoints, bounds, edge.segmentBounds())) {
        return TraversalAction::Stop;
    }
    return TraversalAction::Continue;
}

} // namespace geocut
