#include "geocut/edge.hpp"

namespace geocut {

Edge::Edge(const PlanetModel& planetModel, const GeoPoint& start, const GeoPoint& end, std::size_t ringIndex)
    : startPoint(start)
    , endPoint(end)
    , notablePoints{start, end}
    , plane(start, end)
    , startPlane(end, plane, start)
    , endPlane(start, plane, end)
    , ring(ringIndex)
{
    plane.recordBounds(planetModel, bounds, {&startPlane, &endPlane});
}

} // namespace geocut
