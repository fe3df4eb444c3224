#include "test_support.hpp"
#include "geocut/edge.hpp"

#include <cmath>
#include <iostream>
#include <vector>

using namespace geocut;
using geocut::test::Checker;
using geocut::test::degrees;

int main() {
    Checker check("GeoCut Kernel Test");

    // Planet models
    check.expectThrows<std::invalid_argument>([] { PlanetModel flat(0.0, 1.0); }, "zero semi-axis rejected");
    check.expectThrows<std::invalid_argument>([] { PlanetModel broken(1.0, std::nan("")); }, "NaN semi-axis rejected");
    check.expect(PlanetModel::SPHERE.isSphere(), "SPHERE is a sphere");
    check.expect(!PlanetModel::WGS84.isSphere() && PlanetModel::WGS84.getAb() > PlanetModel::WGS84.getC(),
                 "WGS84 is oblate");

    // Geodetic points land on the surface and round-trip
    for (const PlanetModel* model : {&PlanetModel::SPHERE, &PlanetModel::WGS84}) {
        GeoPoint p = degrees(47.26, 11.39, *model);
        double surface = (p.x * p.x + p.y * p.y) * model->getInverseAbSquared() + p.z * p.z * model->getInverseCSquared();
        check.expect(std::abs(surface - 1.0) < 1e-12, "geodetic point lies on the surface");
        check.expect(std::abs(p.getLatitude(*model) * 180.0 / M_PI - 47.26) < 1e-9, "latitude round-trips");
        check.expect(std::abs(p.getLongitude() * 180.0 / M_PI - 11.39) < 1e-9, "longitude round-trips");
    }
    check.expect(degrees(90.0, 0.0).getLongitude() == 0.0, "longitude at the pole is 0");

    // A plane through two points contains both
    GeoPoint a = degrees(10.0, -10.0);
    GeoPoint b = degrees(10.0, 10.0);
    Plane ab(a, b);
    check.expect(ab.evaluateIsZero(a) && ab.evaluateIsZero(b), "plane through two points contains both");
    check.expect(!ab.evaluateIsZero(degrees(0.0, 0.0)), "plane through two points misses a third");
    check.expectThrows<std::invalid_argument>([&] { Plane degenerate(a, a); }, "plane through identical points rejected");
    check.expectThrows<std::invalid_argument>([&] { Plane degenerate(a, a * -1.0); }, "plane through antipodal points rejected");

    // Sidedness
    GeoPoint middle = degrees(0.0, 0.0);
    SidedPlane sided(middle, ab, a);
    check.expect(sided.isWithin(middle), "side point is within its sided plane");
    check.expect(sided.isWithin(b), "far end of the arc is within the start cutoff");
    check.expect(!sided.isWithin(degrees(10.0, -30.0)), "point past the start is outside the cutoff");
    check.expect(sided.isWithin(a), "point on the sided plane counts as within");
    check.expect(!SidedPlane::constructPerpendicular(a, ab, a).has_value(),
                 "side point on the perpendicular plane cannot orient it");
    check.expect(!Plane::constructPerpendicular(Plane::constructFixed(Axis::Z, 0.0), Vector(0.0, 0.0, 1.0)).has_value(),
                 "perpendicular through the normal direction is undefined");
    check.expectThrows<std::invalid_argument>([&] { SidedPlane degenerate(a, ab, a); }, "throwing constructor rejects it too");

    // Meridian plane against the equator
    Plane meridian(Vector(1.0, 0.0, 0.0), Vector(0.0, 0.0, 1.0));
    Plane equator = Plane::constructFixed(Axis::Z, 0.0);
    std::vector<GeoPoint> hits = meridian.findIntersections(PlanetModel::SPHERE, equator);
    check.expect(hits.size() == 2, "meridian meets the equator twice");
    bool foundPositive = false, foundNegative = false;
    for (const GeoPoint& hit : hits) {
        foundPositive = foundPositive || hit.isNumericallyIdentical(1.0, 0.0, 0.0);
        foundNegative = foundNegative || hit.isNumericallyIdentical(-1.0, 0.0, 0.0);
    }
    check.expect(foundPositive && foundNegative, "intersections are (1,0,0) and (-1,0,0)");

    SidedPlane positiveX(Vector(1.0, 0.0, 0.0), Plane::constructFixed(Axis::Y, 0.0), Vector(0.0, 0.0, 1.0));
    check.expect(equator.findIntersections(PlanetModel::SPHERE, meridian, {&positiveX}).size() == 1,
                 "a bound removes the far intersection");
    check.expect(equator.findIntersections(PlanetModel::SPHERE, Plane::constructFixed(Axis::Z, 0.5)).empty(),
                 "parallel planes have no intersection");

    // Tangency: x = 1 touches the unit sphere at (1,0,0)
    Plane tangent = Plane::constructFixed(Axis::X, 1.0);
    Plane yZero = Plane::constructFixed(Axis::Y, 0.0);
    std::vector<GeoPoint> touch = tangent.findIntersections(PlanetModel::SPHERE, yZero);
    check.expect(touch.size() == 1 && touch[0].isNumericallyIdentical(1.0, 0.0, 0.0), "tangent line touches once");
    check.expect(tangent.findCrossings(PlanetModel::SPHERE, yZero).empty(), "a tangent touch is not a crossing");
    check.expect(equator.findCrossings(PlanetModel::SPHERE, meridian).size() == 2, "transversal planes do cross");

    // Bounds of an arc enclose the whole arc
    Edge edge(PlanetModel::SPHERE, a, b, 0);
    GeoPoint arcMiddle((a + b).normalize());
    check.expect(edge.bounds.contains(a) && edge.bounds.contains(b), "edge bounds contain both endpoints");
    check.expect(arcMiddle.z > a.z && edge.bounds.contains(arcMiddle), "edge bounds contain the arc's poleward bulge");
    check.expect(!edge.bounds.contains(Vector(0.0, 0.0, 1.0)), "edge bounds exclude the pole");
    check.expect(edge.contains(arcMiddle), "edge contains its midpoint");
    check.expect(edge.contains(a) && edge.contains(b), "edge contains its endpoints");
    check.expect(!edge.contains(degrees(10.0, 30.0)), "edge excludes points past its end");

    XYZBounds wgsBounds;
    Edge wgsEdge(PlanetModel::WGS84, degrees(-5.0, 20.0, PlanetModel::WGS84), degrees(5.0, 20.0, PlanetModel::WGS84), 0);
    wgsBounds.addBounds(wgsEdge.bounds);
    check.expect(wgsBounds.contains(degrees(0.0, 20.0, PlanetModel::WGS84)), "WGS84 arc bounds contain the arc");

    // Whole-plane bounds
    XYZBounds latitudeCircle;
    Plane::constructFixed(Axis::Z, std::sin(60.0 * M_PI / 180.0)).recordBounds(PlanetModel::SPHERE, latitudeCircle);
    check.expect(std::abs(latitudeCircle.getMaximumX() - 0.5) < 1e-8 && std::abs(latitudeCircle.getMinimumX() + 0.5) < 1e-8,
                 "latitude circle x extent is its radius");
    XYZBounds missed;
    Plane::constructFixed(Axis::Z, 2.0).recordBounds(PlanetModel::SPHERE, missed);
    check.expect(missed.isEmpty(), "a plane that misses the planet records nothing");

    XYZBounds empty;
    check.expect(empty.isEmpty(), "new bounds are empty");
    empty.addBounds(missed);
    check.expect(empty.isEmpty(), "adding empty bounds keeps them empty");

    return check.finish();
}
