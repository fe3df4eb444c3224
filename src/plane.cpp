#include "geocut/plane.hpp"

#include <cmath>
#include <stdexcept>

namespace geocut {

namespace {

/**
 * Where a line meets the planet surface
 */
struct SurfaceHits {
    int count = 0;          // 0, 1 or 2
    bool tangent = false;   // single touching point
    Vector points[2];
};

/**
 * Line shared by two planes: a point on it plus a unit direction.
 * Returns false for parallel (or identical) planes.
 */
bool computeIntersectionLine(const Plane& a, const Plane& b, Vector& point, Vector& direction) {
    const Vector& n1 = a.getNormal();
    const Vector& n2 = b.getNormal();
    Vector line = n1.crossProduct(n2);
    double lineMagnitude = line.magnitude();
    if (lineMagnitude < MINIMUM_RESOLUTION) {
        return false;
    }

    // point = alpha * n1 + beta * n2 satisfying both plane equations
    double cosine = n1.dotProduct(n2);
    double det = lineMagnitude * lineMagnitude;
    double alpha = (-a.getD() + b.getD() * cosine) / det;
    double beta = (-b.getD() + a.getD() * cosine) / det;

    point = n1 * alpha + n2 * beta;
    direction = line * (1.0 / lineMagnitude);
    return true;
}

SurfaceHits intersectLineWithSurface(const PlanetModel& planetModel, const Vector& point, const Vector& direction) {
    const double iab = planetModel.getInverseAbSquared();
    const double ic = planetModel.getInverseCSquared();

    // Quadratic in t for (point + t * direction) on the ellipsoid
    double a = (direction.x * direction.x + direction.y * direction.y) * iab + direction.z * direction.z * ic;
    double b = 2.0 * ((point.x * direction.x + point.y * direction.y) * iab + point.z * direction.z * ic);
    double c = (point.x * point.x + point.y * point.y) * iab + point.z * point.z * ic - 1.0;

    SurfaceHits hits;
    double discriminant = b * b - 4.0 * a * c;
    if (std::abs(discriminant) < MINIMUM_RESOLUTION_SQUARED) {
        double t = -b / (2.0 * a);
        hits.count = 1;
        hits.tangent = true;
        hits.points[0] = point + direction * t;
    } else if (discriminant > 0.0) {
        double root = std::sqrt(discriminant);
        double t1 = (-b + root) / (2.0 * a);
        double t2 = (-b - root) / (2.0 * a);
        hits.count = 2;
        hits.points[0] = point + direction * t1;
        hits.points[1] = point + direction * t2;
    }
    return hits;
}

bool meetsAllBounds(const Vector& point, const MembershipList& bounds) {
    for (const Membership* bound : bounds) {
        if (!bound->isWithin(point)) {
            return false;
        }
    }
    return true;
}

Vector unitAxis(Axis axis) {
    switch (axis) {
        case Axis::X: return Vector(1.0, 0.0, 0.0);
        case Axis::Y: return Vector(0.0, 1.0, 0.0);
        default: return Vector(0.0, 0.0, 1.0);
    }
}

std::vector<GeoPoint> boundedSurfacePoints(const PlanetModel& planetModel, const Plane& a, const Plane& b,
                                           const MembershipList& bounds, bool crossingsOnly) {
    std::vector<GeoPoint> result;
    Vector point, direction;
    if (!computeIntersectionLine(a, b, point, direction)) {
        return result;
    }

    SurfaceHits hits = intersectLineWithSurface(planetModel, point, direction);
    if (hits.tangent && crossingsOnly) {
        return result;
    }
    for (int i = 0; i < hits.count; i++) {
        if (meetsAllBounds(hits.points[i], bounds)) {
            result.emplace_back(hits.points[i]);
        }
    }
    return result;
}

} // namespace

Plane::Plane(const Vector& normal_, double D_) : normal(normal_), D(D_) {}

Plane::Plane(const Vector& A, const Vector& B) : D(0.0) {
    Vector cross = A.crossProduct(B);
    if (cross.magnitude() < MINIMUM_RESOLUTION) {
        throw std::invalid_argument("Plane through identical or antipodal points is undefined");
    }
    normal = cross.normalize();
}

Plane Plane::constructFixed(Axis axis, double value) {
    return Plane(unitAxis(axis), -value);
}

Plane Plane::constructParallel(const Plane& base, bool above) {
    return Plane(base.normal, above ? base.D + DEPARTURE_OFFSET : base.D - DEPARTURE_OFFSET);
}

std::optional<Plane> Plane::constructPerpendicular(const Plane& plane, const Vector& point) {
    Vector cross = plane.normal.crossProduct(point);
    if (cross.magnitude() < MINIMUM_RESOLUTION) {
        return std::nullopt;
    }
    return Plane(cross.normalize(), 0.0);
}

bool Plane::evaluateIsZero(const Vector& v) const {
    return std::abs(evaluate(v)) < MINIMUM_RESOLUTION;
}

bool Plane::isNumericallyIdentical(const Plane& other) const {
    if (normal.crossProduct(other.normal).magnitude() >= MINIMUM_RESOLUTION) {
        return false;
    }
    // Same orientation compares D directly, flipped orientation compares -D
    if (normal.dotProduct(other.normal) > 0.0) {
        return std::abs(D - other.D) < MINIMUM_RESOLUTION;
    }
    return std::abs(D + other.D) < MINIMUM_RESOLUTION;
}

std::vector<GeoPoint> Plane::findIntersections(const PlanetModel& planetModel, const Plane& other,
                                               const MembershipList& bounds) const {
    return boundedSurfacePoints(planetModel, *this, other, bounds, false);
}

std::vector<GeoPoint> Plane::findCrossings(const PlanetModel& planetModel, const Plane& other,
                                           const MembershipList& bounds) const {
    return boundedSurfacePoints(planetModel, *this, other, bounds, true);
}

bool Plane::intersects(const PlanetModel& planetModel, const Plane& other,
                       const std::vector<GeoPoint>& notablePoints,
                       const std::vector<GeoPoint>& otherNotablePoints,
                       const MembershipList& bounds,
                       const MembershipList& otherBounds) const {
    if (isNumericallyIdentical(other)) {
        // Same curve: the shapes overlap if either one's notable points fall in the other's bounds
        for (const GeoPoint& point : notablePoints) {
            if (meetsAllBounds(point, otherBounds)) {
                return true;
            }
        }
        for (const GeoPoint& point : otherNotablePoints) {
            if (meetsAllBounds(point, bounds)) {
                return true;
            }
        }
        return false;
    }

    MembershipList allBounds(bounds);
    allBounds.insert(allBounds.end(), otherBounds.begin(), otherBounds.end());
    return !findIntersections(planetModel, other, allBounds).empty();
}

void Plane::recordBounds(const PlanetModel& planetModel, XYZBounds& xyzBounds,
                         const SidedPlaneList& bounds) const {
    MembershipList memberships(bounds.begin(), bounds.end());

    // Map the ellipsoid onto the unit sphere, where the curve is a circle
    const double ab = planetModel.getAb();
    const double c = planetModel.getC();
    Vector scaledNormal(normal.x * ab, normal.y * ab, normal.z * c);
    double k = scaledNormal.magnitude();
    Vector unitNormal = scaledNormal * (1.0 / k);
    double unitD = D / k;

    double radiusSquared = 1.0 - unitD * unitD;
    if (radiusSquared < -MINIMUM_RESOLUTION) {
        // Plane misses the surface
        return;
    }

    auto toSurface = [ab, c](const Vector& u) {
        return Vector(u.x * ab, u.y * ab, u.z * c);
    };
    auto recordIfWithin = [&](const Vector& point) {
        if (meetsAllBounds(point, memberships)) {
            xyzBounds.addPoint(point);
        }
    };

    Vector center = unitNormal * (-unitD);
    double radius = radiusSquared > 0.0 ? std::sqrt(radiusSquared) : 0.0;

    if (radius < MINIMUM_RESOLUTION) {
        recordIfWithin(toSurface(center));
    } else {
        const Axis axes[] = {Axis::X, Axis::Y, Axis::Z};
        for (Axis axis : axes) {
            Vector along = unitAxis(axis) - unitNormal * unitNormal.component(axis);
            double alongMagnitude = along.magnitude();
            if (alongMagnitude < MINIMUM_RESOLUTION) {
                // Plane is perpendicular to this axis; the coordinate is constant
                continue;
            }
            Vector offset = along * (radius / alongMagnitude);
            recordIfWithin(toSurface(center + offset));
            recordIfWithin(toSurface(center - offset));
        }
    }

    // Endpoints where the bounding planes cut the curve
    for (const SidedPlane* bound : bounds) {
        for (const GeoPoint& point : findIntersections(planetModel, *bound, memberships)) {
            xyzBounds.addPoint(point);
        }
    }
}

SidedPlane::SidedPlane(const Plane& plane, double sigNum_) : Plane(plane), sigNum(sigNum_) {}

SidedPlane::SidedPlane(const Vector& sidePoint, const Plane& plane, const Vector& intersectionPoint)
    : Plane(plane), sigNum(1.0) {
    std::optional<SidedPlane> constructed = constructPerpendicular(sidePoint, plane, intersectionPoint);
    if (!constructed) {
        throw std::invalid_argument("Cannot determine sidedness: side point lies on the bounding plane");
    }
    *this = *constructed;
}

std::optional<SidedPlane> SidedPlane::constructPerpendicular(const Vector& sidePoint, const Plane& plane,
                                                             const Vector& intersectionPoint) {
    std::optional<Plane> perpendicular = Plane::constructPerpendicular(plane, intersectionPoint);
    if (!perpendicular) {
        return std::nullopt;
    }
    double side = perpendicular->evaluate(sidePoint);
    if (std::abs(side) < MINIMUM_RESOLUTION) {
        return std::nullopt;
    }
    return SidedPlane(*perpendicular, side > 0.0 ? 1.0 : -1.0);
}

bool SidedPlane::isWithin(const Vector& point) const {
    double result = evaluate(point);
    if (std::abs(result) < MINIMUM_RESOLUTION) {
        return true;
    }
    return (result > 0.0) == (sigNum > 0.0);
}

} // namespace geocut
