#pragma once

#include "geocut/vector.hpp"
#include "geocut/geo_point.hpp"
#include "geocut/planet_model.hpp"
#include "geocut/xyz_bounds.hpp"

#include <optional>
#include <vector>

namespace geocut {

/**
 * Offset of the reference planes used to tell which side of a cutting plane
 * an edge leaves toward. Larger than MINIMUM_RESOLUTION so that the
 * extension of an edge past its own endpoint is never mistaken for a departure.
 */
constexpr double DEPARTURE_OFFSET = MINIMUM_RESOLUTION * 100.0;

/**
 * Anything that can decide whether a point is inside it
 */
class Membership {
public:
    virtual ~Membership() = default;
    virtual bool isWithin(const Vector& point) const = 0;
};

using MembershipList = std::vector<const Membership*>;

class SidedPlane;
using SidedPlaneList = std::vector<const SidedPlane*>;

/**
 * Plane normal . p + D = 0 with a unit normal.
 *
 * Its intersection with the planet surface is an ellipse; for planes through
 * the origin that is a great circle (or its ellipsoidal equivalent).
 */
class Plane {
public:
    Plane(const Vector& normal, double D);

    /**
     * Plane through the origin and both points.
     * Throws std::invalid_argument if the points are identical or antipodal.
     */
    Plane(const Vector& A, const Vector& B);

    // Plane of constant coordinate, e.g. z = value for Axis::Z
    static Plane constructFixed(Axis axis, double value);

    // Parallel plane shifted by DEPARTURE_OFFSET to one side
    static Plane constructParallel(const Plane& base, bool above);

    /**
     * Plane through the origin and point that is perpendicular to plane.
     * Empty when point is (numerically) along plane's normal.
     */
    static std::optional<Plane> constructPerpendicular(const Plane& plane, const Vector& point);

    const Vector& getNormal() const { return normal; }
    double getD() const { return D; }

    double evaluate(const Vector& v) const {
        return normal.dotProduct(v) + D;
    }

    bool evaluateIsZero(const Vector& v) const;

    bool isNumericallyIdentical(const Plane& other) const;

    /**
     * Surface points on both this plane and other that satisfy every bound.
     * Parallel or identical planes yield nothing; a tangent line yields one point.
     */
    std::vector<GeoPoint> findIntersections(const PlanetModel& planetModel, const Plane& other,
                                            const MembershipList& bounds = {}) const;

    /**
     * Like findIntersections, but only points where the two surface curves
     * actually cross. A tangent touch is not a crossing.
     */
    std::vector<GeoPoint> findCrossings(const PlanetModel& planetModel, const Plane& other,
                                        const MembershipList& bounds = {}) const;

    /**
     * Whether the bounded part of this plane meets the bounded part of other.
     * If the two planes coincide, the notable points of each shape are tested
     * against the other shape's bounds instead.
     */
    bool intersects(const PlanetModel& planetModel, const Plane& other,
                    const std::vector<GeoPoint>& notablePoints,
                    const std::vector<GeoPoint>& otherNotablePoints,
                    const MembershipList& bounds,
                    const MembershipList& otherBounds) const;

    /**
     * Add the part of this plane's surface curve inside all bounds to the
     * bounding volume: axis extremes of the curve plus its endpoints on the
     * bounding planes.
     */
    void recordBounds(const PlanetModel& planetModel, XYZBounds& xyzBounds,
                      const SidedPlaneList& bounds = {}) const;

protected:
    Vector normal;
    double D;
};

/**
 * Half-space bounded by a plane through the origin, with a known inside point
 */
class SidedPlane : public Plane, public Membership {
public:
    /**
     * Plane through the origin and intersectionPoint, perpendicular to plane,
     * with sidePoint on the inside.
     * Throws std::invalid_argument if that plane is undefined or sidePoint is on it.
     */
    SidedPlane(const Vector& sidePoint, const Plane& plane, const Vector& intersectionPoint);

    // Same construction, empty instead of throwing
    static std::optional<SidedPlane> constructPerpendicular(const Vector& sidePoint, const Plane& plane,
                                                            const Vector& intersectionPoint);

    bool isWithin(const Vector& point) const override;

private:
    SidedPlane(const Plane& plane, double sigNum);

    double sigNum;
};

} // namespace geocut
