#pragma once

namespace geocut {

/**
 * Ellipsoid of revolution that all points live on.
 *
 * Semi-axes are expressed in units of the planet's mean radius, so the
 * sphere is (1, 1) and WGS84 is within a fraction of a percent of it.
 * Surface: (x^2 + y^2) / ab^2 + z^2 / c^2 = 1
 */
class PlanetModel {
public:
    static const PlanetModel SPHERE;
    static const PlanetModel WGS84;

    // Throws std::invalid_argument for non-positive or non-finite axes
    PlanetModel(double ab, double c);

    double getAb() const { return ab; }
    double getC() const { return c; }
    double getInverseAbSquared() const { return inverseAbSquared; }
    double getInverseCSquared() const { return inverseCSquared; }

    bool isSphere() const { return ab == c; }

    bool operator==(const PlanetModel& other) const {
        return ab == other.ab && c == other.c;
    }
    bool operator!=(const PlanetModel& other) const { return !(*this == other); }

private:
    double ab;
    double c;
    double inverseAbSquared;
    double inverseCSquared;
};

} // namespace geocut
