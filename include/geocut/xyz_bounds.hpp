#pragma once

#include "geocut/vector.hpp"

#include <limits>

namespace geocut {

/**
 * Axis-aligned bounding volume in x/y/z.
 *
 * Every recorded point widens the box by FUDGE_FACTOR so that points computed
 * with rounding error still land inside the bounds of the shape they came from.
 */
class XYZBounds {
public:
    static constexpr double FUDGE_FACTOR = MINIMUM_RESOLUTION * 1000.0;

    XYZBounds() = default;

    XYZBounds& addPoint(const Vector& point);
    XYZBounds& addBounds(const XYZBounds& other);

    bool isEmpty() const { return minX > maxX; }

    double getMinimumX() const { return minX; }
    double getMaximumX() const { return maxX; }
    double getMinimumY() const { return minY; }
    double getMaximumY() const { return maxY; }
    double getMinimumZ() const { return minZ; }
    double getMaximumZ() const { return maxZ; }

    double getMinimum(Axis axis) const;
    double getMaximum(Axis axis) const;
    // Extent along an axis; negative infinity when empty
    double getDelta(Axis axis) const { return getMaximum(axis) - getMinimum(axis); }

    bool contains(const Vector& point) const;

private:
    double minX = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    double minZ = std::numeric_limits<double>::infinity();
    double maxZ = -std::numeric_limits<double>::infinity();
};

} // namespace geocut
