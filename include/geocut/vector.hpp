#pragma once

#include <cmath>

namespace geocut {

/**
 * Smallest distance (in planet-radius units) that the kernel treats as significant.
 * Component differences and plane evaluations below this are considered zero.
 */
constexpr double MINIMUM_RESOLUTION = 1.0e-12;
constexpr double MINIMUM_RESOLUTION_SQUARED = MINIMUM_RESOLUTION * MINIMUM_RESOLUTION;

/**
 * Coordinate axis selector, used by the axis trees and the bounds
 */
enum class Axis {
    X,
    Y,
    Z
};

/**
 * 3-D vector / point relative to the planet center
 */
struct Vector {
    double x, y, z;

    Vector() : x(0.0), y(0.0), z(0.0) {}
    Vector(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    double component(Axis axis) const {
        switch (axis) {
            case Axis::X: return x;
            case Axis::Y: return y;
            default: return z;
        }
    }

    double dotProduct(const Vector& v) const {
        return x * v.x + y * v.y + z * v.z;
    }

    Vector crossProduct(const Vector& v) const {
        return Vector(y * v.z - z * v.y,
                      z * v.x - x * v.z,
                      x * v.y - y * v.x);
    }

    double magnitude() const {
        return std::sqrt(x * x + y * y + z * z);
    }

    // Unit vector in the same direction; the zero vector stays zero
    Vector normalize() const {
        double m = magnitude();
        if (m < MINIMUM_RESOLUTION) {
            return Vector();
        }
        return Vector(x / m, y / m, z / m);
    }

    double linearDistance(const Vector& v) const {
        double dx = x - v.x, dy = y - v.y, dz = z - v.z;
        return std::sqrt(dx * dx + dy * dy + dz * dz);
    }

    /**
     * Compare component-by-component within MINIMUM_RESOLUTION.
     * This is how every "same point" decision in the library is made.
     */
    bool isNumericallyIdentical(double ox, double oy, double oz) const {
        return std::abs(x - ox) < MINIMUM_RESOLUTION &&
               std::abs(y - oy) < MINIMUM_RESOLUTION &&
               std::abs(z - oz) < MINIMUM_RESOLUTION;
    }

    bool isNumericallyIdentical(const Vector& v) const {
        return isNumericallyIdentical(v.x, v.y, v.z);
    }

    Vector operator+(const Vector& v) const { return Vector(x + v.x, y + v.y, z + v.z); }
    Vector operator-(const Vector& v) const { return Vector(x - v.x, y - v.y, z - v.z); }
    Vector operator*(double s) const { return Vector(x * s, y * s, z * s); }
};

} // namespace geocut
