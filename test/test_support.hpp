#pragma once

#include "geocut/geocut.hpp"

#include <cmath>
#include <initializer_list>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace geocut {
namespace test {

/**
 * Collects check results for one test program and prints each outcome
 */
class Checker {
public:
    explicit Checker(const std::string& title) {
        std::cout << title << "\n";
        std::cout << std::string(title.size(), '=') << "\n";
    }

    bool expect(bool condition, const std::string& what) {
        if (condition) {
            passed++;
            std::cout << "  PASS  " << what << "\n";
        } else {
            failed++;
            std::cerr << "  FAIL  " << what << "\n";
        }
        return condition;
    }

    template <typename Exception, typename Function>
    bool expectThrows(Function&& function, const std::string& what) {
        try {
            function();
        } catch (const Exception& e) {
            return expect(true, what + " (" + e.what() + ")");
        }
        return expect(false, what + " (nothing thrown)");
    }

    // Process exit code
    int finish() const {
        std::cout << "\n" << passed << " passed, " << failed << " failed\n";
        return failed == 0 ? 0 : 1;
    }

private:
    int passed = 0;
    int failed = 0;
};

inline GeoPoint degrees(double latitude, double longitude, const PlanetModel& planetModel = PlanetModel::SPHERE) {
    return GeoPoint::fromDegrees(planetModel, latitude, longitude);
}

// Ring from (latitude, longitude) pairs in degrees
inline Ring ringFromDegrees(std::initializer_list<std::pair<double, double>> vertices,
                            const PlanetModel& planetModel = PlanetModel::SPHERE) {
    Ring ring;
    for (const auto& [latitude, longitude] : vertices) {
        ring.push_back(degrees(latitude, longitude, planetModel));
    }
    return ring;
}

// Point where the ray from the center along direction meets the surface
inline GeoPoint onSurface(const PlanetModel& planetModel, const Vector& direction) {
    double scale = 1.0 / std::sqrt((direction.x * direction.x + direction.y * direction.y) *
                                       planetModel.getInverseAbSquared() +
                                   direction.z * direction.z * planetModel.getInverseCSquared());
    return GeoPoint(direction * scale);
}

/**
 * Convex ring around (lat 0, lon 0): vertex i lies in direction
 * (1, radius * cos(t), radius * sin(t)) with t = 2 pi i / vertexCount.
 * Vertex 0 sits on the equator.
 */
inline Ring regularRing(const PlanetModel& planetModel, int vertexCount, double radius) {
    Ring ring;
    for (int i = 0; i < vertexCount; i++) {
        double angle = 2.0 * M_PI * i / vertexCount;
        ring.push_back(onSurface(planetModel, Vector(1.0, radius * std::cos(angle), radius * std::sin(angle))));
    }
    return ring;
}

/**
 * Containment in a convex ring whose edges are all planes through the center:
 * inside means on the same side of every edge plane as the ring's center.
 * clear is set to false when the point is within margin of an edge plane.
 */
inline bool convexContains(const Ring& ring, const Vector& center, const Vector& point, double margin, bool& clear) {
    bool inside = true;
    clear = true;
    for (std::size_t i = 0; i < ring.size(); i++) {
        Vector normal = ring[i].crossProduct(ring[(i + 1) % ring.size()]).normalize();
        double side = normal.dotProduct(point) / point.magnitude();
        if (std::abs(side) < margin) {
            clear = false;
        }
        if ((side > 0.0) != (normal.dotProduct(center) > 0.0)) {
            inside = false;
        }
    }
    return inside;
}

} // namespace test
} // namespace geocut
