#include "geocut/geocut.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct BenchmarkInput {
    geocut::RingList rings;
    geocut::GeoPoint testPoint;
    bool testPointInSet;
    std::string name;
};

// Coastline-like outline around (lat 0, lon 0) with a few lakes cut out
BenchmarkInput createSyntheticCountry(const geocut::PlanetModel& planetModel, int vertices) {
    std::mt19937 gen(42);
    std::uniform_real_distribution<> jitter(-0.4, 0.4);

    BenchmarkInput input;
    input.name = "synthetic coastline (" + std::to_string(vertices) + " vertices, 3 lakes)";

    geocut::Ring coast;
    for (int i = 0; i < vertices; i++) {
        double angle = 2.0 * M_PI * i / vertices;
        double radius = 12.0 + 2.5 * std::sin(7.0 * angle) + 1.2 * std::cos(23.0 * angle) + jitter(gen);
        coast.push_back(geocut::GeoPoint::fromDegrees(planetModel, radius * std::sin(angle), radius * std::cos(angle)));
    }
    input.rings.push_back(coast);

    const double lakeCenters[][2] = {{4.0, 2.0}, {-3.0, -4.0}, {1.0, -5.0}};
    for (const auto& center : lakeCenters) {
        geocut::Ring lake;
        for (int i = 0; i < 64; i++) {
            double angle = -2.0 * M_PI * i / 64;
            lake.push_back(geocut::GeoPoint::fromDegrees(planetModel, center[0] + 1.5 * std::sin(angle),
                                                         center[1] + 1.5 * std::cos(angle)));
        }
        input.rings.push_back(lake);
    }

    input.testPoint = geocut::GeoPoint::fromDegrees(planetModel, 0.0, 0.0);
    input.testPointInSet = true;
    return input;
}

BenchmarkInput loadRingFile(const std::string& path, const geocut::PlanetModel& planetModel) {
    BenchmarkInput input;
    input.name = path;
    input.rings = geocut::readRings(path, planetModel);
    if (input.rings.empty()) {
        throw std::runtime_error("No rings in " + path);
    }
    // The antipode of the first vertex is far from a polygon this size: outside
    const geocut::GeoPoint& first = input.rings.front().front();
    input.testPoint = geocut::GeoPoint::fromDegrees(planetModel,
                                                    -first.getLatitude(planetModel) * 180.0 / M_PI,
                                                    first.getLongitude() * 180.0 / M_PI + 180.0);
    input.testPointInSet = false;
    return input;
}

const geocut::PlanetModel& planetModelNamed(const std::string& name) {
    if (name == "sphere") {
        return geocut::PlanetModel::SPHERE;
    }
    if (name == "wgs84") {
        return geocut::PlanetModel::WGS84;
    }
    throw std::invalid_argument("Unknown planet model '" + name + "' (expected sphere or wgs84)");
}

void benchmarkPolygon(const geocut::PlanetModel& planetModel, const BenchmarkInput& input, int queryCount) {
    std::size_t totalVertices = 0;
    for (const auto& ring : input.rings) {
        totalVertices += ring.size();
    }

    std::cout << "GeoCut Complex Polygon Benchmark\n";
    std::cout << "================================\n\n";
    std::cout << "Input: " << input.name << "\n";
    std::cout << "  Rings: " << input.rings.size() << ", vertices: " << totalVertices << "\n\n";

    auto buildStart = std::chrono::high_resolution_clock::now();
    geocut::ComplexPolygon polygon(planetModel, input.rings, input.testPoint, input.testPointInSet);
    auto buildEnd = std::chrono::high_resolution_clock::now();
    auto buildTime = std::chrono::duration_cast<std::chrono::microseconds>(buildEnd - buildStart);
    std::cout << "Construction: " << buildTime.count() << "us\n";

    geocut::XYZBounds bounds;
    polygon.getBounds(bounds);
    std::cout << "Bounds: x [" << bounds.getMinimumX() << ", " << bounds.getMaximumX() << "]"
              << " y [" << bounds.getMinimumY() << ", " << bounds.getMaximumY() << "]"
              << " z [" << bounds.getMinimumZ() << ", " << bounds.getMaximumZ() << "]\n\n";

    // Sample inside the polygon's box so that most queries reach real edges
    std::mt19937 gen(7);
    std::uniform_real_distribution<> xs(bounds.getMinimumX(), bounds.getMaximumX());
    std::uniform_real_distribution<> ys(bounds.getMinimumY(), bounds.getMaximumY());
    std::uniform_real_distribution<> zs(bounds.getMinimumZ(), bounds.getMaximumZ());
    std::vector<geocut::GeoPoint> queries;
    queries.reserve(queryCount);
    for (int i = 0; i < queryCount; i++) {
        geocut::Vector direction(xs(gen), ys(gen), zs(gen));
        double scale = 1.0 / std::sqrt((direction.x * direction.x + direction.y * direction.y) *
                                           planetModel.getInverseAbSquared() +
                                       direction.z * direction.z * planetModel.getInverseCSquared());
        queries.emplace_back(direction * scale);
    }

    auto queryStart = std::chrono::high_resolution_clock::now();
    int inside = 0;
    for (const auto& query : queries) {
        if (polygon.isWithin(query)) {
            inside++;
        }
    }
    auto queryEnd = std::chrono::high_resolution_clock::now();
    double queryTime = std::chrono::duration_cast<std::chrono::nanoseconds>(queryEnd - queryStart).count() / 1000.0;

    std::cout << "Containment: " << queryCount << " queries in " << std::fixed << std::setprecision(1)
              << queryTime << "us\n";
    std::cout << "  Average per query: " << std::setprecision(3) << queryTime / queryCount << "us\n";
    std::cout << "  Inside: " << inside << " (" << std::setprecision(1) << 100.0 * inside / queryCount << "%)\n\n";

    // Brute force reference: every query would otherwise look at every edge
    std::cout << "Edges per query without the trees: " << polygon.edges().edgeCount() << "\n";

    std::vector<geocut::GeoPoint> noNotablePoints;
    auto planeStart = std::chrono::high_resolution_clock::now();
    int hits = 0;
    for (int i = 0; i < 90; i++) {
        double latitude = -45.0 + i;
        geocut::Plane latitudePlane = geocut::Plane::constructFixed(
            geocut::Axis::Z, geocut::GeoPoint::fromDegrees(planetModel, latitude, 0.0).z);
        if (polygon.intersects(latitudePlane, noNotablePoints)) {
            hits++;
        }
    }
    auto planeEnd = std::chrono::high_resolution_clock::now();
    auto planeTime = std::chrono::duration_cast<std::chrono::microseconds>(planeEnd - planeStart);
    std::cout << "Intersection: 90 latitude planes in " << planeTime.count() << "us, " << hits << " hit\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::string path = argc > 1 ? argv[1] : "";
        const geocut::PlanetModel& planetModel = planetModelNamed(argc > 2 ? argv[2] : "wgs84");
        int queryCount = argc > 3 ? std::atoi(argv[3]) : 100000;
        if (queryCount <= 0) {
            std::cerr << "Query count must be positive\n";
            return 1;
        }

        BenchmarkInput input = path.empty() || path == "-"
            ? createSyntheticCountry(planetModel, 20000)
            : loadRingFile(path, planetModel);
        benchmarkPolygon(planetModel, input, queryCount);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
