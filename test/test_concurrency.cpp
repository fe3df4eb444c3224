#include "test_support.hpp"

#include <iostream>
#include <random>
#include <thread>
#include <vector>

using namespace geocut;
using geocut::test::Checker;
using geocut::test::degrees;
using geocut::test::onSurface;
using geocut::test::regularRing;

int main() {
    Checker check("GeoCut Concurrency Test");

    const PlanetModel& model = PlanetModel::WGS84;
    Ring outer = regularRing(model, 500, std::tan(15.0 * M_PI / 180.0));
    Ring hole = regularRing(model, 100, std::tan(4.0 * M_PI / 180.0));
    ComplexPolygon polygon(model, RingList{outer, hole}, onSurface(model, Vector(1.0, 0.0, 0.0)), false);

    std::mt19937 rng(2024);
    std::uniform_real_distribution<double> offset(-0.4, 0.4);
    std::vector<GeoPoint> queries;
    for (int i = 0; i < 4000; i++) {
        queries.push_back(onSurface(model, Vector(1.0, offset(rng), offset(rng))));
    }

    std::vector<char> sequential(queries.size());
    for (std::size_t i = 0; i < queries.size(); i++) {
        sequential[i] = polygon.isWithin(queries[i]);
    }

    const unsigned threadCount = 8;
    std::vector<char> parallel(queries.size());
    std::vector<std::thread> workers;
    for (unsigned t = 0; t < threadCount; t++) {
        workers.emplace_back([&, t] {
            for (std::size_t i = t; i < queries.size(); i += threadCount) {
                parallel[i] = polygon.isWithin(queries[i]);
            }
        });
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    check.expect(parallel == sequential, "parallel queries match sequential results");

    std::size_t inside = 0;
    for (char result : sequential) {
        inside += result ? 1 : 0;
    }
    std::cout << "  " << inside << " of " << queries.size() << " points inside\n";
    check.expect(inside > 0 && inside < queries.size(), "queries cover both inside and outside");
    check.expect(!polygon.isWithin(degrees(0, 0, model)), "hole center is outside");
    check.expect(polygon.isWithin(degrees(0, 10, model)), "ring band is inside");

    return check.finish();
}
