#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <fstream>
#include <random>

CVRP make_uniform_instance(int nStops, double pallets, double weight, double dist) {
    std::vector<Point> table;
    std::vector<std::string> ids;
    table.push_back(Point{"O", 0.0, 0.0});
    for (int i = 1; i <= nStops; ++i) {
        std::string id = "P" + std::to_string(i);
        table.push_back(Point{id, pallets, weight});
        ids.push_back(id);
    }

    DistanceTable distances;
    for (size_t a = 0; a < table.size(); ++a)
        for (size_t b = a + 1; b < table.size(); ++b)
            distances.set(table[a].id, table[b].id, dist);

    CVRP cvrp;
    cvrp.build(ids, table, distances, "O");
    return cvrp;
}

CVRP make_random_instance(int nStops, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> coord(-100.0, 100.0);
    std::uniform_int_distribution<int> pallets(1, 8);
    std::uniform_real_distribution<double> weight(100.0, 4000.0);

    std::vector<Point> table;
    std::vector<std::pair<double, double>> xy;
    std::vector<std::string> ids;
    table.push_back(Point{"DC", 0.0, 0.0});
    xy.push_back({0.0, 0.0});
    for (int i = 0; i < nStops; ++i) {
        std::string id = "S" + std::to_string(i);
        table.push_back(Point{id, static_cast<double>(pallets(gen)), weight(gen)});
        xy.push_back({coord(gen), coord(gen)});
        ids.push_back(id);
    }

    DistanceTable distances;
    for (size_t a = 0; a < table.size(); ++a) {
        for (size_t b = 0; b < table.size(); ++b) {
            if (a == b) continue;
            double dx = xy[a].first - xy[b].first;
            double dy = xy[a].second - xy[b].second;
            distances.set(table[a].id, table[b].id, std::sqrt(dx * dx + dy * dy));
        }
    }

    CVRP cvrp;
    cvrp.build(ids, table, distances, "DC");
    return cvrp;
}

CVRP_Params make_cvrp_params(const std::string& origin, double maxPallets, double maxWeight) {
    CVRP_Params p;
    p.origin = origin;
    p.maxPallets = maxPallets;
    p.maxWeight = maxWeight;
    return p;
}

std::string temp_path(const std::string& name) {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string dir = ::testing::TempDir();
    if (!dir.empty() && dir.back() != '/') dir += '/';
    std::string prefix = info ? std::string(info->test_suite_name()) + "_" + info->name() + "_" : "";
    return dir + prefix + name;
}

void write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path);
    ASSERT_TRUE(out.is_open()) << path;
    out << contents;
}
