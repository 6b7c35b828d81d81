#include "solver.hpp"
#include "errors.hpp"
#include "evaluation.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <map>
#include <set>

namespace {

ACO_Params quick_params() {
    ACO_Params params;
    params.nAnts = 6;
    params.nIter = 8;
    params.alpha = 1.0;
    params.beta = 2.0;
    params.rho = 0.5;
    params.Q = 50.0;
    return params;
}

} // namespace

TEST(SolverTest, EveryStopRoutedOnceWithinCapacity) {
    for (unsigned seed = 1; seed <= 5; ++seed) {
        CVRP cvrp = make_random_instance(18, seed);
        CVRP_Params p = make_cvrp_params("DC", 14.0, 9000.0);
        MemoryRouteStore store;
        rng.seed(seed);

        SolveResult r = solve_cvrp("sol", cvrp, p, quick_params(), store);
        ASSERT_EQ(r.status, SolveStatus::Solved);

        std::multiset<std::string> points;
        std::map<int, double> pallets, weight;
        std::map<std::string, int> position;
        for (int i = 0; i < cvrp.nPoints(); ++i) position[cvrp.id(i)] = i;
        for (const RouteRecord& rec : r.records) {
            EXPECT_EQ(rec.solutionId, "sol");
            EXPECT_NE(rec.point, "DC");
            points.insert(rec.point);
            pallets[rec.routeNumber] += cvrp.points[position[rec.point]].pallets;
            weight[rec.routeNumber] += cvrp.points[position[rec.point]].weight;
        }
        EXPECT_EQ(points.size(), 18u);
        for (int i = 0; i < cvrp.nPoints(); ++i)
            if (i != cvrp.originIndex) EXPECT_EQ(points.count(cvrp.id(i)), 1u);
        for (const auto& e : pallets) EXPECT_LE(e.second, p.maxPallets);
        for (const auto& e : weight) EXPECT_LE(e.second, p.maxWeight);

        EXPECT_TRUE(check_feasibility(build_routes(r.records, cvrp), cvrp, p));
        EXPECT_NEAR(calculate_total_cost(build_routes(r.records, cvrp)), r.bestLength, 1e-6);
    }
}

TEST(SolverTest, PersistsRecordsAndOrigin) {
    CVRP cvrp = make_random_instance(6, 3);
    CVRP_Params p = make_cvrp_params("DC", 10.0, 8000.0);
    MemoryRouteStore store;
    rng.seed(8);

    SolveResult r = solve_cvrp("abc", cvrp, p, quick_params(), store);
    StoredSolution s = store.load("abc");
    EXPECT_EQ(s.origin, "DC");
    EXPECT_EQ(s.records, r.records);
}

TEST(SolverTest, SecondSolveReportsAlreadyExists) {
    CVRP cvrp = make_random_instance(8, 2);
    CVRP_Params p = make_cvrp_params("DC", 10.0, 8000.0);
    MemoryRouteStore store;
    rng.seed(4);

    SolveResult first = solve_cvrp("dup", cvrp, p, quick_params(), store);
    ASSERT_EQ(first.status, SolveStatus::Solved);
    StoredSolution before = store.load("dup");

    int iterations = 0;
    ACO_Callbacks cb;
    cb.onIteration = [&](int, double, double) { ++iterations; };
    SolveResult second = solve_cvrp("dup", cvrp, p, quick_params(), store, cb);

    EXPECT_EQ(second.status, SolveStatus::AlreadyExists);
    EXPECT_TRUE(second.records.empty());
    EXPECT_EQ(iterations, 0);
    EXPECT_EQ(store.saveCount(), 1);
    EXPECT_EQ(store.load("dup").records, before.records);
}

TEST(SolverTest, FourUnitStopsWithPalletLimitTwoMakeTwoRoutes) {
    CVRP cvrp = make_uniform_instance(4, 1.0, 10.0, 1.0);
    CVRP_Params p = make_cvrp_params("O", 2.0, 1000.0);
    ACO_Params params;
    params.nAnts = 1;
    params.nIter = 1;
    MemoryRouteStore store;
    rng.seed(13);

    SolveResult r = solve_cvrp("four", cvrp, p, params, store);
    ASSERT_EQ(r.records.size(), 4u);

    std::map<int, int> perRoute;
    for (const RouteRecord& rec : r.records) perRoute[rec.routeNumber]++;
    ASSERT_EQ(perRoute.size(), 2u);
    EXPECT_EQ(perRoute[1], 2);
    EXPECT_EQ(perRoute[2], 2);
    EXPECT_DOUBLE_EQ(r.bestLength, 6.0);
}

TEST(SolverTest, OversizedPointFailsBeforeSearch) {
    std::vector<Point> table = {{"O", 0, 0}, {"A", 1, 10}, {"BIG", 5, 10}};
    DistanceTable d;
    d.set("O", "A", 1.0);
    d.set("O", "BIG", 1.0);
    d.set("A", "BIG", 1.0);
    CVRP cvrp;
    cvrp.build({"A", "BIG"}, table, d, "O");
    CVRP_Params p = make_cvrp_params("O", 2.0, 1000.0);

    int iterations = 0;
    ACO_Callbacks cb;
    cb.onIteration = [&](int, double, double) { ++iterations; };
    MemoryRouteStore store;

    try {
        solve_cvrp("big", cvrp, p, quick_params(), store, cb);
        FAIL() << "esperava InfeasiblePointError";
    } catch (const InfeasiblePointError& e) {
        EXPECT_EQ(e.point, "BIG");
        EXPECT_EQ(e.dimension, "pallets");
    }
    EXPECT_EQ(iterations, 0);
    EXPECT_FALSE(store.exists("big"));
}

TEST(SolverTest, OverweightPointFailsBeforeSearch) {
    CVRP cvrp = make_uniform_instance(3, 1.0, 2000.0);
    CVRP_Params p = make_cvrp_params("O", 10.0, 1500.0);
    MemoryRouteStore store;
    EXPECT_THROW(solve_cvrp("heavy", cvrp, p, quick_params(), store), InfeasiblePointError);
    EXPECT_FALSE(store.exists("heavy"));
}

TEST(SolverTest, InvalidConfigurationFailsBeforeSearch) {
    CVRP cvrp = make_uniform_instance(3, 1.0, 1.0);
    CVRP_Params p = make_cvrp_params("O", 2.0, 100.0);
    ACO_Params params = quick_params();
    params.nAnts = 0;
    MemoryRouteStore store;
    EXPECT_THROW(solve_cvrp("cfg", cvrp, p, params, store), ConfigurationError);

    CVRP_Params otherOrigin = make_cvrp_params("X", 2.0, 100.0);
    EXPECT_THROW(solve_cvrp("cfg", cvrp, otherOrigin, quick_params(), store), ConfigurationError);
    EXPECT_EQ(store.saveCount(), 0);
}

TEST(SolverTest, OriginOnlyInstanceIsRejected) {
    std::vector<Point> table = {{"O", 0, 0}};
    DistanceTable d;
    CVRP cvrp;
    cvrp.build({"O"}, table, d, "O");
    MemoryRouteStore store;
    EXPECT_THROW(solve_cvrp("vazio", cvrp, make_cvrp_params("O", 2.0, 10.0), quick_params(), store),
                 ConfigurationError);
}

TEST(SolverTest, UnknownPairAbortsWithoutSaving) {
    std::vector<Point> table = {{"O", 0, 0}, {"A", 1, 1}, {"B", 1, 1}};
    DistanceTable d;
    d.set("O", "A", 1.0);
    d.set("O", "B", 1.0);
    CVRP cvrp;
    cvrp.build({"A", "B"}, table, d, "O");
    MemoryRouteStore store;
    rng.seed(2);
    EXPECT_THROW(solve_cvrp("gap", cvrp, make_cvrp_params("O", 5.0, 10.0), quick_params(), store),
                 UnknownPairError);
    EXPECT_FALSE(store.exists("gap"));
}

TEST(SolverTest, SameSeedSameDecomposition) {
    CVRP cvrp = make_random_instance(12, 17);
    CVRP_Params p = make_cvrp_params("DC", 12.0, 9000.0);
    MemoryRouteStore a, b;

    rng.seed(99);
    SolveResult ra = solve_cvrp("s", cvrp, p, quick_params(), a);
    rng.seed(99);
    SolveResult rb = solve_cvrp("s", cvrp, p, quick_params(), b);

    EXPECT_EQ(ra.bestPath, rb.bestPath);
    EXPECT_EQ(ra.records, rb.records);
}
