#include "cvrp.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace {

std::vector<Point> table() {
    return {{"DC", 0, 0}, {"A", 2, 100}, {"B", 1, 200}, {"C", 4, 50}};
}

DistanceTable full_distances() {
    DistanceTable d;
    std::vector<Point> t = table();
    for (size_t i = 0; i < t.size(); ++i)
        for (size_t j = i + 1; j < t.size(); ++j)
            d.set(t[i].id, t[j].id, 10.0 * (i + 1) + j);
    return d;
}

} // namespace

TEST(CVRPTest, AddsOriginAtFrontWhenAbsent) {
    CVRP cvrp;
    cvrp.build({"B", "A"}, table(), full_distances(), "DC");
    ASSERT_EQ(cvrp.nPoints(), 3);
    EXPECT_EQ(cvrp.originIndex, 0);
    EXPECT_EQ(cvrp.originId(), "DC");
    EXPECT_EQ(cvrp.id(1), "B");
    EXPECT_EQ(cvrp.id(2), "A");
    EXPECT_DOUBLE_EQ(cvrp.points[1].weight, 200.0);
}

TEST(CVRPTest, KeepsOriginPositionWhenListed) {
    CVRP cvrp;
    cvrp.build({"A", "DC", "C"}, table(), full_distances(), "DC");
    EXPECT_EQ(cvrp.originIndex, 1);
    EXPECT_EQ(cvrp.nPoints(), 3);
}

TEST(CVRPTest, DistancesAreMaterializedByPosition) {
    CVRP cvrp;
    cvrp.build({"A", "B"}, table(), full_distances(), "DC");
    EXPECT_DOUBLE_EQ(cvrp.distance(0, 1), 11.0);  // DC-A
    EXPECT_DOUBLE_EQ(cvrp.distance(2, 1), 22.0);  // B-A, pelo par reverso
    EXPECT_DOUBLE_EQ(cvrp.distance(1, 1), 0.0);
}

TEST(CVRPTest, MissingPairFailsOnlyWhenQueried) {
    DistanceTable d;
    d.set("DC", "A", 1.0);
    d.set("DC", "B", 1.0);
    CVRP cvrp;
    ASSERT_NO_THROW(cvrp.build({"A", "B"}, table(), d, "DC"));
    EXPECT_DOUBLE_EQ(cvrp.distance(0, 2), 1.0);
    EXPECT_THROW(cvrp.distance(1, 2), UnknownPairError);
}

TEST(CVRPTest, RejectsInconsistentInput) {
    CVRP cvrp;
    EXPECT_THROW(cvrp.build({"A", "Z"}, table(), full_distances(), "DC"), ConfigurationError);
    EXPECT_THROW(cvrp.build({"A", "A"}, table(), full_distances(), "DC"), ConfigurationError);
    EXPECT_THROW(cvrp.build({"A"}, table(), full_distances(), "XX"), ConfigurationError);
}

TEST(CVRPTest, ReadsPointTableAndIdList) {
    std::string tablePath = temp_path("points.txt");
    write_file(tablePath, "# id pallets lbs\nDC 0 0\nA 2 150.5\n\nB 1 20 # loja B\n");
    std::vector<Point> points = readPointTable(tablePath);
    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[1].id, "A");
    EXPECT_DOUBLE_EQ(points[1].weight, 150.5);

    std::string idsPath = temp_path("ids.csv");
    write_file(idsPath, "A,Loja A\nB\n\n");
    std::vector<std::string> ids = readPointIdsFromFile(idsPath);
    EXPECT_EQ(ids, (std::vector<std::string>{"A", "B"}));
}

TEST(CVRPTest, PointTableRejectsBadLines) {
    std::string path = temp_path("points.txt");
    write_file(path, "A 1\n");
    EXPECT_THROW(readPointTable(path), ConfigurationError);
    write_file(path, "A -1 5\n");
    EXPECT_THROW(readPointTable(path), ConfigurationError);
    EXPECT_THROW(readPointTable(temp_path("nao_existe.txt")), std::runtime_error);
}
