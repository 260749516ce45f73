#include <gtest/gtest.h>
#include "errors.h"
#include "geometry/polygon_zone.h"
#include "test_helpers.h"

using namespace zwatch;
using zwatch::test_support::square;

TEST(PolygonZoneTest, ContainsInteriorPoint) {
    PolygonZone zone("door", square(0, 0, 10, 10));
    EXPECT_TRUE(zone.containsPoint(cv::Point2f(5, 5)));
    EXPECT_FALSE(zone.containsPoint(cv::Point2f(50, 50)));
    EXPECT_FALSE(zone.containsPoint(cv::Point2f(-0.5f, 5)));
}

TEST(PolygonZoneTest, BoundaryPointsAreInside) {
    PolygonZone zone("door", square(0, 0, 10, 10));
    EXPECT_TRUE(zone.containsPoint(cv::Point2f(0, 5)));
    EXPECT_TRUE(zone.containsPoint(cv::Point2f(10, 10)));
    EXPECT_TRUE(zone.containsPoint(cv::Point2f(5, 0)));
    EXPECT_TRUE(zone.containsPoint(cv::Point2f(10, 3)));
}

TEST(PolygonZoneTest, ContainmentIsDeterministic) {
    PolygonZone zone("door", square(0, 0, 10, 10));
    const cv::Point2f edge(10, 7.25f);
    const bool first = zone.containsPoint(edge);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(first, zone.containsPoint(edge));
    }
}

TEST(PolygonZoneTest, ConcavePolygon) {
    // U shape opening upwards
    PolygonZone zone("u", {
        cv::Point2f(0, 0), cv::Point2f(0, 10), cv::Point2f(10, 10), cv::Point2f(10, 0),
        cv::Point2f(7, 0), cv::Point2f(7, 7), cv::Point2f(3, 7), cv::Point2f(3, 0)
    });
    EXPECT_TRUE(zone.containsPoint(cv::Point2f(1, 2)));
    EXPECT_TRUE(zone.containsPoint(cv::Point2f(5, 9)));
    EXPECT_FALSE(zone.containsPoint(cv::Point2f(5, 3)));
}

TEST(PolygonZoneTest, NonFinitePointIsOutside) {
    PolygonZone zone("door", square(0, 0, 10, 10));
    EXPECT_FALSE(zone.containsPoint(cv::Point2f(std::nanf(""), 5)));
}

TEST(PolygonZoneTest, RejectsTooFewVertices) {
    EXPECT_THROW(PolygonZone("line", {cv::Point2f(0, 0), cv::Point2f(10, 10)}), ConfigError);
}

TEST(PolygonZoneTest, RejectsZeroArea) {
    EXPECT_THROW(PolygonZone("flat", {cv::Point2f(0, 0), cv::Point2f(5, 5), cv::Point2f(10, 10)}), ConfigError);
}

TEST(PolygonZoneTest, RejectsSelfIntersection) {
    // Bow tie
    EXPECT_THROW(PolygonZone("bowtie", {cv::Point2f(0, 0), cv::Point2f(10, 10),
                                        cv::Point2f(10, 0), cv::Point2f(0, 10)}), ConfigError);
}

TEST(PolygonZoneTest, RejectsEmptyId) {
    EXPECT_THROW(PolygonZone("", square(0, 0, 10, 10)), ConfigError);
}

TEST(PolygonZoneTest, AreaAndName) {
    PolygonZone zone("door", square(0, 0, 10, 4));
    EXPECT_DOUBLE_EQ(40.0, zone.area());
    EXPECT_EQ("door", zone.getName());

    PolygonZone named("z1", square(0, 0, 1, 1), "Front door");
    EXPECT_EQ("Front door", named.getName());
}

TEST(PolygonZoneTest, ScaledMovesVertices) {
    PolygonZone zone("door", square(0, 0, 10, 10));
    PolygonZone half = zone.scaled(0.5, 2.0);
    EXPECT_TRUE(half.containsPoint(cv::Point2f(4, 19)));
    EXPECT_FALSE(half.containsPoint(cv::Point2f(6, 5)));
    EXPECT_EQ(zone.getId(), half.getId());
}
