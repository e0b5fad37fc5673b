#include <gtest/gtest.h>
#include "../core/GeoMath.hpp"
#include <vector>

using namespace farmfence;

namespace {

// Meters per degree of latitude on the haversine sphere
const double METERS_PER_DEGREE = 111194.92664455873;

std::vector<GeoPoint> orchardBlock() {
    return {
        {10.7615, 106.6595},
        {10.7625, 106.6595},
        {10.7625, 106.6605},
        {10.7615, 106.6605}
    };
}

} // anonymous namespace

TEST(GeoMathTest, DistanceToSelfIsZero) {
    EXPECT_DOUBLE_EQ(GeoMath::distanceMeters(10.7620, 106.6600, 10.7620, 106.6600), 0.0);
}

TEST(GeoMathTest, DistanceIsSymmetric) {
    GeoPoint a{10.7620, 106.6600};
    GeoPoint b{10.7700, 106.6700};
    EXPECT_NEAR(GeoMath::distanceMeters(a, b), GeoMath::distanceMeters(b, a), 1e-9);
}

TEST(GeoMathTest, DistanceAlongMeridian) {
    double offset = 100.0 / METERS_PER_DEGREE;
    EXPECT_NEAR(GeoMath::distanceMeters(10.0, 106.0, 10.0 + offset, 106.0), 100.0, 0.001);
}

TEST(GeoMathTest, BearingCardinalDirections) {
    GeoPoint origin{10.0, 106.0};
    EXPECT_NEAR(GeoMath::bearingDegrees(origin, {10.001, 106.0}), 0.0, 0.01);
    EXPECT_NEAR(GeoMath::bearingDegrees(origin, {10.0, 106.001}), 90.0, 0.01);
    EXPECT_NEAR(GeoMath::bearingDegrees(origin, {9.999, 106.0}), 180.0, 0.01);
    EXPECT_NEAR(GeoMath::bearingDegrees(origin, {10.0, 105.999}), 270.0, 0.01);
}

TEST(GeoMathTest, ClosePolygonAppendsFirstVertex) {
    auto ring = GeoMath::closePolygon(orchardBlock());
    ASSERT_EQ(ring.size(), 5u);
    EXPECT_EQ(ring.front(), ring.back());
}

TEST(GeoMathTest, ClosePolygonIsIdempotent) {
    auto once = GeoMath::closePolygon(orchardBlock());
    auto twice = GeoMath::closePolygon(once);
    EXPECT_EQ(once, twice);
}

TEST(GeoMathTest, ClosePolygonRejectsDegenerateInput) {
    EXPECT_TRUE(GeoMath::closePolygon({}).empty());
    EXPECT_TRUE(GeoMath::closePolygon({{10.0, 106.0}, {10.001, 106.0}}).empty());
}

TEST(GeoMathTest, DedupeDropsRepeatsAndClosingVertex) {
    std::vector<GeoPoint> boundary = {
        {10.0, 106.0}, {10.0, 106.0}, {10.001, 106.0}, {10.001, 106.001}, {10.0, 106.0}
    };
    auto ring = GeoMath::dedupePolygon(boundary);
    ASSERT_EQ(ring.size(), 3u);
    EXPECT_EQ(ring[0], (GeoPoint{10.0, 106.0}));
    EXPECT_EQ(ring[2], (GeoPoint{10.001, 106.001}));
}

TEST(GeoMathTest, DistinctVertexCountIgnoresOrder) {
    GeoPoint a{10.0, 106.0};
    GeoPoint b{10.001, 106.001};
    EXPECT_EQ(GeoMath::distinctVertexCount({a, b, a, b}), 2u);
    EXPECT_EQ(GeoMath::distinctVertexCount(orchardBlock()), 4u);
    EXPECT_EQ(GeoMath::distinctVertexCount(GeoMath::closePolygon(orchardBlock())), 4u);
    EXPECT_EQ(GeoMath::distinctVertexCount({}), 0u);
}

TEST(GeoMathTest, PointInsideConvexZone) {
    EXPECT_TRUE(GeoMath::pointInPolygon({10.7620, 106.6600}, orchardBlock()));
}

TEST(GeoMathTest, PointFarOutsideZone) {
    EXPECT_FALSE(GeoMath::pointInPolygon({10.8000, 106.7000}, orchardBlock()));
    EXPECT_FALSE(GeoMath::pointInPolygon({10.7620, 106.6610}, orchardBlock()));
}

TEST(GeoMathTest, PointInConcaveZone) {
    // L-shaped block with the north-east quadrant missing
    std::vector<GeoPoint> lShape = {
        {10.0, 106.0}, {10.002, 106.0}, {10.002, 106.001},
        {10.001, 106.001}, {10.001, 106.002}, {10.0, 106.002}
    };
    EXPECT_TRUE(GeoMath::pointInPolygon({10.0015, 106.0005}, lShape));
    EXPECT_TRUE(GeoMath::pointInPolygon({10.0005, 106.0015}, lShape));
    EXPECT_FALSE(GeoMath::pointInPolygon({10.0015, 106.0015}, lShape));
}

TEST(GeoMathTest, PointInPolygonNeedsThreeVertices) {
    EXPECT_FALSE(GeoMath::pointInPolygon({10.0, 106.0}, {{10.0, 106.0}, {10.001, 106.001}}));
}

TEST(GeoMathTest, HundredMeterSquareIsOneHectare) {
    double side = 100.0 / METERS_PER_DEGREE;
    std::vector<GeoPoint> square = {
        {0.0, 100.0}, {side, 100.0}, {side, 100.0 + side}, {0.0, 100.0 + side}
    };
    EXPECT_NEAR(GeoMath::polygonAreaSquareMeters(square), 10000.0, 1.0);
    EXPECT_DOUBLE_EQ(GeoMath::polygonAreaHectares(square), 1.0);
}

TEST(GeoMathTest, AreaIgnoresWindingAndClosingVertex) {
    auto open = orchardBlock();
    auto closed = GeoMath::closePolygon(open);
    std::vector<GeoPoint> reversed(open.rbegin(), open.rend());

    double area = GeoMath::polygonAreaSquareMeters(open);
    EXPECT_GT(area, 0.0);
    EXPECT_DOUBLE_EQ(GeoMath::polygonAreaSquareMeters(closed), area);
    EXPECT_NEAR(GeoMath::polygonAreaSquareMeters(reversed), area, 1.0);
}

TEST(GeoMathTest, DegenerateAreaIsZero) {
    EXPECT_DOUBLE_EQ(GeoMath::polygonAreaHectares({}), 0.0);
    EXPECT_DOUBLE_EQ(GeoMath::polygonAreaHectares({{10.0, 106.0}, {10.001, 106.0}}), 0.0);
    EXPECT_DOUBLE_EQ(GeoMath::polygonAreaHectares({{10.0, 106.0}, {10.0, 106.0}, {10.0, 106.0}}), 0.0);
}

TEST(GeoMathTest, CentroidIsVertexMean) {
    GeoPoint center = GeoMath::centroid(GeoMath::closePolygon(orchardBlock()));
    EXPECT_NEAR(center.lat, 10.7620, 1e-9);
    EXPECT_NEAR(center.lon, 106.6600, 1e-9);
}

TEST(GeoMathTest, CoordinateValidation) {
    EXPECT_TRUE(GeoMath::isValidCoordinate(10.7620, 106.6600));
    EXPECT_FALSE(GeoMath::isValidCoordinate(0.0, 0.0));
    EXPECT_FALSE(GeoMath::isValidCoordinate(0.0, 106.6600));
    EXPECT_FALSE(GeoMath::isValidCoordinate(91.0, 106.6600));
    EXPECT_FALSE(GeoMath::isValidCoordinate(10.7620, -181.0));
}
