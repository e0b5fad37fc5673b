#include <gtest/gtest.h>
#include "../core/ZoneResolver.hpp"
#include "../core/GeoMath.hpp"

using namespace farmfence;

class ZoneResolverTest : public ::testing::Test {
protected:
    static Zone makeZone(const std::string& id, double south, double west, double north, double east) {
        Zone zone;
        zone.id = id;
        zone.name = "Block " + id;
        zone.boundary = {{south, west}, {north, west}, {north, east}, {south, east}};
        return zone;
    }

    const GeoPoint worker_{10.7620, 106.6600};
};

TEST_F(ZoneResolverTest, PositionInsideUnclosedZone) {
    Zone durian = makeZone("durian", 10.7615, 106.6595, 10.7625, 106.6605);
    ASSERT_EQ(durian.boundary.size(), 4u);

    auto resolution = ZoneResolver::resolve(worker_, {durian});

    ASSERT_TRUE(resolution.currentZone.has_value());
    EXPECT_EQ(resolution.currentZone->id, "durian");
    ASSERT_EQ(resolution.zones.size(), 1u);
    EXPECT_TRUE(resolution.zones[0].isInside);
    EXPECT_DOUBLE_EQ(resolution.zones[0].distanceMeters, 0.0);
    EXPECT_TRUE(resolution.rejectedZoneIds.empty());
}

TEST_F(ZoneResolverTest, OutsideZonesMeasuredToCentroid) {
    Zone north = makeZone("north", 10.7700, 106.6595, 10.7710, 106.6605);
    Zone near = makeZone("near", 10.7630, 106.6595, 10.7640, 106.6605);

    auto resolution = ZoneResolver::resolve(worker_, {north, near});

    EXPECT_FALSE(resolution.currentZone.has_value());
    ASSERT_EQ(resolution.zones.size(), 2u);
    EXPECT_EQ(resolution.zones[0].zone.id, "near");
    EXPECT_EQ(resolution.zones[1].zone.id, "north");

    double expected = GeoMath::distanceMeters(worker_, {10.7635, 106.6600});
    EXPECT_NEAR(resolution.zones[0].distanceMeters, expected, 1e-6);
    EXPECT_FALSE(resolution.zones[0].isInside);
}

TEST_F(ZoneResolverTest, ContainingZoneSortsFirst) {
    Zone near = makeZone("near", 10.7630, 106.6595, 10.7640, 106.6605);
    Zone home = makeZone("home", 10.7615, 106.6595, 10.7625, 106.6605);

    auto resolution = ZoneResolver::resolve(worker_, {near, home});

    ASSERT_EQ(resolution.zones.size(), 2u);
    EXPECT_EQ(resolution.zones[0].zone.id, "home");
    EXPECT_TRUE(resolution.zones[0].isInside);
    EXPECT_EQ(resolution.zones[1].zone.id, "near");
}

TEST_F(ZoneResolverTest, MalformedZonesAreRejected) {
    Zone line;
    line.id = "line";
    line.boundary = {{10.7615, 106.6595}, {10.7625, 106.6605}};

    Zone repeated;
    repeated.id = "repeated";
    repeated.boundary = {{10.7615, 106.6595}, {10.7615, 106.6595}, {10.7625, 106.6605}, {10.7615, 106.6595}};

    // Back and forth between two corners: no consecutive repeats, two distinct vertices
    Zone alternating;
    alternating.id = "alternating";
    alternating.boundary = {{10.7615, 106.6595}, {10.7625, 106.6605}, {10.7615, 106.6595}, {10.7625, 106.6605}};

    Zone valid = makeZone("valid", 10.7615, 106.6595, 10.7625, 106.6605);

    auto resolution = ZoneResolver::resolve(worker_, {line, valid, repeated, alternating});

    ASSERT_EQ(resolution.zones.size(), 1u);
    EXPECT_EQ(resolution.zones[0].zone.id, "valid");
    ASSERT_EQ(resolution.rejectedZoneIds.size(), 3u);
    EXPECT_EQ(resolution.rejectedZoneIds[0], "line");
    EXPECT_EQ(resolution.rejectedZoneIds[1], "repeated");
    EXPECT_EQ(resolution.rejectedZoneIds[2], "alternating");

    EXPECT_FALSE(ZoneResolver::hasValidBoundary(line));
    EXPECT_FALSE(ZoneResolver::hasValidBoundary(alternating));
    EXPECT_TRUE(ZoneResolver::hasValidBoundary(valid));
}

TEST_F(ZoneResolverTest, InactiveZonesAreSkipped) {
    Zone fallow = makeZone("fallow", 10.7615, 106.6595, 10.7625, 106.6605);
    fallow.isActive = false;

    auto resolution = ZoneResolver::resolve(worker_, {fallow});

    EXPECT_TRUE(resolution.zones.empty());
    EXPECT_TRUE(resolution.rejectedZoneIds.empty());
    EXPECT_FALSE(resolution.currentZone.has_value());
}

TEST_F(ZoneResolverTest, OverlappingZonesPickSmallest) {
    Zone farm = makeZone("farm", 10.7600, 106.6580, 10.7640, 106.6620);
    Zone block = makeZone("block", 10.7615, 106.6595, 10.7625, 106.6605);

    auto resolution = ZoneResolver::resolve(worker_, {farm, block});

    ASSERT_TRUE(resolution.currentZone.has_value());
    EXPECT_EQ(resolution.currentZone->id, "block");

    // Both contain the position; the list keeps input order among equals
    ASSERT_EQ(resolution.zones.size(), 2u);
    EXPECT_EQ(resolution.zones[0].zone.id, "farm");
    EXPECT_EQ(resolution.zones[1].zone.id, "block");
}

TEST_F(ZoneResolverTest, EqualAreaOverlapKeepsInputOrder) {
    Zone first = makeZone("first", 10.7615, 106.6595, 10.7625, 106.6605);
    Zone second = first;
    second.id = "second";

    auto resolution = ZoneResolver::resolve(worker_, {first, second});

    ASSERT_TRUE(resolution.currentZone.has_value());
    EXPECT_EQ(resolution.currentZone->id, "first");
}

TEST_F(ZoneResolverTest, NoZones) {
    auto resolution = ZoneResolver::resolve(worker_, {});
    EXPECT_TRUE(resolution.zones.empty());
    EXPECT_FALSE(resolution.currentZone.has_value());
}
