#include <gtest/gtest.h>
#include "TomlConfig.hpp"
#include <sstream>

using namespace farmfence;

TEST(TomlConfigTest, ParsesAllSections) {
    std::istringstream input(R"(
# farmfence field configuration
[tracking]
enable_high_accuracy = false
timeout_ms = 15000
max_age_ms = 2000
distance_filter_meters = 5.5   # meters
max_accuracy_meters = 25
history_capacity = 100

[proximity]
radius_meters = 40

[data]
zones_file = "zones.json"
trees_file = "trees.json"
track_file = "walk.json"
)");

    auto config = TomlConfig::parse(input);

    EXPECT_FALSE(config.stream.enableHighAccuracy);
    EXPECT_EQ(config.stream.timeoutMs, 15000u);
    EXPECT_EQ(config.stream.maxAgeMs, 2000u);
    ASSERT_TRUE(config.stream.distanceFilterMeters.has_value());
    EXPECT_DOUBLE_EQ(*config.stream.distanceFilterMeters, 5.5);
    ASSERT_TRUE(config.stream.maxAccuracyMeters.has_value());
    EXPECT_DOUBLE_EQ(*config.stream.maxAccuracyMeters, 25.0);
    EXPECT_EQ(config.stream.historyCapacity, 100u);
    EXPECT_DOUBLE_EQ(config.proximityRadiusMeters, 40.0);
    EXPECT_EQ(config.zonesFile, "zones.json");
    EXPECT_EQ(config.treesFile, "trees.json");
    EXPECT_EQ(config.trackFile, "walk.json");
}

TEST(TomlConfigTest, DefaultsWhenEmpty) {
    std::istringstream input("");
    auto config = TomlConfig::parse(input);

    EXPECT_TRUE(config.stream.enableHighAccuracy);
    EXPECT_FALSE(config.stream.distanceFilterMeters.has_value());
    EXPECT_EQ(config.stream.historyCapacity, 50u);
    EXPECT_DOUBLE_EQ(config.proximityRadiusMeters, 30.0);
}

TEST(TomlConfigTest, MissingFileUsesDefaults) {
    auto config = TomlConfig::loadFromFile("/nonexistent/farmfence.toml");
    EXPECT_DOUBLE_EQ(config.proximityRadiusMeters, 30.0);
}

TEST(TomlConfigTest, RejectsBadValues) {
    std::istringstream notNumber("[proximity]\nradius_meters = wide\n");
    EXPECT_THROW(TomlConfig::parse(notNumber), std::runtime_error);

    std::istringstream negative("[tracking]\ndistance_filter_meters = -1\n");
    EXPECT_THROW(TomlConfig::parse(negative), std::runtime_error);

    std::istringstream zeroCapacity("[tracking]\nhistory_capacity = 0\n");
    EXPECT_THROW(TomlConfig::parse(zeroCapacity), std::runtime_error);

    std::istringstream notBool("[tracking]\nenable_high_accuracy = yes\n");
    EXPECT_THROW(TomlConfig::parse(notBool), std::runtime_error);
}

TEST(TomlConfigTest, IgnoresUnknownKeys) {
    std::istringstream input("[mqtt]\nbroker = \"x\"\n[proximity]\nunknown = 1\nradius_meters = 12\n");
    auto config = TomlConfig::parse(input);
    EXPECT_DOUBLE_EQ(config.proximityRadiusMeters, 12.0);
}

TEST(TomlConfigTest, ParseNonNegativeRejectsTrailingText) {
    EXPECT_DOUBLE_EQ(TomlConfig::parseNonNegative("--radius", "12.5"), 12.5);
    EXPECT_THROW(TomlConfig::parseNonNegative("--radius", "30abc"), std::runtime_error);
    EXPECT_THROW(TomlConfig::parseNonNegative("FARMFENCE_RADIUS_M", "-3"), std::runtime_error);
    EXPECT_THROW(TomlConfig::parseNonNegative("FARMFENCE_RADIUS_M", "nan"), std::runtime_error);
    EXPECT_THROW(TomlConfig::parseNonNegative("FARMFENCE_DISTANCE_FILTER_M", ""), std::runtime_error);
}
