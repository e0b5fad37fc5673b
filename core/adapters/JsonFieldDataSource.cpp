#include "JsonFieldDataSource.hpp"
#include "../JsonCodec.hpp"
#include "../ZoneResolver.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace farmfence::adapters {

std::vector<Zone> JsonFieldDataSource::zones() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return zones_;
}

std::vector<TreePoint> JsonFieldDataSource::trees() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trees_;
}

bool JsonFieldDataSource::loadZonesFile(const std::string& path) {
    std::string contents;
    if (!readFile(path, contents)) {
        std::cerr << "[DataSource] Could not open zones file: " << path << std::endl;
        return false;
    }
    return loadZones(contents);
}

bool JsonFieldDataSource::loadTreesFile(const std::string& path) {
    std::string contents;
    if (!readFile(path, contents)) {
        std::cerr << "[DataSource] Could not open trees file: " << path << std::endl;
        return false;
    }
    return loadTrees(contents);
}

bool JsonFieldDataSource::loadZones(const std::string& document) {
    try {
        auto zones = JsonCodec::jsonToZones(nlohmann::json::parse(document));

        size_t degenerate = 0;
        for (const auto& zone : zones) {
            if (!ZoneResolver::hasValidBoundary(zone)) {
                std::cerr << "[DataSource] Zone " << zone.id
                          << " has fewer than 3 distinct vertices and will be ignored" << std::endl;
                ++degenerate;
            }
        }

        std::clog << "[DataSource] Loaded " << zones.size() << " zones ("
                  << degenerate << " degenerate)" << std::endl;
        setZones(std::move(zones));
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[DataSource] Invalid zones JSON: " << e.what() << std::endl;
        return false;
    }
}

bool JsonFieldDataSource::loadTrees(const std::string& document) {
    try {
        auto trees = JsonCodec::jsonToTrees(nlohmann::json::parse(document));
        std::clog << "[DataSource] Loaded " << trees.size() << " trees" << std::endl;
        setTrees(std::move(trees));
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[DataSource] Invalid trees JSON: " << e.what() << std::endl;
        return false;
    }
}

void JsonFieldDataSource::setZones(std::vector<Zone> zones) {
    std::lock_guard<std::mutex> lock(mutex_);
    zones_ = std::move(zones);
}

void JsonFieldDataSource::setTrees(std::vector<TreePoint> trees) {
    std::lock_guard<std::mutex> lock(mutex_);
    trees_ = std::move(trees);
}

bool JsonFieldDataSource::readFile(const std::string& path, std::string& contents) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    contents = buffer.str();
    return true;
}

} // namespace farmfence::adapters
