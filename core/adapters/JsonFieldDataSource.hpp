#pragma once

#include "../ports/IFieldDataSource.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace farmfence::adapters {

/**
 * @brief Zone/tree snapshot loaded from JSON documents
 *
 * Replacing the snapshot is safe while the engine reads it from the sensor
 * callback; readers always get a complete copy.
 */
class JsonFieldDataSource : public ports::IFieldDataSource {
public:
    JsonFieldDataSource() = default;
    ~JsonFieldDataSource() override = default;

    std::vector<Zone> zones() const override;
    std::vector<TreePoint> trees() const override;

    /// @return false if the file cannot be read or is not valid JSON
    bool loadZonesFile(const std::string& path);
    bool loadTreesFile(const std::string& path);

    bool loadZones(const std::string& document);
    bool loadTrees(const std::string& document);

    void setZones(std::vector<Zone> zones);
    void setTrees(std::vector<TreePoint> trees);

private:
    static bool readFile(const std::string& path, std::string& contents);

    mutable std::mutex mutex_;
    std::vector<Zone> zones_;
    std::vector<TreePoint> trees_;
};

} // namespace farmfence::adapters
