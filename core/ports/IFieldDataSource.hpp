#pragma once

#include "../Types.hpp"
#include <vector>

namespace farmfence::ports {

/// Read-only snapshot of the farm's zones and trees, refreshed by the data layer.
class IFieldDataSource {
public:
    virtual ~IFieldDataSource() = default;

    virtual std::vector<Zone> zones() const = 0;
    virtual std::vector<TreePoint> trees() const = 0;
};

} // namespace farmfence::ports
