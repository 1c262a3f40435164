#pragma once

/**
 * @file locations.hpp
 * @brief Sources of the known sensor locations
 */

#include <istream>
#include <string>
#include <vector>

#include "sensorflow/core/event.hpp"

namespace sensorflow {

/**
 * @brief Supplies the list of valid locations once at startup
 */
class LocationProvider {
public:
    virtual ~LocationProvider() = default;

    /**
     * @throws SourceError if the locations cannot be retrieved
     */
    virtual std::vector<Location> locations() = 0;
};

/**
 * @brief Reads `[{"id": "...", "x": 1.0, "y": 2.0}, ...]` from a JSON file
 */
class JsonFileLocationProvider : public LocationProvider {
public:
    explicit JsonFileLocationProvider(std::string path)
        : path_(std::move(path)) {}

    std::vector<Location> locations() override;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Parse a JSON location list
 * @throws SourceError on malformed JSON or entries missing id/x/y
 */
std::vector<Location> parse_locations(std::istream& in);

} // namespace sensorflow
