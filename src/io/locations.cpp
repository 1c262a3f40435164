/**
 * @file locations.cpp
 * @brief JSON location list
 */

#include "sensorflow/io/locations.hpp"

#include <fstream>

#include <json/json.h>

#include "sensorflow/core/errors.hpp"
#include "sensorflow/core/logging.hpp"

namespace sensorflow {

std::vector<Location> parse_locations(std::istream& in) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;

    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw SourceError("Malformed location list: " + errors);
    }
    if (!root.isArray()) {
        throw SourceError("Location list must be a JSON array");
    }

    std::vector<Location> locations;
    locations.reserve(root.size());

    for (Json::ArrayIndex i = 0; i < root.size(); i++) {
        const Json::Value& entry = root[i];
        if (!entry.isObject() || !entry["id"].isString()
            || !entry["x"].isNumeric() || !entry["y"].isNumeric()) {
            throw SourceError("Location entry " + std::to_string(i) + " needs a string id and numeric x and y");
        }
        locations.push_back(Location{entry["id"].asString(), entry["x"].asDouble(), entry["y"].asDouble()});
    }

    return locations;
}

std::vector<Location> JsonFileLocationProvider::locations() {
    std::ifstream in(path_);
    if (!in) {
        throw SourceError("Cannot open location file: " + path_);
    }

    auto result = parse_locations(in);
    log::logger()->info("Loaded {} locations from {}", result.size(), path_);
    return result;
}

} // namespace sensorflow
