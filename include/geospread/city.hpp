#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace geospread {

struct CityRecord {
    std::int64_t id = 0;
    std::string name;
    double lat = 0.0;  // degrees, [-90, 90]; NaN when missing in the catalog
    double lng = 0.0;  // degrees, [-180, 180]; NaN when missing in the catalog
    double population = 0.0;
};

inline bool has_valid_coordinates(const CityRecord& c) {
    return std::isfinite(c.lat) && std::isfinite(c.lng) && c.lat >= -90.0 && c.lat <= 90.0 && c.lng >= -180.0 &&
           c.lng <= 180.0;
}

// Records with valid coordinates, in input order.
inline std::vector<CityRecord> valid_coordinate_cities(const std::vector<CityRecord>& cities) {
    std::vector<CityRecord> out;
    out.reserve(cities.size());
    for (const auto& c : cities) {
        if (has_valid_coordinates(c)) {
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace geospread
