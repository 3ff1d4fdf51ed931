#pragma once

#include <vector>

#include "geospread/city.hpp"

namespace geospread {

struct ClosestPair {
    int i = -1;  // slot in the selection
    int j = -1;  // slot in the selection, i < j
    double distance_km = 0.0;

    bool valid() const { return i >= 0 && j >= 0; }
};

struct SelectionStats {
    int count = 0;
    ClosestPair closest;
    double min_distance_km = 0.0;       // +inf for fewer than two cities
    double mean_nearest_km = 0.0;       // mean distance to the nearest other member; +inf for fewer than two
    int violating_pairs = 0;            // pairs closer than the floor
};

// Closest pair over all i<j, enumerated in selection order. Among equal
// distances the first pair enumerated wins. Invalid pair for size < 2.
ClosestPair find_closest_pair(const std::vector<CityRecord>& cities);

SelectionStats selection_stats(const std::vector<CityRecord>& cities, double min_distance_km);

}  // namespace geospread
