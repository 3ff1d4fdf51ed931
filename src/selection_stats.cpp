#include "geospread/selection_stats.hpp"

#include <algorithm>
#include <limits>

#include "geospread/geodesic.hpp"

namespace geospread {

ClosestPair find_closest_pair(const std::vector<CityRecord>& cities) {
    ClosestPair best;
    best.distance_km = std::numeric_limits<double>::infinity();
    const int k = static_cast<int>(cities.size());
    for (int i = 0; i < k; ++i) {
        for (int j = i + 1; j < k; ++j) {
            const double d = distance_km(cities[static_cast<size_t>(i)], cities[static_cast<size_t>(j)]);
            if (d < best.distance_km) {
                best.i = i;
                best.j = j;
                best.distance_km = d;
            }
        }
    }
    return best;
}

SelectionStats selection_stats(const std::vector<CityRecord>& cities, double min_distance_km) {
    SelectionStats st;
    st.count = static_cast<int>(cities.size());
    st.min_distance_km = std::numeric_limits<double>::infinity();
    st.closest.distance_km = std::numeric_limits<double>::infinity();
    if (st.count < 2) {
        st.mean_nearest_km = std::numeric_limits<double>::infinity();
        return st;
    }

    std::vector<double> nearest(cities.size(), std::numeric_limits<double>::infinity());
    for (int i = 0; i < st.count; ++i) {
        for (int j = i + 1; j < st.count; ++j) {
            const double d = distance_km(cities[static_cast<size_t>(i)], cities[static_cast<size_t>(j)]);
            nearest[static_cast<size_t>(i)] = std::min(nearest[static_cast<size_t>(i)], d);
            nearest[static_cast<size_t>(j)] = std::min(nearest[static_cast<size_t>(j)], d);
            if (d < st.closest.distance_km) {
                st.closest.i = i;
                st.closest.j = j;
                st.closest.distance_km = d;
            }
            if (d < min_distance_km) {
                st.violating_pairs++;
            }
        }
    }
    st.min_distance_km = st.closest.distance_km;

    double sum = 0.0;
    for (const double d : nearest) {
        sum += d;
    }
    st.mean_nearest_km = sum / static_cast<double>(st.count);
    return st;
}

}  // namespace geospread
