#pragma once

#include "geospread/city.hpp"

namespace geospread {

constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance (haversine) between two lat/lng points in degrees, in km.
double haversine_km(double lat1, double lng1, double lat2, double lng2);

inline double distance_km(const CityRecord& a, const CityRecord& b) {
    return haversine_km(a.lat, a.lng, b.lat, b.lng);
}

}  // namespace geospread
