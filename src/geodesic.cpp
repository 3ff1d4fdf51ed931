#include "geospread/geodesic.hpp"

#include <algorithm>
#include <cmath>

namespace geospread {
namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kDegToRad = kPi / 180.0;

}  // namespace

double haversine_km(double lat1, double lng1, double lat2, double lng2) {
    const double phi1 = lat1 * kDegToRad;
    const double phi2 = lat2 * kDegToRad;
    const double dphi = (lat2 - lat1) * kDegToRad;
    const double dlambda = (lng2 - lng1) * kDegToRad;

    const double s_phi = std::sin(0.5 * dphi);
    const double s_lambda = std::sin(0.5 * dlambda);
    double h = s_phi * s_phi + std::cos(phi1) * std::cos(phi2) * s_lambda * s_lambda;
    // Rounding can push h slightly outside [0,1] for near-antipodal points.
    h = std::clamp(h, 0.0, 1.0);

    return 2.0 * kEarthRadiusKm * std::asin(std::sqrt(h));
}

}  // namespace geospread
