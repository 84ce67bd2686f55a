#include "math_utilities.hpp"

#include <algorithm>
#include <cmath>


namespace math_utilities {

double latitude_variation(
  double distance_miles
)
{
  return TO_DEG * (distance_miles / EARTH_RADIUS_MILES);
}


double longitude_variation(
  double distance_miles,
  double latitude
)
{
  // Near the poles any longitude is "close": return the whole range.
  double s = std::sin(distance_miles/(2*EARTH_RADIUS_MILES)) / std::cos(TO_RAD * latitude);
  if(s >= 1.0) {
    return 180.0;
  }
  return 2 * TO_DEG * std::asin(s);
}


double haversineDistance(
  double lat1,
  double lon1,
  double lat2,
  double lon2
)
{
  double dlat = TO_RAD * (lat2 - lat1);
  double dlon = TO_RAD * (lon2 - lon1);
  double a =
    std::sin(dlat/2) * std::sin(dlat/2) +
    std::cos(TO_RAD * lat1) * std::cos(TO_RAD * lat2) *
    std::sin(dlon/2) * std::sin(dlon/2);
  return 2.0 * EARTH_RADIUS_MILES * std::asin(std::min(1.0, std::sqrt(a)));
}


double initialBearing(
  double lat1,
  double lon1,
  double lat2,
  double lon2
)
{
  double phi1 = TO_RAD * lat1;
  double phi2 = TO_RAD * lat2;
  double dlon = TO_RAD * (lon2 - lon1);
  return std::atan2(
    std::sin(dlon) * std::cos(phi2),
    std::cos(phi1) * std::sin(phi2) - std::sin(phi1) * std::cos(phi2) * std::cos(dlon)
  );
}


void intermediatePoint(
  double lat1,
  double lon1,
  double lat2,
  double lon2,
  double fraction,
  double& lat,
  double& lon
)
{
  double delta = haversineDistance(lat1, lon1, lat2, lon2) / EARTH_RADIUS_MILES;
  if(delta <= 0.0) {
    lat = lat1;
    lon = lon1;
    return;
  }

  double phi1 = TO_RAD * lat1, lambda1 = TO_RAD * lon1;
  double phi2 = TO_RAD * lat2, lambda2 = TO_RAD * lon2;

  // Spherical linear interpolation of the unit vectors of the two points.
  double a = std::sin((1-fraction) * delta) / std::sin(delta);
  double b = std::sin(fraction * delta) / std::sin(delta);
  double x = a * std::cos(phi1) * std::cos(lambda1) + b * std::cos(phi2) * std::cos(lambda2);
  double y = a * std::cos(phi1) * std::sin(lambda1) + b * std::cos(phi2) * std::sin(lambda2);
  double z = a * std::sin(phi1) + b * std::sin(phi2);

  lat = TO_DEG * std::atan2(z, std::sqrt(x*x + y*y));
  lon = TO_DEG * std::atan2(y, x);
}


void projectOnSegment(
  double lat_a,
  double lon_a,
  double lat_b,
  double lon_b,
  double lat_p,
  double lon_p,
  double& along_miles,
  double& offset_miles
)
{
  // Work with angular distances, i.e., distances on the unit sphere.
  double d_ap = haversineDistance(lat_a, lon_a, lat_p, lon_p) / EARTH_RADIUS_MILES;
  double d_ab = haversineDistance(lat_a, lon_a, lat_b, lon_b) / EARTH_RADIUS_MILES;

  // A degenerate segment is just a point.
  if(d_ab <= 0.0) {
    along_miles = 0.0;
    offset_miles = d_ap * EARTH_RADIUS_MILES;
    return;
  }

  // Angle between the segment and the direction towards the point.
  double dtheta = initialBearing(lat_a, lon_a, lat_p, lon_p) - initialBearing(lat_a, lon_a, lat_b, lon_b);

  // Spherical right triangle: cross-track and along-track distances.
  double cross = std::asin(std::clamp(std::sin(d_ap) * std::sin(dtheta), -1.0, 1.0));
  double along = std::atan2(std::sin(d_ap) * std::cos(dtheta), std::cos(d_ap));

  if(along <= 0.0) {
    // The foot of the perpendicular is before A.
    along_miles = 0.0;
    offset_miles = d_ap * EARTH_RADIUS_MILES;
  }
  else if(along >= d_ab) {
    // The foot of the perpendicular is past B.
    along_miles = d_ab * EARTH_RADIUS_MILES;
    offset_miles = haversineDistance(lat_b, lon_b, lat_p, lon_p);
  }
  else {
    along_miles = along * EARTH_RADIUS_MILES;
    offset_miles = std::abs(cross) * EARTH_RADIUS_MILES;
  }
}


double roundTo(
  double value,
  int decimals
)
{
  double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

} // namespace math_utilities
