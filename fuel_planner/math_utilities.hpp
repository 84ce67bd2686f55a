#ifndef MATH_UTILITIES_H
#define MATH_UTILITIES_H


#include <Eigen/Dense>

namespace math_utilities {

// Constants, to avoid magic numbers.
constexpr double EARTH_RADIUS_MILES = 3959.0;
constexpr double TO_DEG = (180 / M_PI);
constexpr double TO_RAD = (M_PI / 180);

/// Transform a distance into a latitude difference.
/** Given a distance, return the change in latitude corresponding to it.
  * @param distance_miles A distance, in miles.
  * @return A latitude variation that corresponds to the given distance.
  */
double latitude_variation(double distance_miles);

/// Transform a distance into a longitude difference.
/** Given a distance and a latitude, return the change in longitude
  * corresponding to it.
  * @param distance_miles A distance, in miles.
  * @param latitude Latitude at which the longitude variation is to be
  *   calculated.
  * @return A longitude variation that corresponds to the given distance.
  */
double longitude_variation(double distance_miles, double latitude);

/// Great-circle distance between two GPS coordinates, in miles.
double haversineDistance(double lat1, double lon1, double lat2, double lon2);

/// Initial bearing of the great circle going from point 1 to point 2.
/** @return The bearing in radians, clockwise from north.
  */
double initialBearing(double lat1, double lon1, double lat2, double lon2);

/// Point at a given fraction of the great circle going from point 1 to point 2.
/** @param fraction 0 gives point 1, 1 gives point 2.
  * @param[out] lat Latitude of the intermediate point.
  * @param[out] lon Longitude of the intermediate point.
  */
void intermediatePoint(
  double lat1,
  double lon1,
  double lat2,
  double lon2,
  double fraction,
  double& lat,
  double& lon
);

/// Project a point onto the great-circle segment going from A to B.
/** The projection is clamped to the segment: if the perpendicular foot falls
  * before A (or past B), the closest point is A (or B) itself.
  * @param lat_a Latitude of the start of the segment.
  * @param lon_a Longitude of the start of the segment.
  * @param lat_b Latitude of the end of the segment.
  * @param lon_b Longitude of the end of the segment.
  * @param lat_p Latitude of the point to be projected.
  * @param lon_p Longitude of the point to be projected.
  * @param[out] along_miles Distance from A to the closest point, measured
  *   along the segment.
  * @param[out] offset_miles Distance from the point to the closest point of
  *   the segment (cross-track distance).
  */
void projectOnSegment(
  double lat_a,
  double lon_a,
  double lat_b,
  double lon_b,
  double lat_p,
  double lon_p,
  double& along_miles,
  double& offset_miles
);

/// Round a value to the given number of decimals.
double roundTo(double value, int decimals);


// Calculate the distance between GPS coordinates.
/** This function calculates the distance between the given GPS coordinates.
  * It leverages Eigen's parallelization to allow computing multiple distances
  * at once.
  * @param lat1 1D array of latitudes.
  * @param lon1 1D array of longitudes.
  * @param lat2 1D array of latitudes.
  * @param lon2 1D array of longitudes.
  * @return An array with the same shape as the inputs, such that the i-th
  *   entry is the distance in miles between the points defined by
  *   (lat1(i), lon1(i)) and (lat2(i), lon2(i)).
  */
template <class D1, class D2, class D3, class D4>
Eigen::ArrayXd haversineDistance(
  const Eigen::ArrayBase<D1>& lat1,
  const Eigen::ArrayBase<D2>& lon1,
  const Eigen::ArrayBase<D3>& lat2,
  const Eigen::ArrayBase<D4>& lon2
);


/// Calculate the distance between GPS coordinates.
/** This overloaded version allows to calculate the distance between a set of
  * points from a single point.
  * @see haversineDistance()
  * @param lat1 1D array of latitudes.
  * @param lon1 1D array of longitudes.
  * @param lat2 A latitude.
  * @param lon2 A longitude.
  * @return An array with the same shape as the first inputs, such that the
  *   i-th entry is the distance between the points defined by
  *   (lat1(i), lon1(i)) and (lat2, lon2).
  */
template <class D1, class D2>
Eigen::ArrayXd haversineDistance(
  const Eigen::ArrayBase<D1>& lat1,
  const Eigen::ArrayBase<D2>& lon1,
  double lat2,
  double lon2
);


} // namespace math_utilities

#endif // MATH_UTILITIES_H

#include "math_utilities.hxx"
