#pragma once

#include "math_utilities.hpp"


namespace math_utilities {

template <class D1, class D2, class D3, class D4>
Eigen::ArrayXd haversineDistance(
  const Eigen::ArrayBase<D1>& lat1,
  const Eigen::ArrayBase<D2>& lon1,
  const Eigen::ArrayBase<D3>& lat2,
  const Eigen::ArrayBase<D4>& lon2
  )
{
  // Convert to radians.
  auto lat1r = TO_RAD * lat1.array();
  auto lat2r = TO_RAD * lat2.array();

  // Store differences.
  auto dlat = lat1r - lat2r;
  auto dlon = TO_RAD * (lon1.array() - lon2.array());

  // Calculate the haversine.
  auto a =
    ( (dlat / 2).sin().square() ) +
    ( lat1r.cos() * lat2r.cos() *
      ( (dlon / 2).sin().square() ) );

  // Return the distance from the haversine. Clamping protects asin() from
  // values slightly above one due to rounding.
  return 2.0 * EARTH_RADIUS_MILES * a.sqrt().min(1.0).asin();
}


// Scalar version of the above.
template <class D1, class D2>
Eigen::ArrayXd haversineDistance(
  const Eigen::ArrayBase<D1>& lat1,
  const Eigen::ArrayBase<D2>& lon1,
  double lat2,
  double lon2
  )
{
  // Use a little cheat: if X is an array, then (X*0.0 + d) is an expression that
  // has the same dimension as X and represents an array filled with the value
  // 'd'. However, thanks to lazy evaluation, it should not require any memory
  // allocation!
  return haversineDistance(
    lat1,
    lon1,
    (lat1*0.0 + lat2),
    (lon1*0.0 + lon2)
  );
}

} // namespace math_utilities
