#include "route_geometry.hpp"

#include "math_utilities.hpp"

#include <QDebug>

#include <algorithm>
#include <limits>


// Offsets closer than this are considered equal.
constexpr double TIE_TOLERANCE_MILES = 1e-6;


RouteGeometry::RouteGeometry(
  const QList<double>& latitudes,
  const QList<double>& longitudes
)
{
  if(latitudes.size() != longitudes.size()) {
    qDebug() << "Bad inputs passed to RouteGeometry: latitudes and longitudes have different sizes";
    return;
  }

  latitudes_ = Eigen::Map<const Eigen::ArrayXd>(latitudes.data(), latitudes.size());
  longitudes_ = Eigen::Map<const Eigen::ArrayXd>(longitudes.data(), longitudes.size());

  if(!isValid()) {
    chainages_ = Eigen::ArrayXd::Zero(latitudes_.size());
    return;
  }

  // Length of each segment.
  const Eigen::Index n = latitudes_.size();
  segment_lengths_ = math_utilities::haversineDistance(
    latitudes_.head(n-1),
    longitudes_.head(n-1),
    latitudes_.tail(n-1),
    longitudes_.tail(n-1)
  );

  // Cumulative sum of the lengths.
  chainages_.resize(n);
  chainages_(0) = 0;
  for(Eigen::Index i=1; i<n; i++) {
    chainages_(i) = chainages_(i-1) + segment_lengths_(i-1);
  }
}


double RouteGeometry::length() const
{
  return chainages_.size() > 0 ? chainages_(chainages_.size()-1) : 0.0;
}


bool RouteGeometry::project(
  double latitude,
  double longitude,
  double& chainage,
  double& offset
) const
{
  if(!isValid()) {
    return false;
  }

  // Distance of the point from every vertex, all at once.
  Eigen::ArrayXd vertex_distances = math_utilities::haversineDistance(
    latitudes_,
    longitudes_,
    latitude,
    longitude
  );

  // The closest vertex is a valid (if not optimal) projection, so its
  // distance bounds the offset from above. Every point of a segment is at
  // most half its length away from one of the extremities, hence a segment
  // whose extremities are both farther than (bound + length/2) cannot
  // contain a closer point and does not need to be inspected.
  const double bound = vertex_distances.minCoeff();

  double best_offset = std::numeric_limits<double>::infinity();
  double best_chainage = 0.0;

  for(Eigen::Index s=0; s<segment_lengths_.size(); s++) {
    double nearest_extremity = std::min(vertex_distances(s), vertex_distances(s+1));
    if(nearest_extremity - 0.5 * segment_lengths_(s) > bound) {
      continue;
    }

    double along, cross;
    math_utilities::projectOnSegment(
      latitudes_(s), longitudes_(s),
      latitudes_(s+1), longitudes_(s+1),
      latitude, longitude,
      along, cross
    );

    // Offsets that differ by rounding errors only are considered equal, and
    // the smallest chainage wins.
    double c = chainages_(s) + along;
    if(cross < best_offset - TIE_TOLERANCE_MILES || (cross <= best_offset + TIE_TOLERANCE_MILES && c < best_chainage)) {
      best_offset = cross;
      best_chainage = c;
    }
  }

  chainage = best_chainage;
  offset = best_offset;
  return true;
}
