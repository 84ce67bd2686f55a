#ifndef ROUTE_GEOMETRY_HPP
#define ROUTE_GEOMETRY_HPP

#include <Eigen/Dense>

#include <QList>


/// A route, seen as a polyline of GPS coordinates.
/** The class precomputes the chainage of each vertex, i.e., its distance from
  * the first vertex measured along the polyline, so that the position of any
  * point relative to the route can be answered quickly.
  *
  * All distances are great-circle distances, in miles.
  */
class RouteGeometry {
public:
  /// Create the geometry from a list of vertices.
  /** @param latitudes Latitudes of the vertices, in travel order.
    * @param longitudes Longitudes of the vertices. It must have the same size
    *   as latitudes, otherwise the geometry is empty (and invalid).
    */
  RouteGeometry(const QList<double>& latitudes, const QList<double>& longitudes);

  /// A route needs at least two vertices.
  inline bool isValid() const { return latitudes_.size() >= 2; }

  /// Number of vertices in the polyline.
  inline Eigen::Index size() const { return latitudes_.size(); }

  /// Total length of the polyline.
  double length() const;

  /// Distance from the first vertex to the i-th one, along the polyline.
  inline double vertexChainage(Eigen::Index i) const { return chainages_(i); }

  /// Locate a point relative to the route.
  /** The point is projected on every segment of the polyline, and the
    * closest projection is kept. If two segments are equally close, the one
    * with the smaller chainage wins.
    * @param latitude Latitude of the point.
    * @param longitude Longitude of the point.
    * @param[out] chainage Distance from the start of the route to the
    *   projection of the point.
    * @param[out] offset Distance from the point to its projection.
    * @return false if the geometry is invalid (the outputs are left
    *   untouched), true otherwise.
    */
  bool project(
    double latitude,
    double longitude,
    double& chainage,
    double& offset
  ) const;

private:
  Eigen::ArrayXd latitudes_; ///< Latitudes of the vertices.
  Eigen::ArrayXd longitudes_; ///< Longitudes of the vertices.
  Eigen::ArrayXd chainages_; ///< Cumulative distance of each vertex.
  Eigen::ArrayXd segment_lengths_; ///< Length of each segment; one less than the vertices.
};

#endif // ROUTE_GEOMETRY_HPP
