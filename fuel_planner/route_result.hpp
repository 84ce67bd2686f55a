#ifndef ROUTE_RESULT_HPP
#define ROUTE_RESULT_HPP

#include <QGeoCoordinate>
#include <QJsonObject>
#include <QList>


/// A driving route, as returned by a RouterService.
struct RouteResult {
  double distance_miles = 0.0; ///< Road distance, in miles.
  double duration_hours = 0.0; ///< Estimated driving time, in hours.
  QJsonObject geometry; ///< The path as a GeoJSON LineString.
  QList<double> latitudes; ///< Latitudes of the path vertices, in travel order.
  QList<double> longitudes; ///< Longitudes of the path vertices, same size as latitudes.
  QGeoCoordinate start; ///< Departure coordinates.
  QGeoCoordinate end; ///< Arrival coordinates.
};

#endif // ROUTE_RESULT_HPP
