#ifndef ROUTER_SERVICE_HPP
#define ROUTER_SERVICE_HPP

#include "geocoder.hpp"
#include "route_result.hpp"

#include <QGeoCoordinate>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>


/// Base class for locating addresses and calculating driving routes.
/** The base class works offline ("demo mode"): routes follow the great circle
  * between the departure and the arrival, and durations assume a constant
  * cruise speed. It should be overridden in sub-classes to use an actual
  * routing engine.
  */
class RouterService : public QObject {
  Q_OBJECT
public:
  /// Average speed used to estimate durations in demo mode, in mph.
  static constexpr double DEMO_SPEED_MPH = 55.0;

  /// Maximum length of the segments of demo routes, in miles.
  static constexpr double DEMO_RESOLUTION_MILES = 5.0;

  /// Create a new object with a given parent.
  /** @param geocoder Used to convert addresses into coordinates. The router
    *   does not take ownership of it.
    * @param parent Parent object, needed for Qt's memory management.
    */
  explicit RouterService(
    Geocoder* geocoder,
    QObject* parent=nullptr
  );

  /// Convert an address into GPS coordinates.
  /** Addresses in the form "latitude, longitude" are parsed directly. All
    * others are forwarded to the geocoder, restricted to the USA.
    * @param address The address to locate.
    * @param[out] coordinate The location, on success.
    * @param[out] why Explanation of the failure, if any.
    * @return true if the address could be located.
    */
  virtual bool geocode(
    const QString& address,
    QGeoCoordinate& coordinate,
    QString& why
  );

  /// Calculate the driving route between two locations.
  /** This implementation follows the great circle between the two points, and should be overridden
    * in sub-classes.
    * @param start Departure.
    * @param end Arrival.
    * @param[out] route The route, on success.
    * @param[out] why Explanation of the failure, if any.
    * @return true if a route was found.
    */
  virtual bool route(
    const QGeoCoordinate& start,
    const QGeoCoordinate& end,
    RouteResult& route,
    QString& why
  );

  /// Calculate a path passing through some waypoints.
  /** Consecutive waypoints are joined by great-circle arcs, sampled so
    * that vertices are at most DEMO_RESOLUTION_MILES apart.
    */
  static bool path(
    const QList<double>& waypoints_latitudes,
    const QList<double>& waypoints_longitudes,
    QList<double>& path_latitudes,
    QList<double>& path_longitudes
  );

  /// Build a GeoJSON LineString from a list of vertices.
  static QJsonObject lineString(
    const QList<double>& latitudes,
    const QList<double>& longitudes
  );

protected:
  Geocoder* geocoder_ = nullptr; ///< Used to convert addresses into coordinates.
};

#endif // ROUTER_SERVICE_HPP
