#ifndef ROUTER_OSRM_HPP
#define ROUTER_OSRM_HPP

#include "router_service.hpp"

#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QUrl>


/// Router that queries an OSRM (Open Source Routing Machine) server.
class RouterOsrm : public RouterService {
public:
  static const QString DEFAULT_URL; ///< Public OSRM demo server.

  /// Create a new router.
  /** @param geocoder Used to convert addresses into coordinates.
    * @param base_url Root URL of the server, e.g., DEFAULT_URL.
    * @param timeout_ms Timeout of each request, in milliseconds.
    * @param parent Parent object, needed for Qt's memory management.
    */
  RouterOsrm(
    Geocoder* geocoder,
    const QString& base_url,
    int timeout_ms,
    QObject *parent = nullptr
  );

  /// Calculate the driving route between two locations.
  /** A single request is sent, asking for the full geometry of the route in
    * GeoJSON format. Distances are converted from meters to miles and
    * durations from seconds to hours, both rounded to two decimals.
    */
  virtual bool route(
    const QGeoCoordinate& start,
    const QGeoCoordinate& end,
    RouteResult& route,
    QString& why
  ) override;

  /// Extract a route from the body of an OSRM reply.
  /** @param json Parsed reply of the route service.
    * @param[out] route The route, on success. Start and end are not set.
    * @param[out] why Explanation of the failure, if any.
    * @return false if OSRM reported an error or if the reply is malformed.
    */
  static bool parseRoute(const QJsonObject& json, RouteResult& route, QString& why);

private:
  QUrl base_url_; ///< Root URL of the server.
  int timeout_ms_ = 30000; ///< Timeout of each request.
  QNetworkAccessManager* network_manager_ = nullptr; ///< Used to send HTTPS requests.
};

#endif // ROUTER_OSRM_HPP
