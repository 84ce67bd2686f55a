#include "router_osrm.hpp"

#include "math_utilities.hpp"
#include "network_utilities.hpp"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkRequest>
#include <QUrlQuery>


const QString RouterOsrm::DEFAULT_URL = "https://router.project-osrm.org";

// Conversion factors, to avoid magic numbers.
constexpr double METERS_PER_MILE = 1609.344;
constexpr double SECONDS_PER_HOUR = 3600.0;


RouterOsrm::RouterOsrm(
  Geocoder* geocoder,
  const QString& base_url,
  int timeout_ms,
  QObject *parent
) : RouterService(geocoder, parent)
  , base_url_(base_url)
  , timeout_ms_(timeout_ms)
{
  // Create a new Network Manager to send HTTPS requests.
  network_manager_ = new QNetworkAccessManager(this);
}


bool RouterOsrm::route(
  const QGeoCoordinate& start,
  const QGeoCoordinate& end,
  RouteResult& route,
  QString& why
)
{
  if(!start.isValid() || !end.isValid()) {
    why = "Cannot calculate a route between invalid coordinates";
    return false;
  }

  // Create the request. OSRM expects coordinates as "lon,lat;lon,lat".
  // See http://project-osrm.org/docs/v5.24.0/api/#route-service
  QUrl url(base_url_);
  url.setPath(url.path() + QString("/route/v1/driving/%1,%2;%3,%4").arg(
    QString::number(start.longitude(), 'f', 6),
    QString::number(start.latitude(), 'f', 6),
    QString::number(end.longitude(), 'f', 6),
    QString::number(end.latitude(), 'f', 6)
  ));
  QUrlQuery params;
  params.addQueryItem("overview", "full");
  params.addQueryItem("geometries", "geojson");
  params.addQueryItem("steps", "false");
  params.addQueryItem("annotations", "false");
  url.setQuery(params);

  QNetworkRequest request(url);
  request.setRawHeader("Accept", "application/json");
  request.setTransferTimeout(timeout_ms_);

  qDebug() << "Calling OSRM for route: (" << start.latitude() << "," << start.longitude() << ") -> (" << end.latitude() << "," << end.longitude() << ")";

  // Send the request and wait for the reply.
  QJsonDocument json_doc;
  if(!network_utilities::waitForJson(network_manager_->get(request), json_doc, why)) {
    return false;
  }

  if(!parseRoute(json_doc.object(), route, why)) {
    return false;
  }

  route.start = start;
  route.end = end;
  qDebug() << "Route calculated:" << route.distance_miles << "miles," << route.duration_hours << "hours";
  return true;
}


bool RouterOsrm::parseRoute(
  const QJsonObject& json,
  RouteResult& route,
  QString& why
)
{
  QString code = json.value("code").toString();
  if(code != "Ok") {
    why = QString("OSRM error: %1").arg(json.value("message").toString(code.isEmpty() ? "Unknown error" : code));
    return false;
  }

  QJsonArray routes = json.value("routes").toArray();
  if(routes.isEmpty()) {
    why = "OSRM returned no route";
    return false;
  }

  QJsonObject first = routes.at(0).toObject();
  QJsonObject geometry = first.value("geometry").toObject();
  QJsonValue coordinates_json_value = geometry.value("coordinates");

  if(!first.value("distance").isDouble() || !first.value("duration").isDouble()) {
    why = "Could not retrieve 'routes/0/distance' and 'routes/0/duration' from OSRM response";
    return false;
  }

  if(!coordinates_json_value.isArray()) {
    why = "Could not retrieve 'routes/0/geometry/coordinates' as an array from OSRM response";
    return false;
  }

  QJsonArray coordinates_array = coordinates_json_value.toArray();
  if(coordinates_array.size() < 2) {
    why = "Array 'routes/0/geometry/coordinates' from OSRM response has less than two points";
    return false;
  }

  route.latitudes.resize(coordinates_array.size());
  route.longitudes.resize(coordinates_array.size());
  for(unsigned int i=0; i<coordinates_array.size(); i++) {
    QJsonArray c = coordinates_array.at(i).toArray();
    if(c.size() < 2 || !c.at(0).isDouble() || !c.at(1).isDouble()) {
      why = QString("Point %1 of 'routes/0/geometry/coordinates' from OSRM response is not a [longitude, latitude] pair").arg(i);
      return false;
    }
    route.latitudes[i] = c.at(1).toDouble();
    route.longitudes[i] = c.at(0).toDouble();
  }

  route.distance_miles = math_utilities::roundTo(first.value("distance").toDouble() / METERS_PER_MILE, 2);
  route.duration_hours = math_utilities::roundTo(first.value("duration").toDouble() / SECONDS_PER_HOUR, 2);
  route.geometry = geometry;
  return true;
}
