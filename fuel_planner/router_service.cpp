#include "router_service.hpp"

#include "math_utilities.hpp"

#include <QDebug>
#include <QJsonArray>

#include <cmath>


RouterService::RouterService(
  Geocoder* geocoder,
  QObject* parent
) : QObject(parent)
  , geocoder_(geocoder)
{
  // Nothing to do here.
}


bool RouterService::geocode(
  const QString& address,
  QGeoCoordinate& coordinate,
  QString& why
)
{
  // Coordinates do not need any lookup.
  if(Geocoder::parseCoordinates(address, coordinate)) {
    return true;
  }

  if(geocoder_ == nullptr) {
    why = QString("Could not geocode '%1': no geocoder available").arg(address);
    return false;
  }

  // Add USA to help with geocoding.
  QString details;
  Geocoder::Status status = geocoder_->geocode(address + ", USA", coordinate, details);
  if(status != Geocoder::Status::Found) {
    qDebug() << "Geocoding of" << address << "failed:" << status << details;
    why = QString("Could not geocode '%1': %2").arg(address, details);
    return false;
  }
  return true;
}


bool RouterService::route(
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

  QList<double> latitudes, longitudes;
  if(!path({start.latitude(), end.latitude()}, {start.longitude(), end.longitude()}, latitudes, longitudes)) {
    why = "Failed to interpolate the path";
    return false;
  }

  // Length of the straight path.
  double distance = 0.0;
  for(unsigned int i=1; i<latitudes.size(); i++) {
    distance += math_utilities::haversineDistance(latitudes[i-1], longitudes[i-1], latitudes[i], longitudes[i]);
  }

  route.distance_miles = math_utilities::roundTo(distance, 2);
  route.duration_hours = math_utilities::roundTo(distance / DEMO_SPEED_MPH, 2);
  route.geometry = lineString(latitudes, longitudes);
  route.latitudes = latitudes;
  route.longitudes = longitudes;
  route.start = start;
  route.end = end;
  return true;
}


bool RouterService::path(
  const QList<double>& waypoints_latitudes,
  const QList<double>& waypoints_longitudes,
  QList<double>& path_latitudes,
  QList<double>& path_longitudes
)
{
  // The input coordinates must have the same length.
  if(waypoints_latitudes.size() != waypoints_longitudes.size()) {
    qDebug() << "Bad inputs passed to RouterService::path()";
    return false;
  }

  path_latitudes.clear();
  path_longitudes.clear();

  // If there are less than two points, there is no path to be added.
  if(waypoints_latitudes.size() < 2) {
    return true;
  }

  // Follow the great circle between consecutive waypoints.
  for(unsigned int i=0; i<waypoints_latitudes.size()-1; i++) {
    // Calculate the distance between a pair of consecutive waypoints.
    double distance = math_utilities::haversineDistance(
      waypoints_latitudes[i], waypoints_longitudes[i],
      waypoints_latitudes[i+1], waypoints_longitudes[i+1]
    );

    // Evaluate how many points need to be generated in between.
    unsigned int n_points = 1 + (unsigned int)(std::ceil(distance / DEMO_RESOLUTION_MILES));

    // Add the waypoint and the intermediate points. Skip the last one
    // (k=n_points), since it corresponds to point i+1, which will be added at
    // the next iteration.
    path_latitudes.append(waypoints_latitudes[i]);
    path_longitudes.append(waypoints_longitudes[i]);
    for(unsigned int k=1; k<n_points; k++) {
      double lat, lon;
      math_utilities::intermediatePoint(
        waypoints_latitudes[i], waypoints_longitudes[i],
        waypoints_latitudes[i+1], waypoints_longitudes[i+1],
        ((double)k) / n_points,
        lat, lon
      );
      path_latitudes.append(lat);
      path_longitudes.append(lon);
    }
  }

  // Add the very last waypoint, since the last point of each segment is
  // always skipped.
  path_latitudes.append(waypoints_latitudes.back());
  path_longitudes.append(waypoints_longitudes.back());
  return true;
}


QJsonObject RouterService::lineString(
  const QList<double>& latitudes,
  const QList<double>& longitudes
)
{
  // WARNING: GeoJSON expects coordinates as (LONG.,LAT.).
  QJsonArray coordinates;
  for(unsigned int i=0; i<latitudes.size() && i<longitudes.size(); i++) {
    coordinates.append(QJsonArray({longitudes[i], latitudes[i]}));
  }

  return QJsonObject{
    {"type", "LineString"},
    {"coordinates", coordinates}
  };
}
