#include "geocoder.hpp"

#include <QStringList>


Geocoder::Geocoder(
  QObject* parent
) : QObject(parent)
{
  // Nothing to do here.
}


Geocoder::Status Geocoder::geocode(
  const QString& query,
  QGeoCoordinate& coordinate,
  QString& why
)
{
  if(parseCoordinates(query, coordinate)) {
    return Status::Found;
  }
  why = QString("'%1' is not in the form 'latitude, longitude'").arg(query);
  return Status::NotFound;
}


bool Geocoder::parseCoordinates(
  const QString& text,
  QGeoCoordinate& coordinate
)
{
  QStringList parts = text.split(',');
  if(parts.size() != 2) {
    return false;
  }

  bool ok_lat, ok_lon;
  double latitude = parts[0].trimmed().toDouble(&ok_lat);
  double longitude = parts[1].trimmed().toDouble(&ok_lon);
  if(!ok_lat || !ok_lon) {
    return false;
  }

  QGeoCoordinate c(latitude, longitude);
  if(!c.isValid()) {
    return false;
  }

  coordinate = c;
  return true;
}
