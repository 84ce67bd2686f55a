#ifndef FUEL_STATION_HPP
#define FUEL_STATION_HPP

#include <QGeoCoordinate>
#include <QMetaType>
#include <QString>


/// A fuel station from the catalog.
struct FuelStation {
  int id = 0; ///< Primary key of the station in the catalog.
  int opis_id = 0; ///< OPIS truckstop identifier from the price feed.
  QString name; ///< Name of the truckstop.
  QString address; ///< Street address.
  QString city; ///< City the station is located in.
  QString state; ///< Two-letter state (or province) code.
  int rack_id = 0; ///< Rack identifier from the price feed.
  double price = 0.0; ///< Retail price, per gallon.
  QGeoCoordinate location; ///< Position of the station, valid only if geocoded.
  bool geocoded = false; ///< Whether the location has been resolved.

  /// Default constructor, needed by Qt's metatype system.
  FuelStation() = default;

  /// Create a geocoded station.
  FuelStation(int id, const QString& name, double price, double latitude, double longitude)
    : id(id), name(name), price(price), location(latitude, longitude), geocoded(true) {}
};

Q_DECLARE_METATYPE(FuelStation);

#endif // FUEL_STATION_HPP
