#ifndef GEOCODER_HPP
#define GEOCODER_HPP

#include <QGeoCoordinate>
#include <QObject>
#include <QString>


/// Base class for converting addresses into GPS coordinates.
/** This class only understands addresses that are already coordinates, in the
  * form "latitude, longitude". It should be overridden in sub-classes to
  * query an actual geocoding service.
  */
class Geocoder : public QObject {
  Q_OBJECT
public:
  /// Outcome of a geocoding request.
  enum class Status {
    Found, ///< The address was located.
    NotFound, ///< The service answered, but does not know the address.
    Transient, ///< The service timed out or is temporarily unavailable.
    Failed ///< Any other error; retrying is pointless.
  };
  Q_ENUM(Status)

  /// Create a new object with a given parent.
  explicit Geocoder(QObject* parent = nullptr);

  /// Locate an address.
  /** @param query The address to locate.
    * @param[out] coordinate The location, if Status::Found is returned.
    * @param[out] why Explanation of the failure, if any.
    */
  virtual Status geocode(
    const QString& query,
    QGeoCoordinate& coordinate,
    QString& why
  );

  /// Parse strings such as "40.7128, -74.0060".
  /** @return true if the text contains exactly two numbers separated by a
    *   comma, and they are a valid latitude and longitude.
    */
  static bool parseCoordinates(const QString& text, QGeoCoordinate& coordinate);
};

#endif // GEOCODER_HPP
