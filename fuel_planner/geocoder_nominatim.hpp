#ifndef GEOCODER_NOMINATIM_HPP
#define GEOCODER_NOMINATIM_HPP

#include "geocoder.hpp"

#include <QElapsedTimer>
#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QUrl>


/// Geocoder that queries a Nominatim (OpenStreetMap) server.
/** Nominatim's usage policy allows at most one request per second and
  * requires an identifying User-Agent. Requests are therefore throttled: if
  * the previous one was sent less than min_interval_ms ago, the calling thread
  * sleeps for the remaining time.
  */
class GeocoderNominatim : public Geocoder {
public:
  static const QString DEFAULT_URL; ///< Public Nominatim instance.

  /// Create a new geocoder.
  /** @param base_url Root URL of the server, e.g., DEFAULT_URL.
    * @param user_agent Value of the User-Agent header.
    * @param timeout_ms Timeout of each request, in milliseconds.
    * @param min_interval_ms Minimum delay between two requests.
    * @param parent Parent object, needed for Qt's memory management.
    */
  GeocoderNominatim(
    const QString& base_url,
    const QString& user_agent,
    int timeout_ms,
    int min_interval_ms,
    QObject* parent = nullptr
  );

  /// Locate an address by sending a search request.
  /** Addresses that are already coordinates are parsed without any request.
    */
  virtual Status geocode(
    const QString& query,
    QGeoCoordinate& coordinate,
    QString& why
  ) override;

private:
  QUrl base_url_; ///< Root URL of the server.
  QString user_agent_; ///< Sent with every request.
  int timeout_ms_ = 10000; ///< Timeout of each request.
  int min_interval_ms_ = 1000; ///< Minimum delay between two requests.
  QElapsedTimer last_request_; ///< Started when the last request was sent.
  QNetworkAccessManager* network_manager_ = nullptr; ///< Used to send HTTPS requests.

  /// Sleep until the next request is allowed.
  void throttle();
};

#endif // GEOCODER_NOMINATIM_HPP
