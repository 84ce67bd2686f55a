#include "geocoder_nominatim.hpp"

#include "network_utilities.hpp"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QThread>
#include <QUrlQuery>


const QString GeocoderNominatim::DEFAULT_URL = "https://nominatim.openstreetmap.org";


GeocoderNominatim::GeocoderNominatim(
  const QString& base_url,
  const QString& user_agent,
  int timeout_ms,
  int min_interval_ms,
  QObject* parent
) : Geocoder(parent)
  , base_url_(base_url)
  , user_agent_(user_agent)
  , timeout_ms_(timeout_ms)
  , min_interval_ms_(min_interval_ms)
{
  // Create a new Network Manager to send HTTPS requests.
  network_manager_ = new QNetworkAccessManager(this);
}


void GeocoderNominatim::throttle()
{
  if(last_request_.isValid()) {
    qint64 remaining = min_interval_ms_ - last_request_.elapsed();
    if(remaining > 0) {
      QThread::msleep(static_cast<unsigned long>(remaining));
    }
  }
  last_request_.start();
}


Geocoder::Status GeocoderNominatim::geocode(
  const QString& query,
  QGeoCoordinate& coordinate,
  QString& why
)
{
  if(parseCoordinates(query, coordinate)) {
    return Status::Found;
  }

  // Create the request.
  // See https://nominatim.org/release-docs/develop/api/Search/
  QUrl url(base_url_);
  url.setPath(url.path() + "/search");
  QUrlQuery params;
  params.addQueryItem("q", query);
  params.addQueryItem("format", "json");
  params.addQueryItem("limit", "1");
  url.setQuery(params);

  QNetworkRequest request(url);
  request.setHeader(QNetworkRequest::UserAgentHeader, user_agent_);
  request.setRawHeader("Accept", "application/json");
  request.setTransferTimeout(timeout_ms_);

  throttle();

  // Send the request and wait for the reply.
  QJsonDocument json_doc;
  QNetworkReply::NetworkError error = QNetworkReply::NoError;
  int http_status = 0;
  if(!network_utilities::waitForJson(network_manager_->get(request), json_doc, why, &error, &http_status)) {
    return network_utilities::isTransient(error, http_status) ? Status::Transient : Status::Failed;
  }

  if(!json_doc.isArray()) {
    why = "Unexpected response from Nominatim: expected a JSON array";
    return Status::Failed;
  }

  QJsonArray results = json_doc.array();
  if(results.isEmpty()) {
    why = QString("No result for '%1'").arg(query);
    return Status::NotFound;
  }

  // Nominatim returns coordinates as strings.
  QJsonObject first = results.at(0).toObject();
  bool ok_lat, ok_lon;
  double latitude = first.value("lat").toString().toDouble(&ok_lat);
  double longitude = first.value("lon").toString().toDouble(&ok_lon);
  if(!ok_lat || !ok_lon) {
    why = QString("Could not read coordinates for '%1'").arg(query);
    return Status::Failed;
  }

  coordinate = QGeoCoordinate(latitude, longitude);
  qDebug() << "Geocoded" << query << "to (" << latitude << "," << longitude << ")";
  return Status::Found;
}
