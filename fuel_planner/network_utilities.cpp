#include "network_utilities.hpp"

#include <QEventLoop>
#include <QJsonParseError>


namespace network_utilities {

bool waitForJson(
  QNetworkReply* reply,
  QJsonDocument& json,
  QString& why,
  QNetworkReply::NetworkError* error,
  int* http_status
)
{
  // Spawn an event loop and connect its QEventLoop::quit slot to
  // QNetworkReply::finished. The request itself is bounded by the transfer
  // timeout set by the caller, so the loop cannot block forever.
  if(!reply->isFinished()) {
    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    loop.exec();
  }

  // Allow Qt to do its magic in terms of memory management!
  reply->deleteLater();

  int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
  if(error != nullptr) {
    *error = reply->error();
  }
  if(http_status != nullptr) {
    *http_status = status;
  }

  if(reply->error() != QNetworkReply::NoError) {
    why = QString("Request to %1 failed: %2").arg(reply->url().host(), reply->errorString());
    return false;
  }

  // Try to parse the JSON, and exit on failure.
  QJsonParseError parse_error;
  json = QJsonDocument::fromJson(reply->readAll(), &parse_error);

  if(parse_error.error != QJsonParseError::NoError) {
    why = QString("Failed to parse response: %1").arg(parse_error.errorString());
    return false;
  }
  return true;
}


bool isTransient(
  QNetworkReply::NetworkError error,
  int http_status
)
{
  switch(error) {
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::ProxyTimeoutError:
    case QNetworkReply::ServiceUnavailableError:
      return true;
    default:
      break;
  }

  return http_status == 429 || http_status == 502 || http_status == 503 || http_status == 504;
}

} // namespace network_utilities
