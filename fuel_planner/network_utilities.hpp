#ifndef NETWORK_UTILITIES_HPP
#define NETWORK_UTILITIES_HPP

#include <QJsonDocument>
#include <QNetworkReply>
#include <QString>

namespace network_utilities {

/// Block until a reply is finished, then parse its body as JSON.
/** A local event loop is spun while waiting, so that this can be used from
  * synchronous code. The reply is scheduled for deletion.
  * @param reply The reply to wait for.
  * @param[out] json The parsed body, on success.
  * @param[out] why Explanation of the failure, if any.
  * @param[out] error If not nullptr, the network error of the reply.
  * @param[out] http_status If not nullptr, the HTTP status code of the reply
  *   (0 if no HTTP response was received).
  * @return true if the request succeeded and the body is valid JSON.
  */
bool waitForJson(
  QNetworkReply* reply,
  QJsonDocument& json,
  QString& why,
  QNetworkReply::NetworkError* error = nullptr,
  int* http_status = nullptr
);

/// Tell if a failed request is worth retrying later.
/** Timeouts, temporary network failures and the HTTP status codes 429, 502,
  * 503 and 504 are considered transient.
  */
bool isTransient(QNetworkReply::NetworkError error, int http_status);

} // namespace network_utilities

#endif // NETWORK_UTILITIES_HPP
