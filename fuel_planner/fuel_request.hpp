#ifndef FUEL_REQUEST_HPP
#define FUEL_REQUEST_HPP

#include <QMetaType>
#include <QString>

/// A request to plan the fuel stops between two addresses.
struct FuelRequest {
  static constexpr int MAX_ADDRESS_LENGTH = 200; ///< Longest accepted address.

  QString start; ///< Departure address, e.g., "New York, NY".
  QString end; ///< Arrival address.

  FuelRequest() = default;

  FuelRequest(const QString& start, const QString& end) : start(start), end(end) {}

  /// Check the request, trimming both addresses in-place.
  /** @param[out] why Explanation of the problem, if the request is invalid.
    * @return true if both addresses are non-empty after trimming and not
    *   longer than MAX_ADDRESS_LENGTH characters.
    */
  bool normalize(QString& why) {
    start = start.trimmed();
    end = end.trimmed();

    if(start.isEmpty()) {
      why = "Start location is required";
      return false;
    }

    if(end.isEmpty()) {
      why = "End location is required";
      return false;
    }

    if(start.size() > MAX_ADDRESS_LENGTH) {
      why = QString("Start location must be at most %1 characters").arg(MAX_ADDRESS_LENGTH);
      return false;
    }

    if(end.size() > MAX_ADDRESS_LENGTH) {
      why = QString("End location must be at most %1 characters").arg(MAX_ADDRESS_LENGTH);
      return false;
    }

    return true;
  }

  /// Same as normalize(), but leaves this request untouched.
  bool isValid(QString& why) const {
    FuelRequest copy(*this);
    return copy.normalize(why);
  }
};

Q_DECLARE_METATYPE(FuelRequest);

#endif // FUEL_REQUEST_HPP
