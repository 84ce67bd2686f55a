#ifndef RETRY_POLICY_HPP
#define RETRY_POLICY_HPP

#include <QList>
#include <QString>

/// How many times, and how often, a transient failure is retried.
struct RetryPolicy {
  int max_attempts = 3; ///< Total number of attempts, including the first one.
  QList<int> backoff_ms{1000, 2000, 4000}; ///< Delay before each retry, in milliseconds.

  /// Delay to wait after the given (zero-based) failed attempt.
  /** If there are more attempts than delays, the last delay is reused.
    */
  inline int delay(int attempt) const {
    if(backoff_ms.isEmpty())
      return 0;
    return backoff_ms.at(qBound(0, attempt, static_cast<int>(backoff_ms.size())-1));
  }

  bool isValid(QString& why) const {
    if(max_attempts < 1) {
      why = "Parameter 'max_attempts' must be at least 1";
      return false;
    }

    for(int d : backoff_ms) {
      if(d < 0) {
        why = "Parameter 'backoff_ms' must not contain negative delays";
        return false;
      }
    }

    return true;
  }
};

#endif // RETRY_POLICY_HPP
