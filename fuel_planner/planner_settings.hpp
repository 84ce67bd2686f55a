#ifndef PLANNER_SETTINGS_HPP
#define PLANNER_SETTINGS_HPP

#include "fuel_problem.hpp"
#include "retry_policy.hpp"

#include <QString>


/// Configuration of the planner and of its collaborators.
/** Settings are stored in an INI file, grouped in sections:
  *
  *     [database]
  *     path=/var/lib/fuel_planner/stations.db
  *
  *     [routing]
  *     backend=osrm
  *     osrm_url=https://router.project-osrm.org
  *     timeout_ms=30000
  *
  *     [geocoding]
  *     nominatim_url=https://nominatim.openstreetmap.org
  *     user_agent=fuel_route_optimizer
  *     timeout_ms=10000
  *     min_interval_ms=1000
  *
  *     [vehicle]
  *     range_miles=500
  *     efficiency_mpg=10
  *
  *     [planner]
  *     corridor_half_width_miles=15
  *     greedy_buffer_miles=50
  *     max_candidates=2000
  *     thinning_segment_miles=10
  *
  *     [ingestion]
  *     max_attempts=3
  *     backoff_ms=1000, 2000, 4000
  *
  * Missing keys keep their default value.
  */
struct PlannerSettings {
  static const QString DEFAULT_FILENAME; ///< Name of the file in the config directory.
  static const QString BACKEND_OSRM; ///< Route with an OSRM server.
  static const QString BACKEND_DEMO; ///< Route along straight lines, offline.

  QString database_path; ///< SQLite file; if empty, the default one is used.
  QString routing_backend = BACKEND_OSRM; ///< Either BACKEND_OSRM or BACKEND_DEMO.
  QString osrm_url; ///< Root URL of the OSRM server.
  int routing_timeout_ms = 30000; ///< Timeout of routing requests.
  QString nominatim_url; ///< Root URL of the Nominatim server.
  QString user_agent = "fuel_route_optimizer"; ///< Identifies us to Nominatim.
  int geocoding_timeout_ms = 10000; ///< Timeout of geocoding requests.
  int geocoding_min_interval_ms = 1000; ///< Minimum delay between geocoding requests.
  FuelProblem problem; ///< Vehicle and planner parameters.
  RetryPolicy retry; ///< Retries of the ingestion job.

  PlannerSettings();

  /// Location of the default settings file, in the user's config directory.
  static QString defaultPath();

  /// Read the settings from an INI file.
  /** @param path Path of the file. If empty, defaultPath() is used, and it
    *   is not an error if the file does not exist.
    * @param[out] why Explanation of the failure, if any.
    * @return false if the file cannot be read, if a value cannot be
    *   converted, or if the resulting settings are not valid.
    */
  bool load(const QString& path, QString& why);

  bool isValid(QString& why) const;
};

#endif // PLANNER_SETTINGS_HPP
