#include "planner_settings.hpp"

#include "geocoder_nominatim.hpp"
#include "router_osrm.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QStringList>

#include <type_traits>


const QString PlannerSettings::DEFAULT_FILENAME = "fuel_planner.ini";
const QString PlannerSettings::BACKEND_OSRM = "osrm";
const QString PlannerSettings::BACKEND_DEMO = "demo";


PlannerSettings::PlannerSettings()
  : osrm_url(RouterOsrm::DEFAULT_URL)
  , nominatim_url(GeocoderNominatim::DEFAULT_URL)
{

}


QString PlannerSettings::defaultPath() {
  QDir config_dir(QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation));
  return config_dir.filePath(DEFAULT_FILENAME);
}


// Helper function: read a number, keeping the current value if the key is
// missing.
template<class T>
static bool readNumber(
  const QSettings& settings,
  const QString& key,
  T& value,
  QString& why
)
{
  if(!settings.contains(key))
    return true;

  bool ok = false;
  T v;
  if constexpr(std::is_integral_v<T>) {
    v = settings.value(key).toString().trimmed().toInt(&ok);
  }
  else {
    v = settings.value(key).toString().trimmed().toDouble(&ok);
  }

  if(!ok) {
    why = QString("Invalid value '%1' for key '%2'").arg(settings.value(key).toString(), key);
    return false;
  }

  value = v;
  return true;
}


bool PlannerSettings::load(
  const QString& path,
  QString& why
)
{
  QString file_path = path.isEmpty() ? defaultPath() : path;

  if(!QFileInfo::exists(file_path)) {
    if(!path.isEmpty()) {
      why = QString("Configuration file '%1' does not exist").arg(file_path);
      return false;
    }
    qDebug() << "No configuration file in" << file_path << "- using defaults";
    return isValid(why);
  }

  QSettings settings(file_path, QSettings::IniFormat);
  if(settings.status() != QSettings::NoError) {
    why = QString("Could not read configuration file '%1'").arg(file_path);
    return false;
  }

  database_path = settings.value("database/path", database_path).toString();

  routing_backend = settings.value("routing/backend", routing_backend).toString().trimmed().toLower();
  osrm_url = settings.value("routing/osrm_url", osrm_url).toString();
  nominatim_url = settings.value("geocoding/nominatim_url", nominatim_url).toString();
  user_agent = settings.value("geocoding/user_agent", user_agent).toString();

  bool ok = readNumber(settings, "routing/timeout_ms", routing_timeout_ms, why)
    && readNumber(settings, "geocoding/timeout_ms", geocoding_timeout_ms, why)
    && readNumber(settings, "geocoding/min_interval_ms", geocoding_min_interval_ms, why)
    && readNumber(settings, "vehicle/range_miles", problem.range_miles, why)
    && readNumber(settings, "vehicle/efficiency_mpg", problem.efficiency_mpg, why)
    && readNumber(settings, "planner/corridor_half_width_miles", problem.corridor_half_width_miles, why)
    && readNumber(settings, "planner/greedy_buffer_miles", problem.greedy_buffer_miles, why)
    && readNumber(settings, "planner/max_candidates", problem.max_candidates, why)
    && readNumber(settings, "planner/thinning_segment_miles", problem.thinning_segment_miles, why)
    && readNumber(settings, "ingestion/max_attempts", retry.max_attempts, why);
  if(!ok) {
    return false;
  }

  if(settings.contains("ingestion/backoff_ms")) {
    // QSettings returns a list for comma-separated values, and a string for
    // a single value.
    QStringList delays = settings.value("ingestion/backoff_ms").toStringList();
    retry.backoff_ms.clear();
    for(const auto& d : delays) {
      bool d_ok = false;
      int delay = d.trimmed().toInt(&d_ok);
      if(!d_ok) {
        why = QString("Invalid value '%1' for key 'ingestion/backoff_ms'").arg(d);
        return false;
      }
      retry.backoff_ms.append(delay);
    }
  }

  qDebug() << "Loaded configuration from" << file_path;
  return isValid(why);
}


bool PlannerSettings::isValid(
  QString& why
) const
{
  if(routing_backend != BACKEND_OSRM && routing_backend != BACKEND_DEMO) {
    why = QString("Unknown routing backend '%1', expected '%2' or '%3'").arg(routing_backend, BACKEND_OSRM, BACKEND_DEMO);
    return false;
  }

  if(routing_timeout_ms <= 0 || geocoding_timeout_ms <= 0) {
    why = "Timeouts must be positive";
    return false;
  }

  if(geocoding_min_interval_ms < 0) {
    why = "Parameter 'min_interval_ms' must be positive or zero";
    return false;
  }

  if(user_agent.trimmed().isEmpty()) {
    why = "Parameter 'user_agent' must not be empty";
    return false;
  }

  return problem.isValid(why) && retry.isValid(why);
}
