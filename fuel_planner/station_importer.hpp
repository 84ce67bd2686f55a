#ifndef STATION_IMPORTER_HPP
#define STATION_IMPORTER_HPP

#include "database_manager.hpp"
#include "fuel_station.hpp"
#include "geocoder.hpp"
#include "retry_policy.hpp"

#include <QGeoCoordinate>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>


/// Offline job that fills the catalog from a price feed.
/** The feed is a CSV file with one row per station and per fuel rack. Rows
  * are grouped by station, keeping the lowest price. Since the feed does not
  * contain coordinates, stations are then located by city: all stations in
  * the same (city, state) share the same coordinates.
  */
class StationImporter : public QObject {
  Q_OBJECT
public:
  /// Province codes that appear in the feed but cannot be located in the USA.
  static const QStringList CANADIAN_PROVINCES;

  /// Columns that must be present in the CSV header.
  static const QStringList REQUIRED_COLUMNS;

  /// Summary of a geocoding run.
  struct GeocodeReport {
    int located = 0; ///< Number of (city, state) pairs that were found.
    int updated = 0; ///< Number of stations that received coordinates.
    QStringList failed; ///< Queries that could not be resolved.
  };

  /// Create a new importer.
  /** @param database Catalog to be filled.
    * @param geocoder Used to locate cities. Not owned by the importer.
    * @param policy Retries applied to transient geocoding errors.
    * @param parent Parent object, needed for Qt's memory management.
    */
  StationImporter(
    DatabaseManager* database,
    Geocoder* geocoder,
    const RetryPolicy& policy,
    QObject* parent = nullptr
  );

  /// Split CSV text into rows of fields.
  /** Fields can be quoted with double quotes, in which case they can contain
    * commas, line breaks and doubled quotes. Empty lines are skipped.
    * @return false if a quoted field is not terminated.
    */
  static bool parseCsv(const QString& text, QList<QStringList>& rows, QString& why);

  /// Read a price feed and group its rows by station.
  /** Header names are trimmed, lower-cased and spaces are replaced by
    * underscores. Stations with the same name, address, city and state are
    * merged: the lowest price is kept, while the OPIS and rack identifiers
    * are those of the first row. Rows with invalid numbers are skipped.
    * @param path Path of the CSV file.
    * @param[out] stations Stations found in the file, not geocoded.
    * @param[out] why Explanation of the failure, if any.
    * @return false if the file cannot be read or lacks a required column.
    */
  static bool loadCsv(const QString& path, QList<FuelStation>& stations, QString& why);

  /// Replace the catalog with the content of a price feed.
  /** @param path Path of the CSV file.
    * @param[out] imported Number of stations in the catalog after the import.
    * @param[out] why Explanation of the failure, if any.
    */
  bool importCsv(const QString& path, int& imported, QString& why);

  /// Locate all stations that do not have coordinates yet.
  /** Each distinct (city, state) pair is queried once, as "{city}, {state},
    * USA". Transient errors are retried according to the retry policy, any
    * other failure is final for this run. Canadian provinces are skipped.
    * @param[out] report What was located, and what was not.
    * @param[out] why Explanation of the failure, if any.
    * @return false only if the catalog could not be read or updated.
    */
  bool geocodePending(GeocodeReport& report, QString& why);

private:
  DatabaseManager* database_ = nullptr; ///< Catalog to be filled.
  Geocoder* geocoder_ = nullptr; ///< Used to locate cities.
  RetryPolicy policy_; ///< Retries of transient geocoding errors.

  /// Run a geocoding query, retrying transient errors.
  Geocoder::Status geocodeWithRetry(
    const QString& query,
    QGeoCoordinate& coordinate,
    QString& why
  );
};

#endif // STATION_IMPORTER_HPP
