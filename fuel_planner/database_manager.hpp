#ifndef DATABASE_MANAGER_HPP
#define DATABASE_MANAGER_HPP

#include "fuel_station.hpp"

#include <memory>

#include <QGeoCoordinate>
#include <QList>
#include <QMap>
#include <QObject>
#include <QPair>
#include <QSqlQuery>
#include <QString>


/// Access to the catalog of fuel stations.
/** All operations use Qt's default database connection, which is set up by
  * loadDatabase().
  */
class DatabaseManager : public QObject {
  Q_OBJECT

public:
  /// A (city, state) pair, used to geocode stations in bulk.
  using Location = QPair<QString, QString>;

  /// Name of the database file inside the application data directory.
  static const QString DEFAULT_FILENAME;

  /// Load the database from a file.
  /** The file is created if it does not exist yet, together with the
    * required tables. If it exists, it must contain the expected columns.
    * @param path Path of the SQLite file, or ":memory:" for a temporary
    *   in-memory database. If empty, DEFAULT_FILENAME is looked for in the
    *   application data directory.
    * @return An empty string if the database was loaded successfully,
    *   otherwise a string explaining what went wrong.
    */
  static QString loadDatabase(const QString& path = QString());

  /// Auxiliary class to specify a set of filters when requesting data.
  class Filter {
  public:
    Filter() = default;
    QSqlQuery compile() const;
    bool setGPSRange(
      double min_latitude,
      double max_latitude,
      double min_longitude,
      double max_longitude
    );
    bool setPriceRange(double min_price, double max_price);
    void setGeocoded(bool geocoded);
  private:
    std::unique_ptr<double> min_latitude = nullptr;
    std::unique_ptr<double> max_latitude = nullptr;
    std::unique_ptr<double> min_longitude = nullptr;
    std::unique_ptr<double> max_longitude = nullptr;
    std::unique_ptr<double> min_price = nullptr;
    std::unique_ptr<double> max_price = nullptr;
    std::unique_ptr<bool> geocoded = nullptr;
  };

  /// Create a new DatabaseManager.
  explicit inline DatabaseManager(QObject* parent = nullptr) : QObject(parent) { }

  /// Retrieve all stations from the database, given some conditions.
  /** @param[in] filter A DatabaseManager::Filter instance that sets conditions
    *   on the records to be fetched.
    * @param[out] stations List to be filled with the matching stations.
    * @return The method returns false if there was an issue accessing the
    *   database. It will return true if data could be retrieved. Note that if
    *   no station matches the given filter, the method returns true as this is
    *   not a database access issue. In this case, the output list will simply
    *   have zero-size.
    */
  bool findStations(
    const Filter& filter,
    QList<FuelStation>& stations
  );

  /// Retrieve all stations from the database.
  /** @see findStations().
    */
  inline bool allStations(QList<FuelStation>& stations) { return findStations(Filter(), stations); }

  /// Count the stations in the catalog.
  /** @param[out] total Number of stations.
    * @param[out] geocoded Number of stations with a known location.
    * @return false if an error occurred, true otherwise.
    */
  bool stationCounts(int& total, int& geocoded);

  /// Replace the whole catalog with the given stations.
  /** The operation runs inside a transaction: on failure, the previous
    * content is left untouched. Stations with the same name, address, city
    * and state as one inserted before are skipped.
    * @return false if an error occurred, true otherwise.
    */
  bool replaceStations(const QList<FuelStation>& stations);

  /// List the (city, state) pairs of all stations that are not geocoded.
  /** @param[out] locations Distinct pairs, sorted by state and city.
    * @return false if an error occurred, true otherwise.
    */
  bool pendingLocations(QList<Location>& locations);

  /// Set the coordinates of the stations that are not geocoded yet.
  /** All stations in a given city and state receive the same coordinates.
    * The operation runs inside a transaction.
    * @param coordinates Map from (city, state) pairs to their location.
    * @param[out] updated Number of stations that were updated.
    * @return false if an error occurred, true otherwise.
    */
  bool resolveLocations(
    const QMap<Location, QGeoCoordinate>& coordinates,
    int& updated
  );
};

#endif // DATABASE_MANAGER_HPP
