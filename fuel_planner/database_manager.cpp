#include "database_manager.hpp"

#include <QDebug>
#include <QDir>
#include <QSet>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QSqlRecord>
#include <QStandardPaths>
#include <QStringList>


const QString DatabaseManager::DEFAULT_FILENAME = "stations.db";


// Helper function: copy the current record of a query into a station.
static FuelStation stationFromQuery(const QSqlQuery& query)
{
  FuelStation station;
  station.id = query.value("id").toInt();
  station.opis_id = query.value("opis_truckstop_id").toInt();
  station.name = query.value("truckstop_name").toString();
  station.address = query.value("address").toString();
  station.city = query.value("city").toString();
  station.state = query.value("state").toString();
  station.rack_id = query.value("rack_id").toInt();
  station.price = query.value("retail_price").toDouble();
  station.geocoded = query.value("geocoded").toBool();

  // Coordinates are NULL until the station is geocoded.
  if(!query.value("latitude").isNull() && !query.value("longitude").isNull()) {
    station.location = QGeoCoordinate(
      query.value("latitude").toDouble(),
      query.value("longitude").toDouble()
    );
  }
  return station;
}


bool DatabaseManager::findStations(
  const Filter& filter,
  QList<FuelStation>& stations
)
{
  stations.clear();

  // Given the filter, obtain the corresponding query.
  QSqlQuery query = filter.compile();
  qDebug() << "Running query:" << query.lastQuery();

  // Execute the query, and exit on failure.
  if(!query.exec()) {
    qDebug() << "Failed to run query:" << query.lastError().text();
    return false;
  }

  if(!query.next()) {
    qDebug() << "Query appears to be empty";
    // If the first call to query.next() returns false, then there are no
    // records matching the filter! Return "true" since this is not an error.
    return true;
  }

  // Fetch the number of records - which is a field contained in each record!
  stations.reserve(query.value("query_size").toInt());

  do {
    stations.append(stationFromQuery(query));
  } while(query.next());

  return true;
}


bool DatabaseManager::stationCounts(
  int& total,
  int& geocoded
)
{
  QSqlQuery query;
  if(!query.exec("SELECT COUNT(*) AS total, COALESCE(SUM(geocoded), 0) AS geocoded FROM Stations;") || !query.next()) {
    qDebug() << "Failed to count stations:" << query.lastError().text();
    return false;
  }

  total = query.value("total").toInt();
  geocoded = query.value("geocoded").toInt();
  return true;
}


bool DatabaseManager::replaceStations(
  const QList<FuelStation>& stations
)
{
  QSqlDatabase db = QSqlDatabase::database();
  if(!db.transaction()) {
    qDebug() << "Failed to start transaction:" << db.lastError().text();
    return false;
  }

  // Helper lambda: give up and restore the previous content.
  auto rollback = [&db](const QString& why) {
    qDebug() << why;
    db.rollback();
    return false;
  };

  QSqlQuery query;
  if(!query.exec("DELETE FROM Stations;")) {
    return rollback("Failed to clear the Stations table: " + query.lastError().text());
  }

  // Create a query that can insert stations, skipping duplicates.
  QString query_str = QString(
    "INSERT OR IGNORE INTO Stations"
    " "
    "(opis_truckstop_id, truckstop_name, address, city, state, rack_id, retail_price, latitude, longitude, geocoded)"
    " "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);"
  );

  // Prepare the query for execution.
  if(!query.prepare(query_str)) {
    return rollback("Failed to prepare query: " + query.lastError().text());
  }

  // For each station, run the query.
  for(const auto& s : stations) {
    bool has_location = s.geocoded && s.location.isValid();
    query.addBindValue(s.opis_id);
    query.addBindValue(s.name);
    query.addBindValue(s.address);
    query.addBindValue(s.city);
    query.addBindValue(s.state);
    query.addBindValue(s.rack_id);
    query.addBindValue(s.price);
    query.addBindValue(has_location ? QVariant(s.location.latitude()) : QVariant());
    query.addBindValue(has_location ? QVariant(s.location.longitude()) : QVariant());
    query.addBindValue(has_location);
    if(!query.exec()) {
      // Exit on failure.
      return rollback(QString("Failed to insert station '%1': %2").arg(s.name, query.lastError().text()));
    }
  }

  if(!db.commit()) {
    return rollback("Failed to commit transaction: " + db.lastError().text());
  }

  // All stations were inserted!
  return true;
}


bool DatabaseManager::pendingLocations(
  QList<Location>& locations
)
{
  locations.clear();

  QSqlQuery query;
  if(!query.exec("SELECT DISTINCT city, state FROM Stations WHERE geocoded = 0 ORDER BY state, city;")) {
    qDebug() << "Failed to list pending locations:" << query.lastError().text();
    return false;
  }

  while(query.next()) {
    locations.append({query.value("city").toString(), query.value("state").toString()});
  }
  return true;
}


bool DatabaseManager::resolveLocations(
  const QMap<Location, QGeoCoordinate>& coordinates,
  int& updated
)
{
  updated = 0;

  QSqlDatabase db = QSqlDatabase::database();
  if(!db.transaction()) {
    qDebug() << "Failed to start transaction:" << db.lastError().text();
    return false;
  }

  QSqlQuery query;
  if(!query.prepare(
    "UPDATE Stations SET latitude = ?, longitude = ?, geocoded = 1"
    " "
    "WHERE city = ? AND state = ? AND geocoded = 0;"
  )) {
    qDebug() << "Failed to prepare query:" << query.lastError().text();
    db.rollback();
    return false;
  }

  for(const auto& [location, coordinate] : coordinates.asKeyValueRange()) {
    query.addBindValue(coordinate.latitude());
    query.addBindValue(coordinate.longitude());
    query.addBindValue(location.first);
    query.addBindValue(location.second);
    if(!query.exec()) {
      qDebug() << "Failed to update location" << location.first << location.second << ":" << query.lastError().text();
      db.rollback();
      updated = 0;
      return false;
    }
    updated += query.numRowsAffected();
  }

  if(!db.commit()) {
    qDebug() << "Failed to commit transaction:" << db.lastError().text();
    db.rollback();
    updated = 0;
    return false;
  }
  return true;
}


// Helper function that can determine if a database has the expected structure.
static bool validate(
  const QSqlDatabase& db,
  const QMap<QString, QSet<QString>>& expected_tables
)
{
  // Make sure the DB contains the required table and columns.
  for(const auto& [table_name, required_columns] : expected_tables.asKeyValueRange()) {
    // Does the DB contain the required table?
    if(!db.tables().contains(table_name)) {
      return false;
    }

    // Does the table contain the expected columns?
    QSqlRecord r = db.record(table_name);
    QSet<QString> existing_columns;
    for(int i=0; i<r.count(); i++) {
      existing_columns << r.fieldName(i).toLower();
    }
    if(!existing_columns.contains(required_columns)) {
      return false;
    }
  }

  return true;
}


// Helper function: create the tables and indices of an empty database.
static bool createSchema()
{
  const QStringList statements{
    "CREATE TABLE Stations ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " opis_truckstop_id INTEGER NOT NULL DEFAULT 0,"
    " truckstop_name TEXT NOT NULL,"
    " address TEXT NOT NULL DEFAULT '',"
    " city TEXT NOT NULL DEFAULT '',"
    " state TEXT NOT NULL DEFAULT '',"
    " rack_id INTEGER NOT NULL DEFAULT 0,"
    " retail_price REAL NOT NULL,"
    " latitude REAL,"
    " longitude REAL,"
    " geocoded INTEGER NOT NULL DEFAULT 0,"
    " UNIQUE (truckstop_name, address, city, state)"
    ");",
    "CREATE INDEX stations_state_geocoded ON Stations (state, geocoded);",
    "CREATE INDEX stations_coordinates ON Stations (latitude, longitude);",
    "CREATE INDEX stations_price ON Stations (retail_price);"
  };

  QSqlQuery query;
  for(const auto& statement : statements) {
    if(!query.exec(statement)) {
      qDebug() << "Failed to create schema:" << query.lastError().text();
      return false;
    }
  }
  return true;
}


QString DatabaseManager::loadDatabase(const QString& path) {
  // Sanity check to be able to use SQLite.
  if(!QSqlDatabase::drivers().contains("QSQLITE")) {
    return "Unable to load database: missing SQLITE driver";
  }

  // Use the given file, or the default one inside the "AppData" directory.
  QString db_path = path;
  if(db_path.isEmpty()) {
    QDir data_dir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation));
    if(!data_dir.exists() && !data_dir.mkpath(".")) {
      return QString("Failed to create directory '%1'").arg(data_dir.absolutePath());
    }
    db_path = data_dir.filePath(DEFAULT_FILENAME);
  }

  // Drop any database that was loaded before.
  if(QSqlDatabase::contains(QSqlDatabase::defaultConnection)) {
    QSqlDatabase::database(QSqlDatabase::defaultConnection, false).close();
    QSqlDatabase::removeDatabase(QSqlDatabase::defaultConnection);
  }

  QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE");
  db.setDatabaseName(db_path);

  if(!db.open()) {
    QString error = db.lastError().text();
    db = QSqlDatabase();
    QSqlDatabase::removeDatabase(QSqlDatabase::defaultConnection);
    return QString("Could not open database '%1': %2").arg(db_path, error);
  }

  // A brand new database needs its tables.
  if(!db.tables().contains("Stations")) {
    qDebug() << "Creating tables in" << db_path;
    if(!createSchema()) {
      return "Failed to create the tables of the database";
    }
  }

  // Check that there are the required tables.
  QMap<QString, QSet<QString>> expected_db{
    {"Stations", {"id", "opis_truckstop_id", "truckstop_name", "address", "city", "state", "rack_id", "retail_price", "latitude", "longitude", "geocoded"}}
  };
  if(!validate(db, expected_db)) {
    // Remove the database from the list of connections.
    db.close();
    db = QSqlDatabase();
    QSqlDatabase::removeDatabase(QSqlDatabase::defaultConnection);
    return "The database is incompatible, it does not have the required tables and columns";
  }

  // Ok, the database was open!
  qDebug() << "Loaded database" << db_path;
  return QString();
}
