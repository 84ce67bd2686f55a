#include "database_manager.hpp"
#include "test_utilities.hpp"

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QTemporaryDir>
#include <QtTest>

#include <algorithm>


class TestDatabaseManager : public QObject {
  Q_OBJECT
private slots:
  void init();
  void emptyDatabase();
  void replaceStations();
  void replaceSkipsDuplicates();
  void findStations();
  void pendingAndResolve();
  void persistence();
  void incompatibleDatabase();

private:
  DatabaseManager database_;
};


void TestDatabaseManager::init() {
  QString why = DatabaseManager::loadDatabase(":memory:");
  QVERIFY2(why.isEmpty(), qPrintable(why));
}


void TestDatabaseManager::emptyDatabase() {
  int total = -1, geocoded = -1;
  QVERIFY(database_.stationCounts(total, geocoded));
  QCOMPARE(total, 0);
  QCOMPARE(geocoded, 0);

  QList<FuelStation> stations{FuelStation(1, "Left over", 1.0, 0.0, 0.0)};
  QVERIFY(database_.allStations(stations));
  QVERIFY(stations.isEmpty());

  QList<DatabaseManager::Location> locations;
  QVERIFY(database_.pendingLocations(locations));
  QVERIFY(locations.isEmpty());
}


void TestDatabaseManager::replaceStations() {
  FuelStation located(0, "Located", 3.199, 32.7767, -96.7970);
  located.address = "I-35E, Exit 428";
  located.city = "Dallas";
  located.state = "TX";
  located.opis_id = 7;
  located.rack_id = 101;

  QVERIFY(database_.replaceStations({located, pendingStation("Pending", "Austin", "TX", 3.5)}));

  int total, geocoded;
  QVERIFY(database_.stationCounts(total, geocoded));
  QCOMPARE(total, 2);
  QCOMPARE(geocoded, 1);

  QList<FuelStation> stations;
  QVERIFY(database_.allStations(stations));
  QCOMPARE(stations.size(), 2);

  auto it = std::find_if(stations.cbegin(), stations.cend(), [](const FuelStation& s) { return s.name == "Located"; });
  QVERIFY(it != stations.cend());
  QVERIFY(it->id > 0);
  QCOMPARE(it->opis_id, 7);
  QCOMPARE(it->rack_id, 101);
  QCOMPARE(it->address, QString("I-35E, Exit 428"));
  QCOMPARE(it->city, QString("Dallas"));
  QCOMPARE(it->state, QString("TX"));
  QCOMPARE(it->price, 3.199);
  QVERIFY(it->geocoded);
  QCOMPARE(it->location.latitude(), 32.7767);
  QCOMPARE(it->location.longitude(), -96.7970);

  it = std::find_if(stations.cbegin(), stations.cend(), [](const FuelStation& s) { return s.name == "Pending"; });
  QVERIFY(it != stations.cend());
  QVERIFY(!it->geocoded);
  QVERIFY(!it->location.isValid());

  // A second import replaces the whole catalog.
  QVERIFY(database_.replaceStations({pendingStation("Other", "Waco", "TX", 3.0)}));
  QVERIFY(database_.stationCounts(total, geocoded));
  QCOMPARE(total, 1);
  QCOMPARE(geocoded, 0);
}


void TestDatabaseManager::replaceSkipsDuplicates() {
  QVERIFY(database_.replaceStations({
    pendingStation("Twin", "Austin", "TX", 3.5),
    pendingStation("Twin", "Austin", "TX", 3.1),
    pendingStation("Twin", "Waco", "TX", 3.2)
  }));

  int total, geocoded;
  QVERIFY(database_.stationCounts(total, geocoded));
  QCOMPARE(total, 2);
}


void TestDatabaseManager::findStations() {
  FuelStation not_geocoded = pendingStation("Pending", "Austin", "TX", 3.5);
  QVERIFY(database_.replaceStations({
    FuelStation(0, "Inside", 3.0, 40.0, -100.0),
    FuelStation(0, "Expensive", 4.5, 40.5, -99.5),
    FuelStation(0, "Outside", 2.0, 45.0, -100.0),
    not_geocoded
  }));

  DatabaseManager::Filter filter;
  QVERIFY(filter.setGPSRange(39.0, 41.0, -101.0, -99.0));
  QVERIFY(!filter.setGPSRange(41.0, 39.0, -101.0, -99.0));
  filter.setGeocoded(true);

  QList<FuelStation> stations;
  QVERIFY(database_.findStations(filter, stations));
  QCOMPARE(stations.size(), 2);
  for(const auto& s : stations) {
    QVERIFY(s.geocoded);
    QVERIFY(s.name == "Inside" || s.name == "Expensive");
  }

  QVERIFY(filter.setPriceRange(0.0, 4.0));
  QVERIFY(!filter.setPriceRange(-1.0, 4.0));
  QVERIFY(database_.findStations(filter, stations));
  QCOMPARE(stations.size(), 1);
  QCOMPARE(stations[0].name, QString("Inside"));

  DatabaseManager::Filter pending;
  pending.setGeocoded(false);
  QVERIFY(database_.findStations(pending, stations));
  QCOMPARE(stations.size(), 1);
  QCOMPARE(stations[0].name, QString("Pending"));

  // No match is not an error.
  DatabaseManager::Filter nowhere;
  QVERIFY(nowhere.setGPSRange(-10.0, -5.0, 10.0, 20.0));
  QVERIFY(database_.findStations(nowhere, stations));
  QVERIFY(stations.isEmpty());
}


void TestDatabaseManager::pendingAndResolve() {
  QVERIFY(database_.replaceStations({
    pendingStation("A", "Dallas", "TX", 3.0),
    pendingStation("B", "Dallas", "TX", 3.1),
    pendingStation("C", "Tulsa", "OK", 3.2),
    pendingStation("D", "Austin", "TX", 3.3),
    FuelStation(0, "E", 3.4, 30.0, -97.0)
  }));

  QList<DatabaseManager::Location> locations;
  QVERIFY(database_.pendingLocations(locations));
  QCOMPARE(locations, QList<DatabaseManager::Location>({{"Tulsa", "OK"}, {"Austin", "TX"}, {"Dallas", "TX"}}));

  QMap<DatabaseManager::Location, QGeoCoordinate> coordinates{
    {{"Dallas", "TX"}, QGeoCoordinate(32.7767, -96.7970)},
    {{"Tulsa", "OK"}, QGeoCoordinate(36.1540, -95.9928)}
  };
  int updated = -1;
  QVERIFY(database_.resolveLocations(coordinates, updated));
  QCOMPARE(updated, 3);

  QVERIFY(database_.pendingLocations(locations));
  QCOMPARE(locations, QList<DatabaseManager::Location>({{"Austin", "TX"}}));

  DatabaseManager::Filter filter;
  QVERIFY(filter.setGPSRange(32.0, 33.0, -97.0, -96.0));
  QList<FuelStation> stations;
  QVERIFY(database_.findStations(filter, stations));
  QCOMPARE(stations.size(), 2);

  // Resolving again does not touch stations that already have coordinates.
  QVERIFY(database_.resolveLocations(coordinates, updated));
  QCOMPARE(updated, 0);
}


void TestDatabaseManager::persistence() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = dir.filePath("stations.db");

  QString why = DatabaseManager::loadDatabase(path);
  QVERIFY2(why.isEmpty(), qPrintable(why));
  QVERIFY(database_.replaceStations({FuelStation(0, "Kept", 3.0, 40.0, -100.0)}));

  // Loading the in-memory database in between closes the file.
  QVERIFY(DatabaseManager::loadDatabase(":memory:").isEmpty());
  why = DatabaseManager::loadDatabase(path);
  QVERIFY2(why.isEmpty(), qPrintable(why));

  int total, geocoded;
  QVERIFY(database_.stationCounts(total, geocoded));
  QCOMPARE(total, 1);
  QCOMPARE(geocoded, 1);
}


void TestDatabaseManager::incompatibleDatabase() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = dir.filePath("other.db");

  {
    QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", "setup");
    db.setDatabaseName(path);
    QVERIFY(db.open());
    QSqlQuery query(db);
    QVERIFY(query.exec("CREATE TABLE Stations (id INTEGER PRIMARY KEY, name TEXT);"));
  }
  QSqlDatabase::removeDatabase("setup");

  QVERIFY(!DatabaseManager::loadDatabase(path).isEmpty());
}


QTEST_GUILESS_MAIN(TestDatabaseManager)
#include "tst_database_manager.moc"
