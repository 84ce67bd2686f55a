#include "database_manager.hpp"
#include "fuel_planner.hpp"
#include "geocoder.hpp"
#include "math_utilities.hpp"
#include "router_service.hpp"
#include "test_utilities.hpp"

#include <QJsonArray>
#include <QSignalSpy>
#include <QtTest>


class TestFuelPlanner : public QObject {
  Q_OBJECT
private slots:
  void initTestCase();
  void init();
  void crossCountry();
  void shortRoute();
  void emptyCorridor();
  void greedyFallback();
  void thinnedCandidatesStayFeasible();
  void invalidRequests_data();
  void invalidRequests();
  void invalidProblem();
  void solveEmitsSignals();

private:
  Geocoder geocoder_;
  RouterService router_{&geocoder_};
  DatabaseManager database_;
};


// Point at a given fraction of the demo route from (40, -100) to (40, -80),
// which follows the great circle and is about 1056 miles long.
static void alongRoute(double fraction, double& latitude, double& longitude) {
  math_utilities::intermediatePoint(40.0, -100.0, 40.0, -80.0, fraction, latitude, longitude);
}


static FuelStation stationAlongRoute(
  const QString& name,
  double price,
  double fraction,
  double latitude_offset
)
{
  double latitude, longitude;
  alongRoute(fraction, latitude, longitude);
  return FuelStation(0, name, price, latitude + latitude_offset, longitude);
}


void TestFuelPlanner::initTestCase() {
  qRegisterMetaType<FuelPlan>();
  qRegisterMetaType<FuelRequest>();
}


void TestFuelPlanner::init() {
  QString why = DatabaseManager::loadDatabase(":memory:");
  QVERIFY2(why.isEmpty(), qPrintable(why));

  FuelStation not_geocoded = pendingStation("Pending", "Nowhere", "KS", 0.5);
  QVERIFY(database_.replaceStations({
    stationAlongRoute("West", 3.00, 0.25, 0.05), // ~264 miles from the start
    stationAlongRoute("Cheapest", 2.80, 0.45, -0.05), // ~475 miles
    stationAlongRoute("Middle", 2.90, 0.70, 0.0), // ~739 miles
    stationAlongRoute("East", 3.10, 0.85, 0.1), // ~897 miles
    FuelStation(0, "Off route", 1.00, 45.0, -90.0),
    not_geocoded
  }));
}


void TestFuelPlanner::crossCountry() {
  FuelPlanner planner(&router_, &database_);

  FuelPlan plan;
  QString why;
  QVERIFY2(planner.plan(FuelRequest("40.0, -100.0", "40.0, -80.0"), plan, why), qPrintable(why));

  QCOMPARE(plan.method, FuelPlan::METHOD_DYNAMIC_PROGRAMMING);
  QCOMPARE(plan.stations_considered, 4);
  QCOMPARE(plan.stops.size(), 2);
  QCOMPARE(plan.stops[0].station.station.name, QString("Cheapest"));
  QCOMPARE(plan.stops[1].station.station.name, QString("Middle"));
  QCOMPARE(plan.total_cost, 285.0);
  QVERIFY(std::abs(plan.total_fuel - plan.route.distance_miles / 10.0) < 1e-9);
  QCOMPARE(plan.start_address, QString("40.0, -100.0"));

  // Every leg is within range.
  double previous = 0.0;
  for(const auto& stop : plan.stops) {
    QVERIFY(stop.chainage() - previous <= planner.problem().range_miles);
    QVERIFY(stop.station.lateral_offset <= planner.problem().corridor_half_width_miles);
    previous = stop.chainage();
  }
  QVERIFY(plan.route.distance_miles - previous <= planner.problem().range_miles);

  QJsonObject json = plan.toJson();
  QCOMPARE(json["total_fuel_cost"].toDouble(), 285.0);
  QCOMPARE(json["fuel_stops"].toArray().size(), 2);
}


void TestFuelPlanner::shortRoute() {
  FuelPlanner planner(&router_, &database_);

  FuelPlan plan;
  QString why;
  // Stop on the same great circle, about 317 miles from the start.
  double latitude, longitude;
  alongRoute(0.3, latitude, longitude);
  QString end = QString("%1, %2").arg(latitude, 0, 'f', 6).arg(longitude, 0, 'f', 6);
  QVERIFY2(planner.plan(FuelRequest("40.0, -100.0", end), plan, why), qPrintable(why));
  QCOMPARE(plan.method, FuelPlan::METHOD_DYNAMIC_PROGRAMMING);
  QCOMPARE(plan.stations_considered, 1);
  QVERIFY(plan.stops.isEmpty());
  QCOMPARE(plan.total_cost, 0.0);
}


void TestFuelPlanner::emptyCorridor() {
  FuelPlanner planner(&router_, &database_);

  FuelPlan plan;
  QString why;
  QVERIFY2(planner.plan(FuelRequest("30.0, -100.0", "30.0, -96.0"), plan, why), qPrintable(why));
  QCOMPARE(plan.method, FuelPlan::METHOD_NO_STATIONS);
  QCOMPARE(plan.stations_considered, 0);
  QVERIFY(plan.stops.isEmpty());
  QCOMPARE(plan.total_cost, 0.0);
  QVERIFY(plan.total_fuel > 0.0);
  QVERIFY(std::abs(plan.total_fuel - plan.route.distance_miles / 10.0) < 1e-9);
}


void TestFuelPlanner::greedyFallback() {
  FuelPlanner planner(&router_, &database_);
  FuelProblem problem;
  problem.range_miles = 200.0;
  QString why;
  QVERIFY(planner.setProblem(problem, why));

  FuelPlan plan;
  QVERIFY2(planner.plan(FuelRequest("40.0, -100.0", "40.0, -80.0"), plan, why), qPrintable(why));
  QCOMPARE(plan.method, FuelPlan::METHOD_GREEDY_FALLBACK);
  QCOMPARE(plan.stops.size(), 4);
  QCOMPARE(plan.stops[0].gallons, 20.0);
}


void TestFuelPlanner::thinnedCandidatesStayFeasible() {
  FuelPlanner planner(&router_, &database_);
  FuelProblem problem;
  problem.max_candidates = 2;
  problem.thinning_segment_miles = 1000.0;
  QString why;
  QVERIFY(planner.setProblem(problem, why));

  // Thinning leaves only the cheapest station of the first 1000 miles, and
  // the end of the route cannot be reached from it. The trip is feasible
  // with all the stations, and the optimal plan must still be found.
  FuelPlan plan;
  QVERIFY2(planner.plan(FuelRequest("40.0, -100.0", "40.0, -80.0"), plan, why), qPrintable(why));
  QCOMPARE(plan.stations_considered, 4);
  QCOMPARE(plan.method, FuelPlan::METHOD_DYNAMIC_PROGRAMMING);
  QCOMPARE(plan.stops.size(), 2);
  QCOMPARE(plan.stops[0].station.station.name, QString("Cheapest"));
  QCOMPARE(plan.stops[1].station.station.name, QString("Middle"));
  QCOMPARE(plan.total_cost, 285.0);

  // Thinning that keeps the trip feasible is used as is.
  problem.thinning_segment_miles = 300.0;
  QVERIFY(planner.setProblem(problem, why));
  QVERIFY2(planner.plan(FuelRequest("40.0, -100.0", "40.0, -80.0"), plan, why), qPrintable(why));
  QCOMPARE(plan.method, FuelPlan::METHOD_DYNAMIC_PROGRAMMING);
  QCOMPARE(plan.total_cost, 285.0);
}


void TestFuelPlanner::invalidRequests_data() {
  QTest::addColumn<QString>("start");
  QTest::addColumn<QString>("end");
  QTest::addColumn<QString>("error");

  QTest::newRow("missing start") << " " << "40.0, -80.0" << "Start location is required";
  QTest::newRow("missing end") << "40.0, -100.0" << "" << "End location is required";
  QTest::newRow("unknown start") << "Springfield" << "40.0, -80.0" << "Could not geocode start location: Springfield";
  QTest::newRow("unknown end") << "40.0, -100.0" << " Shelbyville " << "Could not geocode end location: Shelbyville";
}


void TestFuelPlanner::invalidRequests() {
  QFETCH(QString, start);
  QFETCH(QString, end);
  QFETCH(QString, error);

  FuelPlanner planner(&router_, &database_);
  FuelPlan plan;
  QString why;
  QVERIFY(!planner.plan(FuelRequest(start, end), plan, why));
  QCOMPARE(why, error);
}


void TestFuelPlanner::invalidProblem() {
  FuelPlanner planner(&router_, &database_);
  FuelProblem problem;
  problem.efficiency_mpg = 0.0;

  QString why;
  QVERIFY(!planner.setProblem(problem, why));
  QCOMPARE(why, QString("Parameter 'efficiency_mpg' must be positive"));
  QCOMPARE(planner.problem().efficiency_mpg, 10.0);
}


void TestFuelPlanner::solveEmitsSignals() {
  FuelPlanner planner(&router_, &database_);
  QSignalSpy solved(&planner, &FuelPlanner::solved);
  QSignalSpy failed(&planner, &FuelPlanner::failed);

  planner.solve(FuelRequest("40.0, -100.0", "40.0, -80.0"));
  QCOMPARE(solved.count(), 1);
  QCOMPARE(failed.count(), 0);
  FuelPlan plan = solved.takeFirst().at(0).value<FuelPlan>();
  QCOMPARE(plan.stops.size(), 2);

  planner.solve(FuelRequest("", "40.0, -80.0"));
  QCOMPARE(solved.count(), 0);
  QCOMPARE(failed.count(), 1);
  QCOMPARE(failed.takeFirst().at(0).toString(), QString("Start location is required"));
}


QTEST_GUILESS_MAIN(TestFuelPlanner)
#include "tst_fuel_planner.moc"
