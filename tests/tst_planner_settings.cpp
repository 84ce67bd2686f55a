#include "planner_settings.hpp"

#include <QFile>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QtTest>


class TestPlannerSettings : public QObject {
  Q_OBJECT
private slots:
  void initTestCase();
  void defaults();
  void load();
  void partialFile();
  void invalidFiles_data();
  void invalidFiles();
  void missingFile();

private:
  QTemporaryDir dir_;

  // Write an INI file in the temporary directory, and return its path.
  QString writeIni(const QString& name, const QByteArray& content);
};


QString TestPlannerSettings::writeIni(
  const QString& name,
  const QByteArray& content
)
{
  QString path = dir_.filePath(name);
  QFile file(path);
  if(!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
    return QString();
  file.write(content);
  return path;
}


void TestPlannerSettings::initTestCase() {
  QVERIFY(dir_.isValid());
  QStandardPaths::setTestModeEnabled(true);
}


void TestPlannerSettings::defaults() {
  // There is no configuration file in the test config directory.
  QFile::remove(PlannerSettings::defaultPath());

  PlannerSettings settings;
  QString why;
  QVERIFY2(settings.load(QString(), why), qPrintable(why));
  QCOMPARE(settings.routing_backend, PlannerSettings::BACKEND_OSRM);
  QCOMPARE(settings.osrm_url, QString("https://router.project-osrm.org"));
  QCOMPARE(settings.nominatim_url, QString("https://nominatim.openstreetmap.org"));
  QCOMPARE(settings.routing_timeout_ms, 30000);
  QCOMPARE(settings.geocoding_timeout_ms, 10000);
  QCOMPARE(settings.geocoding_min_interval_ms, 1000);
  QCOMPARE(settings.problem.range_miles, 500.0);
  QCOMPARE(settings.problem.efficiency_mpg, 10.0);
  QCOMPARE(settings.problem.corridor_half_width_miles, 15.0);
  QCOMPARE(settings.retry.max_attempts, 3);
  QCOMPARE(settings.retry.backoff_ms, QList<int>({1000, 2000, 4000}));
  QVERIFY(settings.database_path.isEmpty());
}


void TestPlannerSettings::load() {
  QString path = writeIni("full.ini",
    "[database]\n"
    "path=/tmp/stations.db\n"
    "[routing]\n"
    "backend=Demo\n"
    "osrm_url=http://localhost:5000\n"
    "timeout_ms=5000\n"
    "[geocoding]\n"
    "nominatim_url=http://localhost:8080\n"
    "user_agent=fleet_planner_tests\n"
    "timeout_ms=2000\n"
    "min_interval_ms=0\n"
    "[vehicle]\n"
    "range_miles=650.5\n"
    "efficiency_mpg=6.5\n"
    "[planner]\n"
    "corridor_half_width_miles=5\n"
    "greedy_buffer_miles=0\n"
    "max_candidates=100\n"
    "thinning_segment_miles=25\n"
    "[ingestion]\n"
    "max_attempts=5\n"
    "backoff_ms=10, 20, 40, 80\n"
  );
  QVERIFY(!path.isEmpty());

  PlannerSettings settings;
  QString why;
  QVERIFY2(settings.load(path, why), qPrintable(why));
  QCOMPARE(settings.database_path, QString("/tmp/stations.db"));
  QCOMPARE(settings.routing_backend, PlannerSettings::BACKEND_DEMO);
  QCOMPARE(settings.osrm_url, QString("http://localhost:5000"));
  QCOMPARE(settings.routing_timeout_ms, 5000);
  QCOMPARE(settings.nominatim_url, QString("http://localhost:8080"));
  QCOMPARE(settings.user_agent, QString("fleet_planner_tests"));
  QCOMPARE(settings.geocoding_timeout_ms, 2000);
  QCOMPARE(settings.geocoding_min_interval_ms, 0);
  QCOMPARE(settings.problem.range_miles, 650.5);
  QCOMPARE(settings.problem.efficiency_mpg, 6.5);
  QCOMPARE(settings.problem.corridor_half_width_miles, 5.0);
  QCOMPARE(settings.problem.greedy_buffer_miles, 0.0);
  QCOMPARE(settings.problem.max_candidates, 100);
  QCOMPARE(settings.problem.thinning_segment_miles, 25.0);
  QCOMPARE(settings.retry.max_attempts, 5);
  QCOMPARE(settings.retry.backoff_ms, QList<int>({10, 20, 40, 80}));
  QCOMPARE(settings.retry.delay(10), 80);
}


void TestPlannerSettings::partialFile() {
  QString path = writeIni("partial.ini",
    "[vehicle]\n"
    "range_miles=300\n"
    "[ingestion]\n"
    "backoff_ms=250\n"
  );

  PlannerSettings settings;
  QString why;
  QVERIFY2(settings.load(path, why), qPrintable(why));
  QCOMPARE(settings.problem.range_miles, 300.0);
  QCOMPARE(settings.problem.efficiency_mpg, 10.0);
  QCOMPARE(settings.routing_backend, PlannerSettings::BACKEND_OSRM);
  QCOMPARE(settings.retry.backoff_ms, QList<int>({250}));
}


void TestPlannerSettings::invalidFiles_data() {
  QTest::addColumn<QByteArray>("content");

  QTest::newRow("unknown backend") << QByteArray("[routing]\nbackend=carrier_pigeon\n");
  QTest::newRow("not a number") << QByteArray("[vehicle]\nrange_miles=far\n");
  QTest::newRow("negative range") << QByteArray("[vehicle]\nrange_miles=-10\n");
  QTest::newRow("zero efficiency") << QByteArray("[vehicle]\nefficiency_mpg=0\n");
  QTest::newRow("zero timeout") << QByteArray("[routing]\ntimeout_ms=0\n");
  QTest::newRow("no attempts") << QByteArray("[ingestion]\nmax_attempts=0\n");
  QTest::newRow("negative delay") << QByteArray("[ingestion]\nbackoff_ms=100, -1\n");
  QTest::newRow("bad delay") << QByteArray("[ingestion]\nbackoff_ms=soon\n");
}


void TestPlannerSettings::invalidFiles() {
  QFETCH(QByteArray, content);

  QString path = writeIni(QString("%1.ini").arg(QTest::currentDataTag()).replace(' ', '_'), content);
  PlannerSettings settings;
  QString why;
  QVERIFY(!settings.load(path, why));
  QVERIFY(!why.isEmpty());
}


void TestPlannerSettings::missingFile() {
  PlannerSettings settings;
  QString why;
  QVERIFY(!settings.load(dir_.filePath("missing.ini"), why));
  QVERIFY(why.contains("missing.ini"));
}


QTEST_GUILESS_MAIN(TestPlannerSettings)
#include "tst_planner_settings.moc"
