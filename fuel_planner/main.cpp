#include "database_manager.hpp"
#include "fuel_plan.hpp"
#include "fuel_planner.hpp"
#include "fuel_problem.hpp"
#include "fuel_request.hpp"
#include "fuel_station.hpp"
#include "fuel_stop.hpp"
#include "geocoder_nominatim.hpp"
#include "math_utilities.hpp"
#include "planner_settings.hpp"
#include "router_osrm.hpp"
#include "router_service.hpp"
#include "station_importer.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <memory>


// Exit status of failed commands.
constexpr int EXIT_ERROR = 2;


static void printJson(const QJsonObject& json) {
  QTextStream out(stdout);
  out << QJsonDocument(json).toJson(QJsonDocument::Indented);
}


static int fail(const QString& why) {
  qCritical() << why;
  printJson(QJsonObject{{"error", why}});
  return EXIT_ERROR;
}


static int runPlan(
  const PlannerSettings& settings,
  const QString& start,
  const QString& end
)
{
  QElapsedTimer timer;
  timer.start();

  // Demo mode only understands coordinates, and does not need any network.
  std::unique_ptr<Geocoder> geocoder;
  std::unique_ptr<RouterService> router;
  if(settings.routing_backend == PlannerSettings::BACKEND_DEMO) {
    geocoder = std::make_unique<Geocoder>();
    router = std::make_unique<RouterService>(geocoder.get());
  }
  else {
    geocoder = std::make_unique<GeocoderNominatim>(
      settings.nominatim_url,
      settings.user_agent,
      settings.geocoding_timeout_ms,
      settings.geocoding_min_interval_ms
    );
    router = std::make_unique<RouterOsrm>(geocoder.get(), settings.osrm_url, settings.routing_timeout_ms);
  }

  DatabaseManager database;
  FuelPlanner planner(router.get(), &database);

  QString why;
  if(!planner.setProblem(settings.problem, why)) {
    return fail(why);
  }

  FuelPlan plan;
  if(!planner.plan(FuelRequest(start, end), plan, why)) {
    return fail(why);
  }

  QJsonObject json = plan.toJson();
  json["processing_time_seconds"] = math_utilities::roundTo(timer.elapsed() / 1000.0, 2);
  json["api_version"] = "v2";
  printJson(json);
  return 0;
}


static int runHealth() {
  DatabaseManager database;
  int total = 0, geocoded = 0;
  if(!database.stationCounts(total, geocoded)) {
    return fail("Failed to access database");
  }

  printJson(QJsonObject{
    {"status", "healthy"},
    {"service", "fuel-route-optimizer"},
    {"version", QCoreApplication::applicationVersion()},
    {"database", QJsonObject{
      {"total_stations", total},
      {"geocoded_stations", geocoded},
      {"pending_geocoding", total - geocoded}
    }}
  });
  return 0;
}


static int runImport(
  const PlannerSettings& settings,
  const QString& csv_path,
  bool skip_geocoding,
  bool geocode_only
)
{
  DatabaseManager database;
  GeocoderNominatim geocoder(
    settings.nominatim_url,
    settings.user_agent,
    settings.geocoding_timeout_ms,
    settings.geocoding_min_interval_ms
  );
  StationImporter importer(&database, &geocoder, settings.retry);

  QString why;
  int total = 0, geocoded = 0;

  if(geocode_only) {
    if(!database.stationCounts(total, geocoded)) {
      return fail("Failed to access database");
    }
    if(total == 0) {
      return fail("There are no stations in the database, import a CSV file first");
    }
  }
  else {
    if(csv_path.isEmpty()) {
      return fail("Option --csv is required, unless --geocode-only is given");
    }
    int imported = 0;
    if(!importer.importCsv(csv_path, imported, why)) {
      return fail(why);
    }
  }

  QJsonObject json;
  if(!skip_geocoding) {
    StationImporter::GeocodeReport report;
    if(!importer.geocodePending(report, why)) {
      return fail(why);
    }
    json["geocoding"] = QJsonObject{
      {"located", report.located},
      {"updated", report.updated},
      {"failed", QJsonArray::fromStringList(report.failed)}
    };
  }
  else {
    qDebug() << "Skipping geocoding";
  }

  if(!database.stationCounts(total, geocoded)) {
    return fail("Failed to access database");
  }
  json["total_stations"] = total;
  json["geocoded_stations"] = geocoded;
  json["pending_geocoding"] = total - geocoded;
  printJson(json);
  return 0;
}


int main(int argc, char *argv[]) {
  qRegisterMetaType<FuelProblem>();
  qRegisterMetaType<FuelRequest>();
  qRegisterMetaType<FuelStation>();
  qRegisterMetaType<FuelStop>();
  qRegisterMetaType<FuelPlan>();

  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("fuel_planner");
  QCoreApplication::setApplicationVersion("2.0");

  QCommandLineParser parser;
  parser.setApplicationDescription("Plan the cheapest fuel stops along a road-trip.");
  parser.addHelpOption();
  parser.addVersionOption();
  parser.addPositionalArgument("command", "One of 'plan', 'health' or 'import'.");

  QCommandLineOption config_option("config", "Read settings from <file>.", "file");
  QCommandLineOption start_option("start", "Departure address (plan).", "address");
  QCommandLineOption end_option("end", "Arrival address (plan).", "address");
  QCommandLineOption csv_option("csv", "Price feed to import (import).", "file");
  QCommandLineOption skip_geocoding_option("skip-geocoding", "Only load the CSV file (import).");
  QCommandLineOption geocode_only_option("geocode-only", "Only geocode pending stations (import).");
  parser.addOptions({config_option, start_option, end_option, csv_option, skip_geocoding_option, geocode_only_option});
  parser.process(app);

  const QStringList args = parser.positionalArguments();
  if(args.size() != 1) {
    return fail("Expected exactly one command: 'plan', 'health' or 'import'");
  }
  const QString command = args.first();

  PlannerSettings settings;
  QString why;
  if(!settings.load(parser.value(config_option), why)) {
    return fail(why);
  }

  why = DatabaseManager::loadDatabase(settings.database_path);
  if(!why.isEmpty()) {
    return fail(why);
  }

  if(command == "plan") {
    return runPlan(settings, parser.value(start_option), parser.value(end_option));
  }
  if(command == "health") {
    return runHealth();
  }
  if(command == "import") {
    if(parser.isSet(skip_geocoding_option) && parser.isSet(geocode_only_option)) {
      return fail("Options --skip-geocoding and --geocode-only are mutually exclusive");
    }
    return runImport(
      settings,
      parser.value(csv_option),
      parser.isSet(skip_geocoding_option),
      parser.isSet(geocode_only_option)
    );
  }

  return fail(QString("Unknown command '%1'").arg(command));
}
