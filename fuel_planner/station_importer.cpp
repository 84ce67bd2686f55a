#include "station_importer.hpp"

#include <QDebug>
#include <QFile>
#include <QHash>
#include <QMap>
#include <QTextStream>
#include <QThread>

#include <algorithm>


const QStringList StationImporter::CANADIAN_PROVINCES{
  "SK", "AB", "BC", "MB", "ON", "QC", "NB", "NS", "PE", "NL", "NT", "YT", "NU"
};

const QStringList StationImporter::REQUIRED_COLUMNS{
  "opis_truckstop_id", "truckstop_name", "address", "city", "state", "rack_id", "retail_price"
};


StationImporter::StationImporter(
  DatabaseManager* database,
  Geocoder* geocoder,
  const RetryPolicy& policy,
  QObject* parent
) : QObject(parent)
  , database_(database)
  , geocoder_(geocoder)
  , policy_(policy)
{

}


bool StationImporter::parseCsv(
  const QString& text,
  QList<QStringList>& rows,
  QString& why
)
{
  rows.clear();

  QStringList row;
  QString field;
  bool quoted = false;
  // Whether the current row has any content, to skip empty lines.
  bool row_started = false;

  auto end_row = [&]() {
    if(row_started) {
      row.append(field);
      rows.append(row);
    }
    row.clear();
    field.clear();
    row_started = false;
  };

  for(qsizetype i=0; i<text.size(); i++) {
    QChar c = text.at(i);

    if(quoted) {
      if(c != '"') {
        field.append(c);
      }
      else if(i+1 < text.size() && text.at(i+1) == '"') {
        // A doubled quote is a literal one.
        field.append('"');
        i++;
      }
      else {
        quoted = false;
      }
      continue;
    }

    if(c == '"') {
      quoted = true;
      row_started = true;
    }
    else if(c == ',') {
      row.append(field);
      field.clear();
      row_started = true;
    }
    else if(c == '\n') {
      end_row();
    }
    else if(c != '\r') {
      field.append(c);
      row_started = true;
    }
  }

  if(quoted) {
    why = QString("Unterminated quoted field in row %1").arg(rows.size() + 1);
    rows.clear();
    return false;
  }

  end_row();
  return true;
}


bool StationImporter::loadCsv(
  const QString& path,
  QList<FuelStation>& stations,
  QString& why
)
{
  stations.clear();

  QFile file(path);
  if(!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
    why = QString("Could not open '%1': %2").arg(path, file.errorString());
    return false;
  }

  QList<QStringList> rows;
  if(!parseCsv(QTextStream(&file).readAll(), rows, why)) {
    why = QString("Could not parse '%1': %2").arg(path, why);
    return false;
  }

  if(rows.isEmpty()) {
    why = QString("File '%1' is empty").arg(path);
    return false;
  }

  // Normalize the header, and find the position of each required column.
  QStringList header;
  for(const auto& name : rows.first()) {
    header.append(name.trimmed().toLower().replace(' ', '_'));
  }

  QMap<QString, int> columns;
  for(const auto& name : REQUIRED_COLUMNS) {
    int idx = header.indexOf(name);
    if(idx < 0) {
      why = QString("File '%1' does not have a '%2' column").arg(path, name);
      return false;
    }
    columns[name] = idx;
  }

  // Stations are identified by their name and address. Remember where each
  // one was stored, to merge repeated rows.
  QHash<QStringList, qsizetype> index;
  int skipped = 0;

  for(qsizetype r=1; r<rows.size(); r++) {
    const QStringList& row = rows.at(r);
    if(row.size() < header.size()) {
      qWarning() << "Skipping row" << r << "of" << path << ": expected" << header.size() << "fields, found" << row.size();
      skipped++;
      continue;
    }

    auto value = [&](const QString& column) { return row.at(columns[column]).trimmed(); };

    bool id_ok = false, rack_ok = false, price_ok = false;
    FuelStation station;
    station.opis_id = value("opis_truckstop_id").toInt(&id_ok);
    station.name = value("truckstop_name");
    station.address = value("address");
    station.city = value("city");
    station.state = value("state");
    station.rack_id = value("rack_id").toInt(&rack_ok);
    station.price = value("retail_price").toDouble(&price_ok);

    if(!id_ok || !rack_ok || !price_ok || station.name.isEmpty()) {
      qWarning() << "Skipping row" << r << "of" << path << ": invalid values";
      skipped++;
      continue;
    }

    QStringList key{station.name, station.address, station.city, station.state};
    auto it = index.constFind(key);
    if(it == index.constEnd()) {
      index.insert(key, stations.size());
      stations.append(station);
    }
    else {
      FuelStation& existing = stations[it.value()];
      existing.price = std::min(existing.price, station.price);
    }
  }

  qDebug() << "Loaded" << rows.size()-1 << "rows from" << path << ":" << stations.size() << "unique stations," << skipped << "rows skipped";
  return true;
}


bool StationImporter::importCsv(
  const QString& path,
  int& imported,
  QString& why
)
{
  QList<FuelStation> stations;
  if(!loadCsv(path, stations, why)) {
    return false;
  }

  if(stations.isEmpty()) {
    why = QString("No valid station found in '%1'").arg(path);
    return false;
  }

  if(!database_->replaceStations(stations)) {
    why = "Failed to save stations in the database";
    return false;
  }

  int geocoded = 0;
  if(!database_->stationCounts(imported, geocoded)) {
    why = "Failed to access database";
    return false;
  }

  qDebug() << "Saved" << imported << "stations";
  return true;
}


Geocoder::Status StationImporter::geocodeWithRetry(
  const QString& query,
  QGeoCoordinate& coordinate,
  QString& why
)
{
  Geocoder::Status status = Geocoder::Status::Failed;
  for(int attempt=0; attempt<policy_.max_attempts; attempt++) {
    status = geocoder_->geocode(query, coordinate, why);
    if(status != Geocoder::Status::Transient) {
      return status;
    }

    if(attempt < policy_.max_attempts-1) {
      int delay = policy_.delay(attempt);
      qWarning() << "Transient error on" << query << ":" << why << "- retrying in" << delay << "ms (attempt" << attempt+1 << "of" << policy_.max_attempts << ")";
      QThread::msleep(delay);
    }
  }

  qWarning() << "Failed after" << policy_.max_attempts << "attempts:" << query;
  return status;
}


bool StationImporter::geocodePending(
  GeocodeReport& report,
  QString& why
)
{
  report = GeocodeReport();

  QList<DatabaseManager::Location> locations;
  if(!database_->pendingLocations(locations)) {
    why = "Failed to access database";
    return false;
  }

  if(locations.isEmpty()) {
    qDebug() << "All stations are already geocoded";
    return true;
  }

  qDebug() << "Found" << locations.size() << "locations to geocode";

  QMap<DatabaseManager::Location, QGeoCoordinate> coordinates;
  for(qsizetype i=0; i<locations.size(); i++) {
    const auto& [city, state] = locations.at(i);

    if((i+1) % 10 == 0 || i+1 == locations.size()) {
      qDebug() << "Progress:" << i+1 << "/" << locations.size();
    }

    if(coordinates.contains(locations.at(i))) {
      continue;
    }

    if(CANADIAN_PROVINCES.contains(state.toUpper())) {
      qDebug() << "Skipping Canadian location:" << city << state;
      report.failed.append(QString("%1, %2 (Canada)").arg(city, state));
      continue;
    }

    QString query = QString("%1, %2, USA").arg(city, state);
    QGeoCoordinate coordinate;
    QString error;
    Geocoder::Status status = geocodeWithRetry(query, coordinate, error);

    if(status == Geocoder::Status::Found) {
      coordinates.insert(locations.at(i), coordinate);
    }
    else {
      qWarning() << "Could not geocode" << query << ":" << error;
      report.failed.append(query);
    }
  }

  if(!database_->resolveLocations(coordinates, report.updated)) {
    why = "Failed to save coordinates in the database";
    return false;
  }

  report.located = coordinates.size();
  qDebug() << "Geocoded" << report.located << "locations, updated" << report.updated << "stations";
  return true;
}
