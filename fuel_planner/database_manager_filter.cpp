#include "database_manager.hpp"

#include <QMap>
#include <QStringList>
#include <QVariant>


QSqlQuery DatabaseManager::Filter::compile() const
{
  // Stations matching every condition below.
  QString select_query_string = "SELECT * FROM Stations";

  // Named placeholders and their values.
  QMap<QString, QVariant> query_args;

  // Joined with AND into the WHERE clause.
  QStringList conditions;

  // Restrict a column to [min, max], or to a single value when both bounds
  // coincide. Unset bounds add no condition.
  auto add_range = [&](const QString& column, const auto& min, const auto& max)
  {
    if(min == nullptr) {
      return;
    }

    if(*min == *max) {
      conditions.append(QString("%1 = :%1").arg(column));
      query_args[":" + column] = *min;
    }
    else {
      conditions.append(QString("%1 BETWEEN :%1_min AND :%1_max").arg(column));
      query_args[":" + column + "_min"] = *min;
      query_args[":" + column + "_max"] = *max;
    }
  };

  add_range("latitude", min_latitude, max_latitude);
  add_range("longitude", min_longitude, max_longitude);
  add_range("retail_price", min_price, max_price);

  if(geocoded != nullptr) {
    conditions.append("geocoded = :geocoded");
    query_args[":geocoded"] = *geocoded ? 1 : 0;
  }

  if(!conditions.isEmpty()) {
    select_query_string += " WHERE " + conditions.join(" AND ");
  }

  // QSqlQuery::size() is not available with SQLite, so every record also
  // carries the number of matches as 'query_size'.
  QSqlQuery query;
  query.prepare(
    QString(
      "WITH filtered_stations AS (" + select_query_string + ")"
      " "
      "SELECT *, (SELECT COUNT(*) FROM filtered_stations) AS query_size FROM filtered_stations;"
    )
  );

  for(const auto& [key, val] : query_args.asKeyValueRange()) {
    query.bindValue(key, val);
  }

  return query;
}


bool DatabaseManager::Filter::setGPSRange(
  double min_latitude,
  double max_latitude,
  double min_longitude,
  double max_longitude
  )
{
  if(min_latitude > max_latitude || min_longitude > max_longitude)
    return false;

  this->min_latitude = std::make_unique<double>(min_latitude);
  this->max_latitude = std::make_unique<double>(max_latitude);
  this->min_longitude = std::make_unique<double>(min_longitude);
  this->max_longitude = std::make_unique<double>(max_longitude);
  return true;
}


bool DatabaseManager::Filter::setPriceRange(
  double min_price,
  double max_price
  )
{
  if(min_price > max_price || min_price < 0)
    return false;

  this->min_price = std::make_unique<double>(min_price);
  this->max_price = std::make_unique<double>(max_price);
  return true;
}


void DatabaseManager::Filter::setGeocoded(
  bool geocoded
  )
{
  this->geocoded = std::make_unique<bool>(geocoded);
}
