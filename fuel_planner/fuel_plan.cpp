#include "fuel_plan.hpp"

#include "math_utilities.hpp"

#include <QJsonArray>


const QString FuelPlan::METHOD_DYNAMIC_PROGRAMMING = "dynamic_programming";
const QString FuelPlan::METHOD_GREEDY_FALLBACK = "greedy_fallback";
const QString FuelPlan::METHOD_NO_STATIONS = "no_stations";


// Helper function: describe one of the endpoints of the route.
static QJsonObject locationToJson(
  const QString& address,
  const QGeoCoordinate& coordinate
)
{
  return QJsonObject{
    {"address", address},
    {"latitude", coordinate.latitude()},
    {"longitude", coordinate.longitude()}
  };
}


QJsonObject FuelPlan::toJson() const
{
  using math_utilities::roundTo;

  QJsonArray stops_json;
  for(const auto& stop : stops) {
    const FuelStation& station = stop.station.station;
    stops_json.append(QJsonObject{
      {"name", station.name},
      {"address", station.address},
      {"city", station.city},
      {"state", station.state},
      {"price_per_gallon", roundTo(station.price, 3)},
      {"gallons_needed", roundTo(stop.gallons, 2)},
      {"cost", roundTo(stop.cost, 2)},
      {"miles_from_start", roundTo(stop.chainage(), 2)},
      {"latitude", station.location.latitude()},
      {"longitude", station.location.longitude()}
    });
  }

  QJsonObject route_json{
    {"distance_miles", route.distance_miles},
    {"duration_hours", route.duration_hours},
    {"geometry", route.geometry}
  };

  return QJsonObject{
    {"route", route_json},
    {"fuel_stops", stops_json},
    {"total_fuel_cost", roundTo(total_cost, 2)},
    {"total_gallons", roundTo(total_fuel, 2)},
    {"start_location", locationToJson(start_address, route.start)},
    {"end_location", locationToJson(end_address, route.end)},
    {"optimization_method", method},
    {"stations_considered", stations_considered}
  };
}
