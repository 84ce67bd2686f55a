#ifndef FUEL_PLAN_HPP
#define FUEL_PLAN_HPP

#include "fuel_stop.hpp"
#include "route_result.hpp"

#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>


/// Auxiliary structure containing the result of a planning request.
struct FuelPlan {
  static const QString METHOD_DYNAMIC_PROGRAMMING; ///< Label of plans found by the optimizer.
  static const QString METHOD_GREEDY_FALLBACK; ///< Label of plans found by the greedy fallback.
  static const QString METHOD_NO_STATIONS; ///< Label of plans with no candidate station.

  RouteResult route; ///< The route the plan refers to.
  QString start_address; ///< Departure, as requested.
  QString end_address; ///< Arrival, as requested.
  QList<FuelStop> stops; ///< Stops along the route, by increasing chainage.
  double total_cost = 0.0; ///< Sum of the costs of all stops.
  double total_fuel = 0.0; ///< Fuel consumed over the whole route, in gallons.
  QString method; ///< Which algorithm produced the stops.
  int stations_considered = 0; ///< Number of stations found along the route.

  // Default constructor needed by Qt's metatype system.
  FuelPlan() = default;

  /// Convert the plan into the JSON document returned to clients.
  /** Values are rounded here, and only here: prices to 3 decimals, and
    * everything else expressed in miles, gallons or currency to 2 decimals.
    */
  QJsonObject toJson() const;
};

Q_DECLARE_METATYPE(FuelPlan);

#endif // FUEL_PLAN_HPP
