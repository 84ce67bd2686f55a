#include "fuel_planner.hpp"

#include "corridor_filter.hpp"
#include "math_utilities.hpp"
#include "plan_assembler.hpp"
#include "refuel_optimizer.hpp"
#include "route_geometry.hpp"

#include <QDebug>

#include <algorithm>
#include <cmath>


FuelPlanner::FuelPlanner(
  RouterService* router,
  DatabaseManager* database,
  QObject *parent
) : QObject{parent}
  , router_(router)
  , database_(database)
{

}


bool FuelPlanner::setProblem(
  const FuelProblem& problem,
  QString& why
)
{
  if(!problem.isValid(why)) {
    return false;
  }
  problem_ = problem;
  return true;
}


bool FuelPlanner::plan(
  const FuelRequest& request,
  FuelPlan& plan,
  QString& why
)
{
  FuelRequest trip(request);
  if(!trip.normalize(why)) {
    return false;
  }

  QString err;
  if(!problem_.isValid(err)) {
    why = QString("Cannot solve invalid problem: %1").arg(err);
    return false;
  }

  qDebug() << "Received request to plan fuel stops from" << trip.start << "to" << trip.end;

  // Locate departure and arrival.
  QGeoCoordinate start, end;
  if(!router_->geocode(trip.start, start, err)) {
    qDebug() << err;
    why = QString("Could not geocode start location: %1").arg(trip.start);
    return false;
  }
  if(!router_->geocode(trip.end, end, err)) {
    qDebug() << err;
    why = QString("Could not geocode end location: %1").arg(trip.end);
    return false;
  }

  // Calculate the path from departure to arrival.
  RouteResult route;
  if(!router_->route(start, end, route, err)) {
    qDebug() << err;
    why = "Could not calculate route";
    return false;
  }

  RouteGeometry geometry(route.latitudes, route.longitudes);
  if(!geometry.isValid()) {
    why = "Could not calculate route";
    return false;
  }

  // Select geocoded stations inside the bounding box of the route, enlarged
  // by twice the width of the corridor.
  auto [min_lat_it, max_lat_it] = std::minmax_element(route.latitudes.cbegin(), route.latitudes.cend());
  auto [min_lon_it, max_lon_it] = std::minmax_element(route.longitudes.cbegin(), route.longitudes.cend());
  double latitude_margin = math_utilities::latitude_variation(2*problem_.corridor_half_width_miles);
  double longitude_margin = math_utilities::longitude_variation(
    2*problem_.corridor_half_width_miles,
    std::max(std::abs(*min_lat_it), std::abs(*max_lat_it))
  );

  DatabaseManager::Filter db_filter;
  db_filter.setGPSRange(
    *min_lat_it - latitude_margin,
    *max_lat_it + latitude_margin,
    *min_lon_it - longitude_margin,
    *max_lon_it + longitude_margin
  );
  db_filter.setGeocoded(true);

  QList<FuelStation> stations;
  if(!database_->findStations(db_filter, stations)) {
    why = "Failed to access database";
    return false;
  }

  qDebug() << "Selected" << stations.size() << "stations 'near' the route";

  QList<OnRouteStation> on_route = CorridorFilter::filter(
    geometry,
    stations,
    problem_.corridor_half_width_miles,
    route.distance_miles
  );

  if(on_route.isEmpty()) {
    qDebug() << "Could not find any station along the route";
    plan = PlanAssembler::empty(route, trip, problem_);
    return true;
  }

  QList<OnRouteStation> candidates = on_route;
  bool thinned = false;
  if(candidates.size() > problem_.max_candidates) {
    candidates = CorridorFilter::thin(candidates, problem_.thinning_segment_miles);
    thinned = candidates.size() < on_route.size();
  }

  QList<FuelStop> stops;
  double total_cost = 0.0;
  QString method = FuelPlan::METHOD_DYNAMIC_PROGRAMMING;
  bool feasible = RefuelOptimizer::dynamicProgramming(route.distance_miles, candidates, problem_, stops, total_cost);

  // Dropping stations can leave gaps longer than the range.
  if(!feasible && thinned) {
    qDebug() << "No feasible plan among" << candidates.size() << "thinned candidates, retrying with all" << on_route.size() << "stations";
    candidates = on_route;
    feasible = RefuelOptimizer::dynamicProgramming(route.distance_miles, candidates, problem_, stops, total_cost);
  }

  if(!feasible) {
    double longest_leg = 0.0;
    stops = RefuelOptimizer::greedyFallback(route.distance_miles, candidates, problem_, longest_leg);
    method = FuelPlan::METHOD_GREEDY_FALLBACK;
    if(longest_leg > problem_.range_miles) {
      qWarning() << "Greedy plan requires driving" << longest_leg << "miles without refueling, but the range is" << problem_.range_miles << "miles";
    }
  }

  plan = PlanAssembler::assemble(route, trip, stops, method, on_route.size(), problem_);
  qDebug() << "Planned" << plan.stops.size() << "stops using" << method << "- total cost:" << plan.total_cost;
  return true;
}


void FuelPlanner::solve(
  FuelRequest request
)
{
  FuelPlan result;
  QString why;
  if(!plan(request, result, why)) {
    emit failed(why);
    return;
  }
  emit solved(result);
}
