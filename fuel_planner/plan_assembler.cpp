#include "plan_assembler.hpp"


FuelPlan PlanAssembler::assemble(
  const RouteResult& route,
  const FuelRequest& request,
  const QList<FuelStop>& stops,
  const QString& method,
  int stations_considered,
  const FuelProblem& problem
)
{
  FuelPlan plan;
  plan.route = route;
  plan.start_address = request.start;
  plan.end_address = request.end;
  plan.stops = stops;
  plan.method = method;
  plan.stations_considered = stations_considered;

  plan.total_cost = 0.0;
  for(const auto& stop : stops) {
    plan.total_cost += stop.cost;
  }
  plan.total_fuel = route.distance_miles / problem.efficiency_mpg;
  return plan;
}


FuelPlan PlanAssembler::empty(
  const RouteResult& route,
  const FuelRequest& request,
  const FuelProblem& problem
)
{
  return assemble(route, request, {}, FuelPlan::METHOD_NO_STATIONS, 0, problem);
}
