#ifndef PLAN_ASSEMBLER_HPP
#define PLAN_ASSEMBLER_HPP

#include "fuel_plan.hpp"
#include "fuel_problem.hpp"
#include "fuel_request.hpp"
#include "fuel_stop.hpp"
#include "route_result.hpp"

#include <QList>
#include <QString>


/// Builds the final result of a planning request.
class PlanAssembler {
public:
  /// Combine the chosen stops with the information about the route.
  /** The total cost is the sum of the costs of the stops. The total fuel is
    * the fuel burnt over the route (distance over efficiency), which is in
    * general different from the fuel purchased, since every stop fills the
    * whole tank.
    * @param route The route the stops refer to.
    * @param request Departure and arrival addresses.
    * @param stops Chosen stops, by increasing chainage.
    * @param method Label of the algorithm that chose the stops.
    * @param stations_considered Number of stations found along the route.
    * @param problem Vehicle parameters.
    */
  static FuelPlan assemble(
    const RouteResult& route,
    const FuelRequest& request,
    const QList<FuelStop>& stops,
    const QString& method,
    int stations_considered,
    const FuelProblem& problem
  );

  /// Plan for a route without any station along it.
  static FuelPlan empty(
    const RouteResult& route,
    const FuelRequest& request,
    const FuelProblem& problem
  );
};

#endif // PLAN_ASSEMBLER_HPP
