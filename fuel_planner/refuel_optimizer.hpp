#ifndef REFUEL_OPTIMIZER_HPP
#define REFUEL_OPTIMIZER_HPP

#include "fuel_problem.hpp"
#include "fuel_stop.hpp"
#include "on_route_station.hpp"

#include <QList>


/// Algorithms that choose where to refuel along a route.
/** Every stop fills the tank completely, so the amount purchased is always
  * problem.tankGallons(), regardless of the fuel left when arriving.
  */
class RefuelOptimizer {
public:
  /// Find the cheapest sequence of stops that respects the vehicle range.
  /** The departure, the stations and the arrival form a directed acyclic
    * graph: there is an edge from a node to any later node that is at most
    * range_miles away. Reaching a station costs a full tank at its price,
    * reaching the arrival costs nothing. Since nodes are sorted by chainage,
    * a single relaxation pass gives the cheapest path.
    * @param route_distance Length of the route, in miles.
    * @param stations Stations along the route, sorted by chainage.
    * @param problem Vehicle parameters.
    * @param[out] stops If the problem is feasible, the stops by increasing
    *   chainage.
    * @param[out] total_cost If the problem is feasible, the sum of the costs
    *   of the stops.
    * @return false if the arrival cannot be reached, i.e., if somewhere
    *   along the route there is a gap between stations larger than the
    *   range. In this case, the output parameters are left untouched.
    */
  static bool dynamicProgramming(
    double route_distance,
    const QList<OnRouteStation>& stations,
    const FuelProblem& problem,
    QList<FuelStop>& stops,
    double& total_cost
  );

  /// Single-pass heuristic, used when dynamicProgramming() fails.
  /** Stations are scanned by increasing chainage, and we stop at a station
    * whenever the distance from the previous stop (or from the departure) is
    * at least range_miles - greedy_buffer_miles. The result is not
    * guaranteed to respect the range.
    * @param route_distance Length of the route, in miles.
    * @param stations Stations along the route, sorted by chainage.
    * @param problem Vehicle parameters.
    * @param[out] longest_leg Longest distance driven without refueling,
    *   including the last leg to the arrival.
    * @return The stops, by increasing chainage.
    */
  static QList<FuelStop> greedyFallback(
    double route_distance,
    const QList<OnRouteStation>& stations,
    const FuelProblem& problem,
    double& longest_leg
  );
};

#endif // REFUEL_OPTIMIZER_HPP
