#include "refuel_optimizer.hpp"

#include <Eigen/Dense>

#include <QDebug>

#include <algorithm>
#include <limits>


bool RefuelOptimizer::dynamicProgramming(
  double route_distance,
  const QList<OnRouteStation>& stations,
  const FuelProblem& problem,
  QList<FuelStop>& stops,
  double& total_cost
)
{
  // Nodes: 0 is the departure, 1..n are the stations and n+1 is the arrival.
  const Eigen::Index n = stations.size();
  const Eigen::Index START = 0;
  const Eigen::Index END = n + 1;
  const double gallons = problem.tankGallons();

  Eigen::VectorXd position(n+2);
  Eigen::VectorXd refuel_cost(n+2);
  position(START) = 0.0;
  refuel_cost(START) = 0.0;
  for(Eigen::Index i=1; i<=n; i++) {
    position(i) = stations[i-1].chainage;
    refuel_cost(i) = gallons * stations[i-1].station.price;
  }
  position(END) = route_distance;
  refuel_cost(END) = 0.0;

  // Minimum cost to reach each node, and the node we come from.
  constexpr double INF = std::numeric_limits<double>::infinity();
  Eigen::VectorXd cost = Eigen::VectorXd::Constant(n+2, INF);
  Eigen::VectorXi parent = Eigen::VectorXi::Constant(n+2, -1);
  cost(START) = 0.0;

  // Positions are sorted, so the first node within range of node i can only
  // move forward as i grows.
  Eigen::Index first = 0;
  for(Eigen::Index i=1; i<n+2; i++) {
    while(position(i) - position(first) > problem.range_miles) {
      first++;
    }

    for(Eigen::Index j=first; j<i; j++) {
      double candidate = cost(j) + refuel_cost(i);
      if(candidate < cost(i)) {
        cost(i) = candidate;
        parent(i) = static_cast<int>(j);
      }
    }
  }

  if(cost(END) == INF) {
    qDebug() << "The arrival cannot be reached with a range of" << problem.range_miles << "miles";
    return false;
  }

  // Backtrack from the arrival to the departure.
  QList<int> path;
  for(int node = parent(END); node != START; node = parent(node)) {
    path.append(node);
  }
  std::reverse(path.begin(), path.end());

  stops.clear();
  stops.reserve(path.size());
  for(int node : path) {
    stops.append(FuelStop(stations[node-1], gallons));
  }
  total_cost = cost(END);
  return true;
}


QList<FuelStop> RefuelOptimizer::greedyFallback(
  double route_distance,
  const QList<OnRouteStation>& stations,
  const FuelProblem& problem,
  double& longest_leg
)
{
  QList<FuelStop> stops;
  double previous = 0.0;
  longest_leg = 0.0;

  for(const auto& s : stations) {
    double distance = s.chainage - previous;
    if(distance >= problem.range_miles - problem.greedy_buffer_miles) {
      stops.append(FuelStop(s, problem.tankGallons()));
      longest_leg = std::max(longest_leg, distance);
      previous = s.chainage;
    }
  }

  longest_leg = std::max(longest_leg, route_distance - previous);
  return stops;
}
