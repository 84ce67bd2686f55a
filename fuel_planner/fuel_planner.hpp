#ifndef FUEL_PLANNER_HPP
#define FUEL_PLANNER_HPP

#include "database_manager.hpp"
#include "fuel_plan.hpp"
#include "fuel_problem.hpp"
#include "fuel_request.hpp"
#include "router_service.hpp"

#include <QObject>
#include <QString>


/// Class that can find the cheapest fuel stops along a road-trip.
class FuelPlanner : public QObject {
  Q_OBJECT
public:
  /// Create a new planner.
  /** @param router Object to be used for geocoding and routing.
    * @param database Object to be used for accessing the catalog.
    * @param parent Parent object, needed for Qt's memory management.
    */
  explicit FuelPlanner(
    RouterService* router,
    DatabaseManager* database,
    QObject *parent = nullptr
  );

  /// Vehicle and planner parameters used by plan().
  inline const FuelProblem& problem() const { return problem_; }

  /// Change the vehicle and planner parameters.
  /** @return false, leaving the current parameters untouched, if the given
    *   ones are not valid.
    */
  bool setProblem(const FuelProblem& problem, QString& why);

  /// Plan the fuel stops for a trip.
  /** Both addresses are located and the route between them is calculated.
    * Stations close to the route are then fetched from the catalog, and the
    * cheapest sequence of stops is found. If the range of the vehicle is too
    * short to reach the arrival, a greedy heuristic is used instead, and its
    * plan might not be feasible.
    * @param request Departure and arrival addresses.
    * @param[out] plan The result, on success.
    * @param[out] why Explanation of the failure, if any.
    * @return false if the request is invalid, if an address cannot be
    *   located, if there is no route, or if the catalog cannot be accessed.
    *   Not finding any station is not an error.
    */
  bool plan(const FuelRequest& request, FuelPlan& plan, QString& why);

private:
  RouterService* router_ = nullptr; ///< Used to locate addresses and get driving paths.
  DatabaseManager* database_ = nullptr; ///< Used to access the catalog.
  FuelProblem problem_; ///< Vehicle and planner parameters.

public slots:
  /// Plan the fuel stops for a trip, emitting solved() or failed().
  void solve(FuelRequest request);

signals:
  /// Signal emitted when a request has been completed.
  void solved(FuelPlan plan);

  /// Signal emitted when a request has failed.
  void failed(const QString& why);
};

#endif // FUEL_PLANNER_HPP
