#ifndef FUEL_PROBLEM_HPP
#define FUEL_PROBLEM_HPP

#include <QMetaType>
#include <QString>

/// Vehicle model and tuning parameters of the planner.
struct FuelProblem {
  double range_miles = 500.0; ///< Miles that can be driven on a full tank.
  double efficiency_mpg = 10.0; ///< Miles per gallon.
  double corridor_half_width_miles = 15.0; ///< Maximum distance of a station from the route.
  double greedy_buffer_miles = 50.0; ///< Safety buffer used by the greedy fallback.
  int max_candidates = 2000; ///< Above this many on-route stations, candidates are thinned.
  double thinning_segment_miles = 10.0; ///< Bucket length used when thinning candidates.

  /// Fuel purchased at every stop, in gallons.
  inline double tankGallons() const { return range_miles / efficiency_mpg; }

  bool isValid(QString& why) const {
    if(range_miles <= 0.0) {
      why = "Parameter 'range_miles' must be positive";
      return false;
    }

    if(efficiency_mpg <= 0.0) {
      why = "Parameter 'efficiency_mpg' must be positive";
      return false;
    }

    if(corridor_half_width_miles <= 0.0) {
      why = "Parameter 'corridor_half_width_miles' must be positive";
      return false;
    }

    if(greedy_buffer_miles < 0.0) {
      why = "Parameter 'greedy_buffer_miles' must be positive or zero";
      return false;
    }

    if(max_candidates <= 0) {
      why = "Parameter 'max_candidates' must be positive";
      return false;
    }

    if(thinning_segment_miles <= 0.0) {
      why = "Parameter 'thinning_segment_miles' must be positive";
      return false;
    }

    return true;
  }

  inline bool isValid() const {
    QString s;
    return isValid(s);
  }
};

Q_DECLARE_METATYPE(FuelProblem);

#endif // FUEL_PROBLEM_HPP
