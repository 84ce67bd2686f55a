#ifndef FUEL_STOP_HPP
#define FUEL_STOP_HPP

#include "on_route_station.hpp"

#include <QMetaType>


/// Auxiliary structure containing information about a stop.
struct FuelStop {
  OnRouteStation station; ///< Where we are stopping.
  double gallons = 0.0; ///< Amount of fuel purchased at this stop, in gallons.
  double cost = 0.0; ///< Amount paid at this stop.

  /// Default constructor, needed by Qt's metatype system.
  FuelStop() = default;

  /// Create a new fueling stop.
  /** The cost is calculated from the amount of fuel and the price at the
    * station.
    */
  FuelStop(const OnRouteStation& station, double gallons)
    : station(station), gallons(gallons), cost(gallons * station.station.price) {}

  /// Distance from the start of the route, in miles.
  inline double chainage() const { return station.chainage; }
};

Q_DECLARE_METATYPE(FuelStop);

#endif // FUEL_STOP_HPP
