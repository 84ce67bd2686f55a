#ifndef ON_ROUTE_STATION_HPP
#define ON_ROUTE_STATION_HPP

#include "fuel_station.hpp"


/// A station that lies inside the corridor around a route.
struct OnRouteStation {
  FuelStation station; ///< The station itself.
  double chainage = 0.0; ///< Miles from the route start to the projection of the station.
  double lateral_offset = 0.0; ///< Miles between the station and the route.

  OnRouteStation() = default;

  OnRouteStation(const FuelStation& station, double chainage, double lateral_offset)
    : station(station), chainage(chainage), lateral_offset(lateral_offset) {}
};

#endif // ON_ROUTE_STATION_HPP
