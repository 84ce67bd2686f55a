#ifndef CORRIDOR_FILTER_HPP
#define CORRIDOR_FILTER_HPP

#include "fuel_station.hpp"
#include "on_route_station.hpp"
#include "route_geometry.hpp"

#include <QList>


/// Selects the stations that lie along a route.
class CorridorFilter {
public:
  /// Keep the stations that are within a given distance from the route.
  /** Each station is projected on the route to obtain its chainage and its
    * lateral offset. Stations whose offset exceeds the half-width of the
    * corridor are discarded, as well as stations without a location.
    * Chainages are clamped to [0, route_distance], since the length of the
    * polyline can differ slightly from the distance reported by the router.
    * @param geometry The route.
    * @param stations Candidate stations, in any order.
    * @param half_width Maximum lateral offset, in miles.
    * @param route_distance Length of the route, in miles.
    * @return The selected stations sorted by increasing chainage. Ties are
    *   sorted by increasing price, and then by ID.
    */
  static QList<OnRouteStation> filter(
    const RouteGeometry& geometry,
    const QList<FuelStation>& stations,
    double half_width,
    double route_distance
  );

  /// Reduce the number of stations along a route.
  /** The route is divided in buckets of the given length, and only the
    * cheapest station of each bucket is kept (ties go to the station that
    * comes first).
    * @param stations Stations sorted by chainage, as returned by filter().
    * @param segment_length Length of each bucket, in miles.
    * @return A subset of the input, still sorted by chainage.
    */
  static QList<OnRouteStation> thin(
    const QList<OnRouteStation>& stations,
    double segment_length
  );
};

#endif // CORRIDOR_FILTER_HPP
