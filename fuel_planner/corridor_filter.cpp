#include "corridor_filter.hpp"

#include <QDebug>

#include <algorithm>
#include <cmath>


QList<OnRouteStation> CorridorFilter::filter(
  const RouteGeometry& geometry,
  const QList<FuelStation>& stations,
  double half_width,
  double route_distance
)
{
  QList<OnRouteStation> on_route;
  if(!geometry.isValid()) {
    qDebug() << "Cannot filter stations along an invalid route";
    return on_route;
  }

  for(const auto& station : stations) {
    if(!station.geocoded || !station.location.isValid()) {
      continue;
    }

    double chainage, offset;
    geometry.project(
      station.location.latitude(),
      station.location.longitude(),
      chainage,
      offset
    );

    if(offset <= half_width) {
      chainage = std::clamp(chainage, 0.0, std::max(route_distance, 0.0));
      on_route.append(OnRouteStation(station, chainage, offset));
    }
  }

  // Sort stations along path.
  std::stable_sort(
    on_route.begin(),
    on_route.end(),
    [](const OnRouteStation& a, const OnRouteStation& b) {
      if(a.chainage != b.chainage)
        return a.chainage < b.chainage;
      if(a.station.price != b.station.price)
        return a.station.price < b.station.price;
      return a.station.id < b.station.id;
    }
  );

  qDebug() << "Found" << on_route.size() << "out of" << stations.size() << "stations within" << half_width << "miles from the route";
  return on_route;
}


QList<OnRouteStation> CorridorFilter::thin(
  const QList<OnRouteStation>& stations,
  double segment_length
)
{
  QList<OnRouteStation> cheapest;
  if(segment_length <= 0.0) {
    return stations;
  }

  // Stations are sorted by chainage, hence each bucket is a contiguous range
  // of the input.
  long long current_bucket = -1;
  for(const auto& s : stations) {
    long long bucket = static_cast<long long>(std::floor(s.chainage / segment_length));
    if(cheapest.isEmpty() || bucket != current_bucket) {
      cheapest.append(s);
      current_bucket = bucket;
    }
    else if(s.station.price < cheapest.back().station.price) {
      cheapest.back() = s;
    }
  }

  qDebug() << "Reduced options from" << stations.size() << "to" << cheapest.size() << "stations";
  return cheapest;
}
