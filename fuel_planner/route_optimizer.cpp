#include "route_optimizer.hpp"

#include "math_utilities.hpp"

#include <Eigen/Dense>

#include <QDebug>
#include <QElapsedTimer>


// Helper function: haversine distance between two coordinates.
static double distance(const QGeoCoordinate& a, const QGeoCoordinate& b) {
  return math_utilities::haversineDistance(a.latitude(), a.longitude(), b.latitude(), b.longitude());
}


RouteOptimizer::RouteOptimizer(
  const OptimizerConfig& config
) : config_(config)
{

}


QList<QGeoCoordinate> RouteOptimizer::sampleRoute(
  const QList<QGeoCoordinate>& points,
  double interval
)
{
  if(points.size() < 2) {
    return points;
  }

  // Calculate the length of each piece of the polyline at once.
  const Eigen::Index n = points.size();
  Eigen::ArrayXd latitudes(n), longitudes(n);
  for(Eigen::Index i=0; i<n; i++) {
    latitudes(i) = points[i].latitude();
    longitudes(i) = points[i].longitude();
  }
  Eigen::ArrayXd legs = math_utilities::haversineDistance(
    latitudes.head(n-1),
    longitudes.head(n-1),
    latitudes.tail(n-1),
    longitudes.tail(n-1)
  );

  QList<QGeoCoordinate> sampled;
  sampled.append(points.front());

  double cumulative = 0.0;
  bool last_emitted = false;
  for(Eigen::Index i=1; i<n; i++) {
    cumulative += legs(i-1);
    last_emitted = false;
    if(cumulative >= interval) {
      sampled.append(points[i]);
      cumulative = 0.0;
      last_emitted = true;
    }
  }

  // Always include the destination.
  if(!last_emitted) {
    sampled.append(points.back());
  }

  return sampled;
}


bool RouteOptimizer::optimize(
  const QList<QGeoCoordinate>& route_points,
  double total_distance,
  const SpatialIndex& index,
  OptimizationResult& result,
  QString& why
) const
{
  if(!isValid(why)) {
    qWarning() << "Cannot optimize with an invalid configuration:" << why;
    return false;
  }

  QElapsedTimer timer;
  timer.start();

  QList<FuelStop> stops;
  double remaining_range = config_.max_range;
  double distance_traveled = 0.0;
  bool serviceable = true;
  FuelShortfall shortfall;

  // Sample route at regular intervals.
  QList<QGeoCoordinate> waypoints = sampleRoute(route_points, config_.sample_interval);
  qDebug() << "Route has" << route_points.size() << "points, sampled to" << waypoints.size() << "waypoints";

  // Every fill-up brings the tank to the same level.
  const double refill_range = config_.refill_fraction * config_.max_range;
  const double refill_gallons = refill_range / config_.mpg;

  QGeoCoordinate position = waypoints.isEmpty() ? QGeoCoordinate() : waypoints.front();

  for(int i=1; i<waypoints.size(); i++) {
    const QGeoCoordinate& waypoint = waypoints[i];
    double segment_distance = distance(position, waypoint);

    // Check if we need fuel to reach this waypoint.
    if(segment_distance > remaining_range - config_.safety_buffer) {
      qDebug() << "Need fuel before waypoint" << i << ":" << segment_distance << "miles ahead," << remaining_range << "remaining";

      StationMatch best;
      double searched_radius = 0.0;
      if(!findBestStation(position, remaining_range, index, best, searched_radius)) {
        qWarning() << "No station within" << searched_radius << "miles of waypoint" << i-1
                   << "(mile" << distance_traveled << "), the route cannot be serviced";
        serviceable = false;
        shortfall.waypoint = i;
        shortfall.location = position;
        shortfall.miles_from_start = distance_traveled;
        shortfall.remaining_range = remaining_range;
        shortfall.search_radius = searched_radius;
        shortfall.segment_distance = segment_distance;
        break;
      }

      stops.append(FuelStop(
        best.station.id,
        best.station.name,
        best.station.location,
        best.station.price,
        refill_gallons,
        distance_traveled
      ));
      qDebug() << "Stop" << stops.size() << ":" << best.station.name << "at mile" << distance_traveled << "- $" << stops.back().cost;

      remaining_range = refill_range;

      // Even a refill might not be enough to reach the waypoint.
      if(segment_distance > remaining_range - config_.safety_buffer) {
        qWarning() << "Waypoint" << i << "is" << segment_distance << "miles ahead, beyond the"
                   << remaining_range << "miles after a refill, the route cannot be serviced";
        serviceable = false;
        shortfall.waypoint = i;
        shortfall.location = position;
        shortfall.miles_from_start = distance_traveled;
        shortfall.remaining_range = remaining_range;
        shortfall.search_radius = searched_radius;
        shortfall.segment_distance = segment_distance;
        shortfall.beyond_refill = true;
        break;
      }
    }

    // Move to the waypoint.
    remaining_range -= segment_distance;
    distance_traveled += segment_distance;
    position = waypoint;
  }

  result = OptimizationResult(stops, total_distance);
  result.waypoints = waypoints.size();
  result.serviceable = serviceable;
  result.shortfall = shortfall;
  result.computation_ms = timer.nsecsElapsed() * 1e-6;

  qInfo() << "Optimization complete:" << result.stops.size() << "stops, $" << result.total_cost
          << "," << result.computation_ms << "ms" << (serviceable ? "" : "(not serviceable)");

  return true;
}


bool RouteOptimizer::findBestStation(
  const QGeoCoordinate& position,
  double remaining_range,
  const SpatialIndex& index,
  StationMatch& best,
  double& searched_radius
) const
{
  // Search radius: current fuel range, but not more than max_detour.
  searched_radius = qMin(remaining_range * 0.9, config_.max_detour);
  QList<StationMatch> candidates = index.withinRadius(position, searched_radius);

  if(candidates.isEmpty()) {
    // Expand search if nothing found.
    double expanded_radius = qMin(remaining_range, 50.0);
    qWarning() << "No stations in" << searched_radius << "mile radius, expanding to" << expanded_radius;
    searched_radius = qMax(searched_radius, expanded_radius);
    candidates = index.withinRadius(position, expanded_radius);
  }

  if(candidates.isEmpty()) {
    return false;
  }

  // Score the closest candidates: price is primary, distance is secondary.
  // Equal scores go to the closest station, then to the smallest ID, then to
  // the station that was loaded first.
  const int n = qMin(static_cast<int>(candidates.size()), config_.max_candidates);
  int best_idx = -1;
  double best_score = 0.0;
  for(int i=0; i<n; i++) {
    const StationMatch& c = candidates[i];
    double score = c.station.price + config_.distance_weight * c.distance_miles;

    if(best_idx < 0) {
      best_idx = i;
      best_score = score;
      continue;
    }

    const StationMatch& b = candidates[best_idx];
    bool better = score < best_score;
    if(score == best_score) {
      if(c.distance_miles != b.distance_miles) {
        better = c.distance_miles < b.distance_miles;
      }
      else if(c.station.id != b.station.id) {
        better = c.station.id < b.station.id;
      }
      else {
        better = c.index < b.index;
      }
    }

    if(better) {
      best_idx = i;
      best_score = score;
    }
  }

  best = candidates[best_idx];
  return true;
}
