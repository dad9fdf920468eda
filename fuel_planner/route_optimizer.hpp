#ifndef ROUTE_OPTIMIZER_HPP
#define ROUTE_OPTIMIZER_HPP

#include "optimization_result.hpp"
#include "optimizer_config.hpp"
#include "spatial_index.hpp"

#include <QGeoCoordinate>
#include <QList>
#include <QString>


/// Class that can find cheap fuel stops along a road-trip.
/** The route is sampled into waypoints at regular intervals. While walking
  * from one waypoint to the next, the optimizer checks whether the remaining
  * range (minus a safety buffer) is enough to reach the next waypoint. If it
  * is not, the cheapest station close to the current position is selected,
  * giving a small penalty to distant stations, and the tank is filled to a
  * fraction of its capacity.
  *
  * The optimizer does not keep any state between calls: optimize() can be
  * invoked concurrently, as long as the SpatialIndex is not rebuilt.
  */
class RouteOptimizer {
public:
  /// Create a new optimizer.
  /** @param config Parameters of the vehicle and of the algorithm. They are
    *   not checked here, see isValid().
    */
  explicit RouteOptimizer(const OptimizerConfig& config = OptimizerConfig());

  /// Check if the configuration can be used to plan stops.
  inline bool isValid(QString& why) const { return config_.isValid(why); }

  /// Plan the fuel stops along a route.
  /** If at some point a refuel is needed but no station can be reached, or
    * if the waypoint ahead is farther than the range after a refill, the walk
    * stops and the plan is flagged as not serviceable. It then contains the
    * stops selected up to that point.
    * @param route_points Route polyline, from departure to arrival.
    * @param total_distance Length of the route, in miles, as given by the
    *   routing service. It is reported back in the result.
    * @param index Stations to choose from.
    * @param[out] result The plan.
    * @param[out] why Reason of the failure, if false is returned.
    * @return false if the configuration is not valid.
    */
  bool optimize(
    const QList<QGeoCoordinate>& route_points,
    double total_distance,
    const SpatialIndex& index,
    OptimizationResult& result,
    QString& why
  ) const;

  /// Reduce a polyline to waypoints spaced at regular intervals.
  /** Distances between consecutive points are summed until they reach the
    * interval; the point at which this happens is emitted and the sum reset.
    * The first and last points are always part of the output.
    * @param points Route polyline.
    * @param interval Spacing between waypoints, in miles.
    * @return The waypoints, which are a subset of the input points.
    */
  static QList<QGeoCoordinate> sampleRoute(
    const QList<QGeoCoordinate>& points,
    double interval
  );

  inline const OptimizerConfig& config() const { return config_; }

private:
  OptimizerConfig config_;

  /// Select the station where to refuel.
  /** @param position Current position of the vehicle.
    * @param remaining_range Range left, in miles.
    * @param index Stations to choose from.
    * @param[out] best The selected station, if true is returned.
    * @param[out] searched_radius Largest radius used during the search.
    * @return false if there are no stations within reach.
    */
  bool findBestStation(
    const QGeoCoordinate& position,
    double remaining_range,
    const SpatialIndex& index,
    StationMatch& best,
    double& searched_radius
  ) const;
};

#endif // ROUTE_OPTIMIZER_HPP
