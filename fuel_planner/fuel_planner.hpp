#ifndef FUEL_PLANNER_HPP
#define FUEL_PLANNER_HPP

#include "fuel_request.hpp"
#include "optimization_result.hpp"
#include "route_path.hpp"
#include "router_service.hpp"
#include "spatial_index.hpp"

#include <QCache>
#include <QElapsedTimer>
#include <QJsonObject>
#include <QObject>
#include <QString>

#include <memory>


/// Class that can find cheap fuel stops along a road-trip.
/** The planner glues together routing (RouterService), station lookup
  * (SpatialIndex) and optimization (RouteOptimizer), and turns the result
  * into a JSON document. Responses are cached for one hour, keyed on the
  * request parameters.
  */
class FuelPlanner : public QObject {
  Q_OBJECT
public:
  /// Maximum number of cached responses.
  static constexpr int CACHE_SIZE = 256;

  /// Time after which cached responses expire, in milliseconds.
  static constexpr qint64 CACHE_TTL_MS = 3600 * 1000;

  /// Create a new planner.
  /** @param router Object to be used for geocoding and routing.
    * @param index Stations to choose from. It can be null, in which case
    *   requests fail until an index is set.
    * @param parent Parent object, needed for Qt's memory management.
    */
  explicit FuelPlanner(
    RouterService* router,
    std::shared_ptr<const SpatialIndex> index,
    QObject *parent = nullptr
  );

  /// Replace the station index.
  /** Build the new index first, then swap it in; requests being processed
    * keep using the index they started with.
    */
  void setIndex(std::shared_ptr<const SpatialIndex> index);

  inline std::shared_ptr<const SpatialIndex> index() const { return index_; }

  /// Report the state of the service.
  /** @return A JSON object with fields "status" ("healthy" if stations are
    *   loaded, "unhealthy" otherwise), "stats" and "router".
    */
  QJsonObject health() const;

  /// Key under which the response to a request is cached.
  /** Range and efficiency enter the key with all their significant digits,
    * so that requests differing only slightly do not share a response.
    */
  static QString cacheKey(const FuelRequest& request);

  /// Link to Google Maps showing the route and the stops.
  static QString mapUrl(const QString& start, const QString& end, const QList<FuelStop>& stops);

  /// Drop all cached responses.
  inline void clearCache() { cache_.clear(); }

private:
  /// A response stored in the cache.
  struct CachedResponse {
    QJsonObject response;
    qint64 created_ms = 0; ///< Creation time, since epoch.
  };

  RouterService* router_ = nullptr; ///< Used to get driving paths and coordinates.
  std::shared_ptr<const SpatialIndex> index_; ///< Used to look for stations.
  QCache<QString, CachedResponse> cache_; ///< Recent responses.

  /// Tell if the given index can be used for planning.
  static bool usable(const std::shared_ptr<const SpatialIndex>& index, QString& why);

  /// Optimize a path and convert the result into a JSON document.
  /** @param[out] response The document, valid only if true is returned.
    * @param[out] why Reason of the failure, if false is returned.
    */
  static bool plan(
    const FuelRequest& request,
    const RoutePath& path,
    const SpatialIndex& index,
    const QElapsedTimer& timer,
    QJsonObject& response,
    QString& why
  );

public slots:
  /// Solve the whole routing problem.
  void solve(FuelRequest request);

  /// Solve the problem along a given path, skipping geocoding and routing.
  /** The locations in the request are reported as they are, and the result
    * is not cached.
    */
  void solvePath(FuelRequest request, RoutePath path);

signals:
  /// Signal emitted when a request has been completed.
  void solved(const QJsonObject& response);

  /// Signal emitted when a request has failed.
  void failed(const QString& why);
};

#endif // FUEL_PLANNER_HPP
