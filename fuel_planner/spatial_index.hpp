#ifndef SPATIAL_INDEX_HPP
#define SPATIAL_INDEX_HPP

#include "kd_tree.hpp"
#include "station.hpp"

#include <Eigen/Dense>

#include <QGeoCoordinate>
#include <QList>

#include <memory>


/// A station returned by a proximity query, together with its distance.
struct StationMatch {
  Station station; ///< The station that matched the query.
  double distance_miles = 0.0; ///< Exact haversine distance from the query point.
  int index = -1; ///< Position of the station in SpatialIndex::stations().
};


/// Summary of the content of a SpatialIndex.
struct SpatialIndexStats {
  int station_count = 0;
  std::size_t memory_estimate_bytes = 0;
  bool is_loaded = false;
};


/// In-memory index that answers proximity queries over fuel stations.
/** Station coordinates are stored in a contiguous (n, 2) array, parallel to
  * the list of stations, and a KdTree is built over them. Once built, the
  * index is never modified: to load different data, either call build()
  * again on an index that nobody is reading from, or build a new index and
  * swap it in (see FuelPlanner::setIndex()).
  *
  * All distances are exact haversine distances, in miles.
  */
class SpatialIndex {
public:
  /// Create an empty index. It will report is_loaded=false until built.
  SpatialIndex() = default;

  // The tree holds a reference to coordinates_, hence no copies or moves.
  SpatialIndex(const SpatialIndex&) = delete;
  SpatialIndex& operator=(const SpatialIndex&) = delete;

  /// Bulk-load the index from raw feed rows.
  /** Malformed rows (missing, zero or out-of-range coordinates, bad prices)
    * are skipped. Any previous content is discarded.
    * @return The number of stations that were loaded.
    */
  int build(const QList<StationRecord>& records);

  /// Bulk-load the index from already parsed stations.
  /** Stations with invalid coordinates or prices are skipped.
    * @return The number of stations that were loaded.
    */
  int build(const QList<Station>& stations);

  /// Find the n stations closest to a point.
  /** @param point Query location.
    * @param n Maximum number of stations to return; it is clamped to the
    *   number of stations in the index.
    * @return Matches sorted by increasing distance. Distances are computed
    *   with the haversine formula (no degree-to-mile approximation).
    */
  QList<StationMatch> nearest(const QGeoCoordinate& point, int n) const;

  /// Find all stations within a given distance from a point.
  /** A widened latitude/longitude box is used to query the tree, then every
    * candidate is checked again using the haversine formula.
    * @param point Query location.
    * @param radius_miles Search radius, in miles.
    * @return Matches sorted by increasing distance, ties in load order.
    */
  QList<StationMatch> withinRadius(const QGeoCoordinate& point, double radius_miles) const;

  /// Statistics about the index.
  SpatialIndexStats stats() const;

  inline bool isLoaded() const { return tree_ != nullptr; }
  inline int stationCount() const { return static_cast<int>(stations_.size()); }
  inline const Station& station(int i) const { return stations_[i]; }
  inline const QList<Station>& stations() const { return stations_; }
  inline const Eigen::ArrayX2d& coordinates() const { return coordinates_; }

private:
  QList<Station> stations_; ///< Stations, in load order.
  Eigen::ArrayX2d coordinates_; ///< Row i is (latitude, longitude) of stations_[i].
  std::unique_ptr<KdTree> tree_; ///< Tree over coordinates_; null until built.

  /// Replace the content of the index and build the tree.
  void reset(QList<Station> stations);
};

#endif // SPATIAL_INDEX_HPP
