#include "spatial_index.hpp"

#include "math_utilities.hpp"

#include <QDebug>

#include <algorithm>
#include <cmath>


int SpatialIndex::build(const QList<StationRecord>& records) {
  QList<Station> stations;
  stations.reserve(records.size());

  int skipped = 0;
  for(int i=0; i<records.size(); i++) {
    Station station;
    QString why;
    if(!records[i].toStation(station, why)) {
      qDebug() << "Skipping station row" << i << "(" << records[i].name << "):" << why;
      skipped++;
      continue;
    }
    stations.append(station);
  }

  if(skipped > 0) {
    qInfo() << "Skipped" << skipped << "of" << records.size() << "station rows";
  }

  reset(std::move(stations));
  return stationCount();
}


int SpatialIndex::build(const QList<Station>& stations) {
  QList<Station> valid;
  valid.reserve(stations.size());

  for(const auto& station : stations) {
    QString why;
    if(!station.isValid(why)) {
      qDebug() << "Skipping station" << station.id << station.name << ":" << why;
      continue;
    }
    valid.append(station);
  }

  reset(std::move(valid));
  return stationCount();
}


void SpatialIndex::reset(QList<Station> stations) {
  // Destroy the tree first: it references the coordinates we are replacing.
  tree_.reset();

  stations_ = std::move(stations);
  coordinates_.resize(stations_.size(), 2);
  for(int i=0; i<stations_.size(); i++) {
    coordinates_(i, 0) = stations_[i].location.latitude();
    coordinates_(i, 1) = stations_[i].location.longitude();
  }

  tree_ = std::make_unique<KdTree>(coordinates_);

  if(stations_.isEmpty()) {
    qWarning() << "Spatial index built without any valid station";
  }
  else {
    qInfo() << "Loaded" << stations_.size() << "stations into the spatial index";
  }
}


QList<StationMatch> SpatialIndex::nearest(
  const QGeoCoordinate& point,
  int n
) const
{
  QList<StationMatch> matches;
  if(!isLoaded() || stations_.isEmpty() || n <= 0 || !point.isValid()) {
    return matches;
  }

  // Ensure n doesn't exceed the number of stations.
  n = qMin(n, stationCount());

  auto found = tree_->nearest(point.latitude(), point.longitude(), static_cast<std::size_t>(n));
  matches.reserve(found.size());
  for(const auto& [distance, row] : found) {
    int i = static_cast<int>(row);
    matches.append(StationMatch{stations_[i], distance, i});
  }
  return matches;
}


QList<StationMatch> SpatialIndex::withinRadius(
  const QGeoCoordinate& point,
  double radius_miles
) const
{
  QList<StationMatch> matches;
  if(!isLoaded() || stations_.isEmpty() || !point.isValid() || !(radius_miles >= 0.0)) {
    return matches;
  }

  const double lat = point.latitude();
  const double lon = point.longitude();

  // Coarse pre-filter: a box in degrees that contains the whole circle. The
  // conversions are exact on a sphere, but they are widened a bit to make
  // sure round-off never excludes a station that is right on the circle.
  constexpr double WIDENING = 1.001;
  constexpr double SLACK_DEG = 1e-9;
  double dlat = WIDENING * math_utilities::latitude_variation(radius_miles) + SLACK_DEG;
  double dlon = WIDENING * math_utilities::longitude_variation(radius_miles, lat) + SLACK_DEG;

  QList<KdTree::Box> boxes;
  if(dlon >= 180.0) {
    boxes.append(KdTree::Box{lat - dlat, lat + dlat, -180.0, 180.0});
  }
  else {
    boxes.append(KdTree::Box{lat - dlat, lat + dlat, lon - dlon, lon + dlon});
    // Wrap around the antimeridian, if needed.
    if(lon - dlon < -180.0) {
      boxes.append(KdTree::Box{lat - dlat, lat + dlat, lon - dlon + 360.0, 180.0});
    }
    if(lon + dlon > 180.0) {
      boxes.append(KdTree::Box{lat - dlat, lat + dlat, -180.0, lon + dlon - 360.0});
    }
  }

  // Collect candidates; the boxes may overlap, so rows are deduplicated.
  std::vector<Eigen::Index> candidates;
  for(const auto& box : boxes) {
    auto rows = tree_->inBox(box);
    candidates.insert(candidates.end(), rows.begin(), rows.end());
  }
  std::sort(candidates.begin(), candidates.end());
  candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

  // Exact check, using the haversine formula.
  std::vector<Eigen::Index> inside;
  std::vector<double> inside_distances;
  for(auto row : candidates) {
    double d = math_utilities::haversineDistance(lat, lon, coordinates_(row, 0), coordinates_(row, 1));
    if(d <= radius_miles) {
      inside.push_back(row);
      inside_distances.push_back(d);
    }
  }

  // Sort by distance; candidates are in load order, and argsort is stable.
  Eigen::Map<const Eigen::ArrayXd> distances(inside_distances.data(), inside_distances.size());
  auto order = math_utilities::argsort(distances);

  matches.reserve(order.size());
  for(auto k : order) {
    int i = static_cast<int>(inside[k]);
    matches.append(StationMatch{stations_[i], inside_distances[k], i});
  }
  return matches;
}


SpatialIndexStats SpatialIndex::stats() const {
  SpatialIndexStats s;
  s.station_count = stationCount();
  s.is_loaded = isLoaded();

  // Coordinates, stations (with their strings) and tree nodes.
  s.memory_estimate_bytes = static_cast<std::size_t>(coordinates_.size()) * sizeof(double);
  for(const auto& station : stations_) {
    s.memory_estimate_bytes += sizeof(Station);
    for(const QString* str : {&station.id, &station.name, &station.city, &station.state}) {
      s.memory_estimate_bytes += static_cast<std::size_t>(str->capacity()) * sizeof(QChar);
    }
  }
  if(tree_) {
    s.memory_estimate_bytes += tree_->memoryUsage();
  }
  return s;
}
