#include "fuel_planner.hpp"

#include "route_optimizer.hpp"

#include <QCryptographicHash>
#include <QDateTime>
#include <QDebug>
#include <QJsonArray>
#include <QStringList>
#include <QUrl>
#include <QUrlQuery>

#include <cmath>


// Helper function: amounts of money, fuel and distance are reported with two
// decimals.
static double round2(double value) {
  return std::round(value * 100.0) / 100.0;
}


FuelPlanner::FuelPlanner(
  RouterService* router,
  std::shared_ptr<const SpatialIndex> index,
  QObject *parent
) : QObject{parent}
  , router_(router)
  , index_(std::move(index))
  , cache_(CACHE_SIZE)
{

}


void FuelPlanner::setIndex(std::shared_ptr<const SpatialIndex> index) {
  index_ = std::move(index);
  // Responses computed with the old stations are not valid anymore.
  cache_.clear();
}


QString FuelPlanner::cacheKey(const FuelRequest& request) {
  QString key = QString("route:%1:%2:%3:%4").arg(
    request.start,
    request.end,
    QString::number(request.max_range, 'g', 17),
    QString::number(request.mpg, 'g', 17)
  );
  return QString::fromLatin1(QCryptographicHash::hash(key.toUtf8(), QCryptographicHash::Md5).toHex());
}


QString FuelPlanner::mapUrl(
  const QString& start,
  const QString& end,
  const QList<FuelStop>& stops
)
{
  QUrl url("https://www.google.com/maps/dir/");
  QUrlQuery query;
  query.addQueryItem("api", "1");
  query.addQueryItem("origin", start);
  query.addQueryItem("destination", end);

  if(!stops.isEmpty()) {
    QStringList waypoints;
    for(const auto& stop : stops) {
      waypoints.append(QString("%1,%2").arg(stop.location.latitude()).arg(stop.location.longitude()));
    }
    query.addQueryItem("waypoints", waypoints.join("|"));
  }

  url.setQuery(query);
  return url.toString(QUrl::FullyEncoded);
}


bool FuelPlanner::usable(
  const std::shared_ptr<const SpatialIndex>& index,
  QString& why
)
{
  if(index == nullptr || !index->isLoaded() || index->stationCount() == 0) {
    why = "Fuel station data not loaded";
    return false;
  }
  return true;
}


QJsonObject FuelPlanner::health() const {
  SpatialIndexStats stats;
  if(index_ != nullptr) {
    stats = index_->stats();
  }

  QString why;
  return QJsonObject{
    {"status", QString(usable(index_, why) ? "healthy" : "unhealthy")},
    {"stats", QJsonObject{
      {"station_count", stats.station_count},
      {"memory_estimate_bytes", static_cast<qint64>(stats.memory_estimate_bytes)},
      {"is_loaded", stats.is_loaded}
    }},
    {"router", router_ != nullptr ? router_->name() : QString("missing")}
  };
}


bool FuelPlanner::plan(
  const FuelRequest& request,
  const RoutePath& path,
  const SpatialIndex& index,
  const QElapsedTimer& timer,
  QJsonObject& response,
  QString& why
)
{
  RouteOptimizer optimizer(request.config());
  OptimizationResult result;
  QString err;
  if(!optimizer.optimize(path.points, path.distance_miles, index, result, err)) {
    why = QString("Cannot solve invalid request: %1").arg(err);
    return false;
  }

  if(!result.serviceable) {
    const FuelShortfall& s = result.shortfall;
    if(s.beyond_refill) {
      why = QString(
        "The next waypoint is %1 miles away from (%2, %3) at mile %4, beyond the %5 miles of a refill, the route cannot be serviced"
      ).arg(
        QString::number(s.segment_distance, 'f', 1),
        QString::number(s.location.latitude(), 'f', 4),
        QString::number(s.location.longitude(), 'f', 4),
        QString::number(s.miles_from_start, 'f', 1),
        QString::number(s.remaining_range, 'f', 1)
      );
      return false;
    }

    why = QString(
      "No fuel station within %1 miles of (%2, %3) at mile %4, the route cannot be serviced"
    ).arg(
      QString::number(s.search_radius, 'f', 1),
      QString::number(s.location.latitude(), 'f', 4),
      QString::number(s.location.longitude(), 'f', 4),
      QString::number(s.miles_from_start, 'f', 1)
    );
    return false;
  }

  QJsonArray stops;
  for(const auto& stop : result.stops) {
    stops.append(QJsonObject{
      {"name", stop.name},
      {"location", QJsonObject{
        {"lat", stop.location.latitude()},
        {"lon", stop.location.longitude()}
      }},
      {"price_per_gallon", round2(stop.price)},
      {"gallons", round2(stop.gallons)},
      {"cost", round2(stop.cost)},
      {"miles_from_start", round2(stop.miles_from_start)}
    });
  }

  response = QJsonObject{
    {"success", true},
    {"cache_hit", false},
    {"route", QJsonObject{
      {"start", request.start},
      {"end", request.end},
      {"distance_miles", round2(result.total_distance)},
      {"duration_hours", round2(path.duration_hours)},
      {"encoded_polyline", path.encodedPolyline()}
    }},
    {"fuel", QJsonObject{
      {"total_cost", round2(result.total_cost)},
      {"total_gallons", round2(result.total_gallons)},
      {"cost_per_gallon_avg", round2(result.averagePrice())},
      {"stops", stops},
      {"num_stops", static_cast<int>(result.stops.size())}
    }},
    {"performance", QJsonObject{
      {"optimization_ms", round2(result.computation_ms)},
      {"total_response_ms", round2(timer.nsecsElapsed() * 1e-6)},
      {"station_count", index.stationCount()}
    }},
    {"map_url", mapUrl(request.start, request.end, result.stops)}
  };
  return true;
}


void FuelPlanner::solve(
  FuelRequest request
)
{
  QElapsedTimer timer;
  timer.start();

  qDebug() << "Received request to find route from" << request.start << "to" << request.end;

  QString err;
  if(!request.isValid(err)) {
    emit failed(QString("Cannot solve invalid request: %1").arg(err));
    return;
  }

  // Check the cache first.
  const QString key = cacheKey(request);
  if(CachedResponse* cached = cache_.object(key)) {
    if(QDateTime::currentMSecsSinceEpoch() - cached->created_ms < CACHE_TTL_MS) {
      qInfo() << "Cache hit for" << request.start << "->" << request.end;
      QJsonObject response = cached->response;
      QJsonObject performance = response.value("performance").toObject();
      performance["total_response_ms"] = round2(timer.nsecsElapsed() * 1e-6);
      response["performance"] = performance;
      response["cache_hit"] = true;
      emit solved(response);
      return;
    }
    cache_.remove(key);
  }

  // Keep the index alive for the whole request, even if it gets replaced.
  std::shared_ptr<const SpatialIndex> index = index_;
  if(!usable(index, err)) {
    emit failed(err);
    return;
  }

  if(router_ == nullptr) {
    emit failed("No routing service available");
    return;
  }

  // Resolve both locations.
  QGeoCoordinate start, end;
  if(!router_->parseLocation(request.start, start, err) || !router_->parseLocation(request.end, end, err)) {
    emit failed(QString("Failed to resolve location: %1").arg(err));
    return;
  }

  // Calculate the path from departure to arrival.
  RoutePath path;
  if(!router_->route(start, end, path, err)) {
    emit failed(QString("Failed to find path from departure to arrival: %1").arg(err));
    return;
  }
  qDebug() << "Route:" << path.distance_miles << "miles," << path.points.size() << "points";

  QJsonObject response;
  if(!plan(request, path, *index, timer, response, err)) {
    emit failed(err);
    return;
  }

  cache_.insert(key, new CachedResponse{response, QDateTime::currentMSecsSinceEpoch()});

  qDebug() << "Sending solution to other components";
  emit solved(response);
}


void FuelPlanner::solvePath(
  FuelRequest request,
  RoutePath path
)
{
  QElapsedTimer timer;
  timer.start();

  QString err;
  if(!request.isValid(err)) {
    emit failed(QString("Cannot solve invalid request: %1").arg(err));
    return;
  }

  std::shared_ptr<const SpatialIndex> index = index_;
  if(!usable(index, err)) {
    emit failed(err);
    return;
  }

  QJsonObject response;
  if(!plan(request, path, *index, timer, response, err)) {
    emit failed(err);
    return;
  }

  emit solved(response);
}
