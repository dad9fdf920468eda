#include "router_service.hpp"

#include "math_utilities.hpp"

#include <QDebug>
#include <QStringList>

#include <cmath>


RouterService::RouterService(
  QObject* parent
) : QObject(parent)
{
  // Nothing to do here.
}


bool RouterService::route(
  const QGeoCoordinate& start,
  const QGeoCoordinate& end,
  RoutePath& path,
  QString& why
)
{
  if(!start.isValid() || !end.isValid()) {
    why = "Bad inputs passed to RouterService::route()";
    qDebug() << why;
    return false;
  }

  // The path will be created by defining small segments whose length is at
  // most RESOLUTION_MILES.
  constexpr double RESOLUTION_MILES = 5.0;

  double distance = math_utilities::haversineDistance(
    start.latitude(), start.longitude(), end.latitude(), end.longitude()
  );

  // Evaluate how many points need to be generated in between.
  unsigned int n_points = 1 + static_cast<unsigned int>(std::ceil(distance / RESOLUTION_MILES));

  // Using linear interpolation, add the intermediate points. Skip the last
  // one (k=n_points), since it corresponds to the arrival, which is added
  // separately.
  path.points.clear();
  path.points.reserve(n_points + 1);
  for(unsigned int k=0; k<n_points; k++) {
    double rho = static_cast<double>(k) / n_points;
    path.points.append(QGeoCoordinate(
      start.latitude() * (1-rho) + end.latitude() * rho,
      start.longitude() * (1-rho) + end.longitude() * rho
    ));
  }
  path.points.append(end);

  // Length of the polyline.
  path.distance_miles = 0.0;
  for(int i=1; i<path.points.size(); i++) {
    path.distance_miles += math_utilities::haversineDistance(
      path.points[i-1].latitude(), path.points[i-1].longitude(),
      path.points[i].latitude(), path.points[i].longitude()
    );
  }
  path.duration_hours = path.distance_miles / AVERAGE_SPEED_MPH;
  return true;
}


bool RouterService::geocode(
  const QString& address,
  QGeoCoordinate& coordinate,
  QString& why
)
{
  Q_UNUSED(coordinate);
  why = QString("Cannot geocode '%1': no geocoding service available, use 'latitude,longitude'").arg(address);
  return false;
}


bool RouterService::parseLocation(
  const QString& location,
  QGeoCoordinate& coordinate,
  QString& why
)
{
  // Check if it's already coordinates.
  QStringList parts = location.split(',');
  if(parts.size() == 2) {
    bool ok_lat = false, ok_lon = false;
    double lat = parts[0].trimmed().toDouble(&ok_lat);
    double lon = parts[1].trimmed().toDouble(&ok_lon);
    if(ok_lat && ok_lon) {
      QGeoCoordinate c(lat, lon);
      if(c.isValid()) {
        coordinate = c;
        return true;
      }
    }
  }

  // Otherwise, geocode it.
  return geocode(location.trimmed(), coordinate, why);
}


QString RouterService::name() const {
  return "straight-line";
}
