#include "station.hpp"

#include <cmath>


bool Station::isValid(QString& why) const {
  if(!location.isValid()) {
    why = "Invalid or out-of-range coordinates";
    return false;
  }

  if(!std::isfinite(price) || price < 0.0) {
    why = "Price must be a non-negative number";
    return false;
  }

  return true;
}


// Helper function: parse a floating point field, rejecting empty strings,
// garbage and non-finite values.
static bool parseNumber(const QString& field, double& value) {
  bool ok = false;
  value = field.trimmed().toDouble(&ok);
  return ok && std::isfinite(value);
}


bool StationRecord::toStation(Station& station, QString& why) const {
  double lat, lon, p;

  if(!parseNumber(latitude, lat) || !parseNumber(longitude, lon)) {
    why = QString("Missing or malformed coordinates '%1', '%2'").arg(latitude, longitude);
    return false;
  }

  // A zero coordinate is how geocoding failures show up in the feeds.
  if(lat == 0.0 || lon == 0.0) {
    why = "Coordinates were never geocoded";
    return false;
  }

  if(lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) {
    why = QString("Coordinates (%1, %2) are out of range").arg(lat).arg(lon);
    return false;
  }

  if(!parseNumber(price, p)) {
    why = QString("Missing or malformed price '%1'").arg(price);
    return false;
  }

  QString display_name = name.trimmed();
  if(display_name.isEmpty()) {
    display_name = "Unknown";
  }

  station = Station(
    id.trimmed(),
    display_name,
    city.trimmed(),
    state.trimmed(),
    p,
    QGeoCoordinate(lat, lon)
  );

  return station.isValid(why);
}
