#include "route_path.hpp"

#include <cmath>


// Helper function: append a single signed value to an encoded polyline.
static void encodeValue(qint64 value, QString& out) {
  // Left-shift the value, inverting it if negative, so that the sign ends up
  // in the least significant bit.
  qint64 v = value < 0 ? ~(value << 1) : (value << 1);

  // Emit 5-bit chunks, least significant first, flagging all but the last.
  while(v >= 0x20) {
    out.append(QChar(static_cast<char16_t>((0x20 | (v & 0x1f)) + 63)));
    v >>= 5;
  }
  out.append(QChar(static_cast<char16_t>(v + 63)));
}


QString RoutePath::encodedPolyline() const {
  QString encoded;
  qint64 previous_lat = 0;
  qint64 previous_lon = 0;

  // Each point is stored as the difference from the previous one.
  for(const auto& p : points) {
    qint64 lat = std::llround(p.latitude() * 1e5);
    qint64 lon = std::llround(p.longitude() * 1e5);
    encodeValue(lat - previous_lat, encoded);
    encodeValue(lon - previous_lon, encoded);
    previous_lat = lat;
    previous_lon = lon;
  }

  return encoded;
}
