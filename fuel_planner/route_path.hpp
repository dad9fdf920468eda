#ifndef ROUTE_PATH_HPP
#define ROUTE_PATH_HPP

#include <QGeoCoordinate>
#include <QList>
#include <QMetaType>
#include <QString>


/// A driving path, as returned by a RouterService.
struct RoutePath {
  QList<QGeoCoordinate> points; ///< Polyline, in (latitude, longitude) order.
  double distance_miles = 0.0; ///< Driving distance.
  double duration_hours = 0.0; ///< Driving time.

  /// Encode the polyline using Google's encoded polyline algorithm.
  /** Coordinates are rounded to 5 decimal places.
    * @see https://developers.google.com/maps/documentation/utilities/polylinealgorithm
    */
  QString encodedPolyline() const;
};

Q_DECLARE_METATYPE(RoutePath);

#endif // ROUTE_PATH_HPP
