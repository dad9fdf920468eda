#ifndef ROUTER_SERVICE_HPP
#define ROUTER_SERVICE_HPP

#include "route_path.hpp"

#include <QGeoCoordinate>
#include <QObject>
#include <QString>


/// Base class for calculating driving paths between GPS coordinates.
/** This implementation does not rely on any external service: paths are
  * straight lines and locations must be given as coordinates. It is used in
  * "demo mode", when no routing service is available, and in tests.
  */
class RouterService : public QObject {
  Q_OBJECT
public:
  /// Create a new object with a given parent.
  explicit RouterService(QObject* parent=nullptr);

  /// Average speed used to estimate durations of straight-line paths.
  static constexpr double AVERAGE_SPEED_MPH = 55.0;

  /// Calculate a path between two locations.
  /** This method uses the Haversine formula and linear interpolation to
    * calculate piece-wise linear paths. It should be overridden in sub-classes
    * to allow different methods of path calculations, e.g., using some service
    * like OpenRouteService.
    * @param start Departure.
    * @param end Arrival.
    * @param[out] path The calculated path, valid only if true is returned.
    * @param[out] why Reason of the failure, if false is returned.
    * @return true on success.
    */
  virtual bool route(
    const QGeoCoordinate& start,
    const QGeoCoordinate& end,
    RoutePath& path,
    QString& why
  );

  /// Find the coordinates of an address.
  /** The base implementation cannot geocode anything and always fails.
    * @param address Free text, such as "Los Angeles, CA".
    * @param[out] coordinate Location of the address, if true is returned.
    * @param[out] why Reason of the failure, if false is returned.
    */
  virtual bool geocode(
    const QString& address,
    QGeoCoordinate& coordinate,
    QString& why
  );

  /// Convert a location string into coordinates.
  /** Strings in the form "latitude,longitude" are parsed directly; anything
    * else is forwarded to geocode().
    */
  bool parseLocation(
    const QString& location,
    QGeoCoordinate& coordinate,
    QString& why
  );

  /// Short name of the routing backend, used in health reports.
  virtual QString name() const;
};

#endif // ROUTER_SERVICE_HPP
