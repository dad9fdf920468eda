#ifndef FUEL_STOP_HPP
#define FUEL_STOP_HPP

#include <QGeoCoordinate>
#include <QMetaType>
#include <QString>


/// Auxiliary structure containing information about a stop.
struct FuelStop {
  QString station_id; ///< ID of the station we are stopping at.
  QString name; ///< Name of the station we are stopping at.
  QGeoCoordinate location; ///< Location of the station.
  double price = 0.0; ///< Price per gallon at this station.
  double gallons = 0.0; ///< Amount of fuel purchased at this stop.
  double cost = 0.0; ///< Money spent at this stop.
  double miles_from_start = 0.0; ///< Distance driven when the stop is made.

  /// Default constructor, needed by Qt's metatype system.
  FuelStop() = default;

  /// Create a new fueling stop.
  /** The cost is calculated from the amount of fuel and the price.
    */
  FuelStop(
    const QString& station_id,
    const QString& name,
    const QGeoCoordinate& location,
    double price,
    double gallons,
    double miles_from_start
  ) : station_id(station_id), name(name), location(location), price(price), gallons(gallons), cost(gallons*price), miles_from_start(miles_from_start) {}
};

Q_DECLARE_METATYPE(FuelStop);

#endif // FUEL_STOP_HPP
