#ifndef FUEL_REQUEST_HPP
#define FUEL_REQUEST_HPP

#include "optimizer_config.hpp"

#include <QMetaType>
#include <QString>


/// A request for a fuel plan between two locations.
struct FuelRequest {
  QString start; ///< Departure, either as "lat,lon" or as an address.
  QString end; ///< Arrival, either as "lat,lon" or as an address.
  double max_range = 500.0; ///< Range of the vehicle with a full tank, in miles.
  double mpg = 10.0; ///< Fuel efficiency, in miles per gallon.

  /// Optimizer parameters for this request.
  inline OptimizerConfig config() const {
    OptimizerConfig c;
    c.max_range = max_range;
    c.mpg = mpg;
    return c;
  }

  bool isValid(QString& why) const {
    if(start.trimmed().isEmpty() || end.trimmed().isEmpty()) {
      why = "Both 'start' and 'end' are required";
      return false;
    }

    return config().isValid(why);
  }

  inline bool isValid() const {
    QString s;
    return isValid(s);
  }
};

Q_DECLARE_METATYPE(FuelRequest);

#endif // FUEL_REQUEST_HPP
