#ifndef OPTIMIZER_CONFIG_HPP
#define OPTIMIZER_CONFIG_HPP

#include <QMetaType>
#include <QString>

#include <cmath>


/// Parameters of the RouteOptimizer.
struct OptimizerConfig {
  double max_range = 500.0; ///< Range of the vehicle with a full tank, in miles.
  double mpg = 10.0; ///< Fuel efficiency, in miles per gallon.
  double safety_buffer = 30.0; ///< Range that must never be consumed, in miles.
  double max_detour = 20.0; ///< Largest distance from the route to a station, in miles.
  double sample_interval = 50.0; ///< Spacing between waypoints, in miles.
  double refill_fraction = 0.8; ///< Fraction of max_range the tank is filled to.
  int max_candidates = 30; ///< Number of nearest stations that are scored.
  double distance_weight = 0.01; ///< Score penalty per mile of distance.

  bool isValid(QString& why) const {
    if(!(max_range > 0.0) || !std::isfinite(max_range)) {
      why = "Parameter 'max_range' must be positive";
      return false;
    }

    if(!(mpg > 0.0) || !std::isfinite(mpg)) {
      why = "Parameter 'mpg' must be positive";
      return false;
    }

    if(!(safety_buffer >= 0.0)) {
      why = "Parameter 'safety_buffer' must be positive or zero";
      return false;
    }

    if(!(max_detour >= 0.0)) {
      why = "Parameter 'max_detour' must be positive or zero";
      return false;
    }

    if(!(sample_interval > 0.0)) {
      why = "Parameter 'sample_interval' must be positive";
      return false;
    }

    if(!(refill_fraction > 0.0 && refill_fraction <= 1.0)) {
      why = "Parameter 'refill_fraction' must be in (0, 1]";
      return false;
    }

    if(max_candidates <= 0) {
      why = "Parameter 'max_candidates' must be positive";
      return false;
    }

    if(!(distance_weight >= 0.0)) {
      why = "Parameter 'distance_weight' must be positive or zero";
      return false;
    }

    if(safety_buffer >= refill_fraction * max_range) {
      why = "Parameter 'safety_buffer' must be smaller than the range after a refill";
      return false;
    }

    return true;
  }

  inline bool isValid() const {
    QString s;
    return isValid(s);
  }
};

Q_DECLARE_METATYPE(OptimizerConfig);

#endif // OPTIMIZER_CONFIG_HPP
