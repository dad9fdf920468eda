#ifndef OPTIMIZATION_RESULT_HPP
#define OPTIMIZATION_RESULT_HPP

#include "fuel_stop.hpp"

#include <QGeoCoordinate>
#include <QList>
#include <QMetaType>


/// Where and why a route could not be serviced.
struct FuelShortfall {
  int waypoint = -1; ///< Index of the sampled waypoint that could not be reached.
  QGeoCoordinate location; ///< Position of the vehicle when the search failed.
  double miles_from_start = 0.0; ///< Distance driven when the search failed.
  double remaining_range = 0.0; ///< Range left in the tank, in miles.
  double search_radius = 0.0; ///< Largest radius that was searched, in miles.
  double segment_distance = 0.0; ///< Distance to the waypoint that could not be reached.
  bool beyond_refill = false; ///< true if a station was found, but the waypoint is out of reach even after a refill.
};


/// Auxiliary structure containing information about a sequence of stops.
struct OptimizationResult {
  QList<FuelStop> stops; ///< Stops along the route, in route order.
  double total_cost = 0.0; ///< Total cost of the fuel purchased.
  double total_gallons = 0.0; ///< Total fuel purchased.
  double total_distance = 0.0; ///< Route length, as given by the caller.
  double computation_ms = 0.0; ///< Time spent optimizing.
  int waypoints = 0; ///< Number of waypoints after sampling.
  bool serviceable = true; ///< false if a required refuel had no reachable station.
  FuelShortfall shortfall; ///< Meaningful only if serviceable is false.

  // Default constructor needed by Qt's metatype system.
  OptimizationResult() = default;

  /// Create a result from a list of stops, summing costs and fuel.
  OptimizationResult(const QList<FuelStop>& stops, double total_distance);

  /// Average price paid per gallon, or zero if nothing was purchased.
  double averagePrice() const;
};

Q_DECLARE_METATYPE(OptimizationResult);

#endif // OPTIMIZATION_RESULT_HPP
