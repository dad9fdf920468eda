#include "optimization_result.hpp"

OptimizationResult::OptimizationResult(
  const QList<FuelStop>& stops,
  double total_distance
  ) : stops(stops)
  , total_distance(total_distance)
{
  // Sum the stops one-by-one.
  for(const auto& stop : stops) {
    total_cost += stop.cost;
    total_gallons += stop.gallons;
  }
}


double OptimizationResult::averagePrice() const {
  return total_gallons > 0.0 ? total_cost / total_gallons : 0.0;
}
