#pragma once

#include "math_utilities.hpp"

#include <algorithm>


namespace math_utilities {

template <class D1, class D2, class D3, class D4>
auto haversineDistance(
  const Eigen::ArrayBase<D1>& lat1,
  const Eigen::ArrayBase<D2>& lon1,
  const Eigen::ArrayBase<D3>& lat2,
  const Eigen::ArrayBase<D4>& lon2
  )
{
  // Convert to radians.
  auto lat1r = TO_RAD * lat1.array();
  auto lat2r = TO_RAD * lat2.array();

  // Store differences.
  auto dlat = lat1r - lat2r;
  auto dlon = TO_RAD * (lon1.array() - lon2.array());

  // Calculate the haversine.
  auto a =
    ( (dlat / 2).sin().square() ) +
    ( lat1r.cos() * lat2r.cos() *
      ( (dlon / 2).sin().square() ) );

  // Return the distance from the haversine. The min() protects asin() from
  // round-off pushing the argument slightly above one for antipodal points.
  return 2.0 * EARTH_RADIUS_MILES * a.sqrt().min(1.0).asin();
}


// Scalar version of the above.
template <class D1, class D2>
auto haversineDistance(
  const Eigen::ArrayBase<D1>& lat1,
  const Eigen::ArrayBase<D2>& lon1,
  double lat2,
  double lon2
  )
{
  // Use a little cheat: if X is an array, then (X*0 + d) is an expression that
  // has the same dimension as X and represents an array filled with the value
  // 'd'. However, thanks to lazy evaluation, it should not require any memory
  // allocation!
  return haversineDistance(
    lat1,
    lon1,
    (lat1*0 + lat2),
    (lon1*0 + lon2)
  );
}


template<class Derived>
std::vector<Eigen::Index> argsort(
  const Eigen::ArrayBase<Derived>& array
)
{
  // Create the sorting vector.
  std::vector<Eigen::Index> sorted_idx(array.size());
  for(Eigen::Index i=0; i<static_cast<Eigen::Index>(sorted_idx.size()); ++i) {
    sorted_idx[i] = i;
  }

  // Define sorting based on the content of the array. Ties keep their
  // relative order.
  std::stable_sort(
    sorted_idx.begin(),
    sorted_idx.end(),
    [&](Eigen::Index i1, Eigen::Index i2) { return array(i1) < array(i2); }
  );

  return sorted_idx;
}

} // namespace math_utilities
