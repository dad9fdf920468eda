#ifndef MATH_UTILITIES_HPP
#define MATH_UTILITIES_HPP


#include <Eigen/Dense>

#include <string>
#include <vector>

namespace math_utilities {

// Constants, to avoid magic numbers.
constexpr double EARTH_RADIUS_MILES = 3959.0;
constexpr double MILES_PER_DEGREE = 69.0; ///< Coarse approximation, never used for thresholds.
constexpr double PI = 3.14159265358979323846;
constexpr double TO_DEG = (180 / PI);
constexpr double TO_RAD = (PI / 180);

/// Transform a distance into a latitude difference.
/** Given a distance, return the change in latitude corresponding to it when
  * moving along a meridian.
  * @param distance_miles A distance, in miles.
  * @return A latitude variation (in degrees) that corresponds to the given
  *   distance.
  */
double latitude_variation(double distance_miles);

/// Transform a distance into a longitude difference.
/** Given a distance and a latitude, return the largest change in longitude
  * that a point can have while staying within the given distance from a point
  * at the given latitude. If the circle contains one of the poles, any
  * longitude can be reached and 180 is returned.
  * @param distance_miles A distance, in miles.
  * @param latitude Latitude at which the longitude variation is to be
  *   calculated.
  * @return A longitude variation (in degrees) that corresponds to the given
  *   distance.
  */
double longitude_variation(double distance_miles, double latitude);

/// Calculate the distance between two GPS coordinates.
/** Haversine formula on a sphere whose radius is EARTH_RADIUS_MILES. This is
  * the reference metric for every distance that is reported or compared
  * against a threshold.
  * @return The great-circle distance, in miles.
  */
double haversineDistance(double lat1, double lon1, double lat2, double lon2);

/// Load an array saved using NumPy's savetxt() function.
/** Note that this function expects the shape to be (n, 2), where n will be
  * "deduced", but the 2 is hard-coded. Empty lines and lines starting with
  * '#' are ignored.
  * @param filename Path to the file containing the array.
  * @return The array contained in the file.
  * @throw std::runtime_error If the file cannot be opened or a line cannot be
  *   parsed.
  */
Eigen::ArrayXXd loadArray(const std::string& filename);


// Calculate the distance between GPS coordinates.
/** This function calculates the distance between the given GPS coordinates.
  * It leverages Eigen's parallelization to allow computing multiple distances
  * at once.
  * @param lat1 1D array of latitudes.
  * @param lon1 1D array of longitudes.
  * @param lat2 1D array of latitudes.
  * @param lon2 1D array of longitudes.
  * @return An array with the same shape as the inputs, such that the i-th
  *   entry is the distance (in miles) between the points defined by
  *   (lat1(i), lon1(i)) and (lat2(i), lon2(i)).
  */
template <class D1, class D2, class D3, class D4>
auto haversineDistance(
  const Eigen::ArrayBase<D1>& lat1,
  const Eigen::ArrayBase<D2>& lon1,
  const Eigen::ArrayBase<D3>& lat2,
  const Eigen::ArrayBase<D4>& lon2
);


/// Calculate the distance between GPS coordinates.
/** This overloaded version allows to calculate the distance between a set of
  * points from a single point.
  * @see haversineDistance()
  * @param lat1 1D array of latitudes.
  * @param lon1 1D array of longitudes.
  * @param lat2 A latitude.
  * @param lon2 A longitude.
  * @return An array with the same shape as the first inputs, such that the
  *   i-th entry is the distance between the points defined by
  *   (lat1(i), lon1(i)) and (lat2, lon2).
  */
template <class D1, class D2>
auto haversineDistance(
  const Eigen::ArrayBase<D1>& lat1,
  const Eigen::ArrayBase<D2>& lon1,
  double lat2,
  double lon2
);


/// Return the array that would order the input.
/** Given an input array, return the sequence s = (s0, s1, s2, ...) such that
  * the sequence (array(s0), array(s1), array(s2), ...) is sorted in ascending
  * order. Equal elements keep their relative order.
  * @param array A 1D array.
  * @return A list of indices which would sort the input.
  */
template<class Derived>
std::vector<Eigen::Index> argsort(
  const Eigen::ArrayBase<Derived>& array
);


} // namespace math_utilities

#include "math_utilities.hxx"

#endif // MATH_UTILITIES_HPP
