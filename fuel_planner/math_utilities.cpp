#include "math_utilities.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>


namespace math_utilities {

double latitude_variation(
  double distance_miles
)
{
  return TO_DEG * (distance_miles / EARTH_RADIUS_MILES);
}


double longitude_variation(
  double distance_miles,
  double latitude
)
{
  // Angular radius of the circle, and the cosine of the latitude of its
  // center. The widest longitude span of a spherical cap of angular radius
  // theta is asin(sin(theta) / cos(latitude)).
  double theta = distance_miles / EARTH_RADIUS_MILES;
  double cos_lat = std::cos(TO_RAD * latitude);

  // If the cap reaches a pole (or is larger than a hemisphere), every
  // longitude is within reach.
  if(theta >= PI / 2 || std::sin(theta) >= cos_lat) {
    return 180.0;
  }

  return TO_DEG * std::asin(std::sin(theta) / cos_lat);
}


double haversineDistance(
  double lat1,
  double lon1,
  double lat2,
  double lon2
)
{
  // Convert to radians.
  double lat1r = TO_RAD * lat1;
  double lat2r = TO_RAD * lat2;

  // Store differences.
  double dlat = lat1r - lat2r;
  double dlon = TO_RAD * (lon1 - lon2);

  // Calculate the haversine.
  double sin_dlat = std::sin(dlat / 2);
  double sin_dlon = std::sin(dlon / 2);
  double a = sin_dlat * sin_dlat + std::cos(lat1r) * std::cos(lat2r) * sin_dlon * sin_dlon;

  // Return the distance from the haversine.
  return 2.0 * EARTH_RADIUS_MILES * std::asin(std::min(1.0, std::sqrt(a)));
}


Eigen::ArrayXXd loadArray(const std::string& filename)
{
  // Open the file.
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Could not open file: " + filename);
  }

  // Prepare to read data.
  std::vector<std::array<double, 2>> rows;
  std::string line;

  // Read the file line by line.
  while(std::getline(file, line)) {
    // Skip blank lines and comments (savetxt writes headers as '# ...').
    std::size_t first = line.find_first_not_of(" \t\r");
    if(first == std::string::npos || line[first] == '#') {
      continue;
    }

    // Accept both whitespace and comma separated values.
    for(auto& c : line) {
      if(c == ',') {
        c = ' ';
      }
    }

    std::istringstream iss(line);
    double a, b;
    if (!(iss >> a >> b)) {
      throw std::runtime_error("Invalid line in file: " + line);
    }
    rows.push_back({a, b});
  }

  // Copy the data into an Eigen::Array.
  Eigen::ArrayXXd result(rows.size(), 2);
  for (size_t i = 0; i < rows.size(); ++i) {
    result(i, 0) = rows[i][0];
    result(i, 1) = rows[i][1];
  }
  return result;
}

} // namespace math_utilities
