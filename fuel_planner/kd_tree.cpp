#include "kd_tree.hpp"

#include "math_utilities.hpp"

#include <algorithm>
#include <cmath>


KdTree::KdTree(
  const Eigen::ArrayX2d& coordinates
) : coordinates_(coordinates)
{
  if(coordinates_.rows() == 0) {
    return;
  }

  // The tree has exactly one node per point.
  nodes_.reserve(coordinates_.rows());

  std::vector<Eigen::Index> rows(coordinates_.rows());
  for(Eigen::Index i=0; i<coordinates_.rows(); i++) {
    rows[i] = i;
  }

  root_ = build(rows, 0, rows.size(), 0);
}


int KdTree::build(
  std::vector<Eigen::Index>& rows,
  std::size_t begin,
  std::size_t end,
  int depth
)
{
  if(begin >= end) {
    return -1;
  }

  int axis = depth % 2;

  // Partially sort the rows, so that the median ends up in the middle with
  // all "smaller" points on its left and all "larger" points on its right.
  // Ties are broken by row, so that the tree does not depend on the standard
  // library implementation.
  std::size_t median = begin + (end - begin) / 2;
  std::nth_element(
    rows.begin() + begin,
    rows.begin() + median,
    rows.begin() + end,
    [&](Eigen::Index a, Eigen::Index b) {
      double ca = coordinates_(a, axis);
      double cb = coordinates_(b, axis);
      return ca < cb || (ca == cb && a < b);
    }
  );

  int index = static_cast<int>(nodes_.size());
  nodes_.emplace_back();
  nodes_[index].row = rows[median];
  nodes_[index].axis = axis;

  // Children are built after the parent has been stored, so that indices in
  // nodes_ stay stable (the vector never reallocates thanks to reserve()).
  int left = build(rows, begin, median, depth + 1);
  int right = build(rows, median + 1, end, depth + 1);

  Node& node = nodes_[index];
  node.left = left;
  node.right = right;

  // The bounding box is the union of the point and the children boxes.
  double lat = coordinates_(node.row, 0);
  double lon = coordinates_(node.row, 1);
  node.box = Box{lat, lat, lon, lon};
  for(int child : {left, right}) {
    if(child < 0) {
      continue;
    }
    const Box& b = nodes_[child].box;
    node.box.min_latitude = std::min(node.box.min_latitude, b.min_latitude);
    node.box.max_latitude = std::max(node.box.max_latitude, b.max_latitude);
    node.box.min_longitude = std::min(node.box.min_longitude, b.min_longitude);
    node.box.max_longitude = std::max(node.box.max_longitude, b.max_longitude);
  }

  return index;
}


std::vector<Eigen::Index> KdTree::inBox(const Box& box) const {
  std::vector<Eigen::Index> out;
  if(root_ >= 0) {
    collectInBox(root_, box, out);
  }
  return out;
}


void KdTree::collectInBox(
  int node,
  const Box& box,
  std::vector<Eigen::Index>& out
) const
{
  const Node& n = nodes_[node];

  // Nothing in this subtree can be inside the box.
  if(!n.box.intersects(box)) {
    return;
  }

  if(box.contains(coordinates_(n.row, 0), coordinates_(n.row, 1))) {
    out.push_back(n.row);
  }

  if(n.left >= 0) {
    collectInBox(n.left, box, out);
  }
  if(n.right >= 0) {
    collectInBox(n.right, box, out);
  }
}


// Helper function: smallest angular difference between two longitudes, in
// degrees, taking the antimeridian into account.
static double longitudeGap(double lon1, double lon2) {
  double d = std::abs(lon1 - lon2);
  return std::min(d, 360.0 - d);
}


double KdTree::distanceLowerBound(
  double latitude,
  double longitude,
  const Box& box
)
{
  using namespace math_utilities;

  // A great-circle distance is never smaller than the latitude difference.
  double dlat = 0.0;
  if(latitude < box.min_latitude) {
    dlat = box.min_latitude - latitude;
  }
  else if(latitude > box.max_latitude) {
    dlat = latitude - box.max_latitude;
  }

  // If the box does not contain the longitude of the query, every point in
  // the box is on a meridian which is at least dlon away. The distance from a
  // point at latitude phi to a meridian dlon away is asin(cos(phi)*sin(dlon)),
  // and it only grows with dlon up to 90 degrees (beyond, the closest point
  // is a pole, which is even further away).
  double dlon = 0.0;
  if(longitude < box.min_longitude || longitude > box.max_longitude) {
    dlon = std::min(longitudeGap(longitude, box.min_longitude), longitudeGap(longitude, box.max_longitude));
  }

  double lat_bound = TO_RAD * dlat;
  double lon_bound = 0.0;
  if(dlon > 0.0) {
    double s = std::cos(TO_RAD * latitude) * std::sin(TO_RAD * std::min(dlon, 90.0));
    lon_bound = std::asin(std::clamp(s, 0.0, 1.0));
  }

  return EARTH_RADIUS_MILES * std::max(lat_bound, lon_bound);
}


std::vector<std::pair<double, Eigen::Index>> KdTree::nearest(
  double latitude,
  double longitude,
  std::size_t k
) const
{
  Heap heap;
  if(root_ < 0 || k == 0) {
    return heap;
  }

  heap.reserve(k + 1);
  searchNearest(root_, latitude, longitude, k, heap);

  // Turn the heap into a list sorted by distance, then by row.
  std::sort_heap(heap.begin(), heap.end());
  return heap;
}


void KdTree::searchNearest(
  int node,
  double latitude,
  double longitude,
  std::size_t k,
  Heap& heap
) const
{
  const Node& n = nodes_[node];

  // Consider the point stored in this node.
  double d = math_utilities::haversineDistance(latitude, longitude, coordinates_(n.row, 0), coordinates_(n.row, 1));
  std::pair<double, Eigen::Index> candidate{d, n.row};
  if(heap.size() < k) {
    heap.push_back(candidate);
    std::push_heap(heap.begin(), heap.end());
  }
  else if(candidate < heap.front()) {
    std::pop_heap(heap.begin(), heap.end());
    heap.back() = candidate;
    std::push_heap(heap.begin(), heap.end());
  }

  // Visit the most promising child first, since it is likely to shrink the
  // search radius and allow pruning of the other one.
  int children[2] = {n.left, n.right};
  double bounds[2] = {0.0, 0.0};
  for(int i=0; i<2; i++) {
    if(children[i] >= 0) {
      bounds[i] = distanceLowerBound(latitude, longitude, nodes_[children[i]].box);
    }
  }
  if(children[1] >= 0 && (children[0] < 0 || bounds[1] < bounds[0])) {
    std::swap(children[0], children[1]);
    std::swap(bounds[0], bounds[1]);
  }

  for(int i=0; i<2; i++) {
    if(children[i] < 0) {
      continue;
    }
    // Skip the subtree if none of its points can beat the current k-th best.
    if(heap.size() >= k && bounds[i] > heap.front().first) {
      continue;
    }
    searchNearest(children[i], latitude, longitude, k, heap);
  }
}
