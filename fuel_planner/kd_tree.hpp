#ifndef KD_TREE_HPP
#define KD_TREE_HPP

#include <Eigen/Dense>

#include <utility>
#include <vector>


/// Two-dimensional tree over a contiguous array of GPS coordinates.
/** The tree does not own the coordinates: it keeps a reference to an (n, 2)
  * array whose rows are (latitude, longitude) pairs, and stores row indices
  * in its nodes. The referenced array must outlive the tree and must not be
  * modified after the tree has been built.
  *
  * Nodes split alternately on latitude and longitude, at the median of the
  * points in their subtree. Each node also stores the bounding box of its
  * subtree, which is used to prune both box queries and nearest-neighbor
  * searches.
  */
class KdTree {
public:
  /// Axis-aligned box in degrees.
  struct Box {
    double min_latitude = 0.0;
    double max_latitude = 0.0;
    double min_longitude = 0.0;
    double max_longitude = 0.0;

    /// Tell if the point (latitude, longitude) lies inside the box.
    inline bool contains(double latitude, double longitude) const {
      return latitude >= min_latitude && latitude <= max_latitude
        && longitude >= min_longitude && longitude <= max_longitude;
    }

    /// Tell if two boxes have at least one point in common.
    inline bool intersects(const Box& other) const {
      return min_latitude <= other.max_latitude && other.min_latitude <= max_latitude
        && min_longitude <= other.max_longitude && other.min_longitude <= max_longitude;
    }
  };

  /// Build the tree over the given coordinates, in O(n log n).
  explicit KdTree(const Eigen::ArrayX2d& coordinates);

  /// Number of points in the tree.
  inline Eigen::Index size() const { return coordinates_.rows(); }

  /// Approximate memory used by the nodes, in bytes.
  inline std::size_t memoryUsage() const { return nodes_.capacity() * sizeof(Node); }

  /// Collect the rows of all points inside the given box.
  /** The output is not sorted in any particular way.
    */
  std::vector<Eigen::Index> inBox(const Box& box) const;

  /// Find the k points closest to the given location.
  /** The search uses the exact haversine distance, pruning subtrees using a
    * lower bound on the distance from the query to their bounding box.
    * @param latitude Latitude of the query point.
    * @param longitude Longitude of the query point.
    * @param k Maximum number of points to be returned.
    * @return Pairs (distance in miles, row), sorted by increasing distance.
    */
  std::vector<std::pair<double, Eigen::Index>> nearest(
    double latitude,
    double longitude,
    std::size_t k
  ) const;

  /// Lower bound of the haversine distance between a point and a box.
  /** For any point Q inside the box, the great-circle distance between
    * (latitude, longitude) and Q is not smaller than the returned value.
    * @return A distance in miles.
    */
  static double distanceLowerBound(double latitude, double longitude, const Box& box);

private:
  struct Node {
    Eigen::Index row = 0; ///< Row of the point stored in this node.
    int axis = 0; ///< 0 to split on latitude, 1 to split on longitude.
    int left = -1; ///< Index of the left child in nodes_, or -1.
    int right = -1; ///< Index of the right child in nodes_, or -1.
    Box box; ///< Bounding box of the subtree rooted here.
  };

  const Eigen::ArrayX2d& coordinates_; ///< (latitude, longitude) rows.
  std::vector<Node> nodes_; ///< Nodes of the tree, root first.
  int root_ = -1; ///< Index of the root in nodes_, or -1 for empty trees.

  /// Recursively build the subtree for rows[begin:end].
  int build(std::vector<Eigen::Index>& rows, std::size_t begin, std::size_t end, int depth);

  void collectInBox(int node, const Box& box, std::vector<Eigen::Index>& out) const;

  // Max-heap on the distance, holding the best candidates found so far.
  using Heap = std::vector<std::pair<double, Eigen::Index>>;

  void searchNearest(int node, double latitude, double longitude, std::size_t k, Heap& heap) const;
};

#endif // KD_TREE_HPP
