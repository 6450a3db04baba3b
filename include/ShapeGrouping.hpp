#ifndef PIX_SHAPE_GROUPING_HPP
#define PIX_SHAPE_GROUPING_HPP

#include "PathGeometry.hpp"
#include "ShapeCollector.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace pix {

/// Groups smaller than this on both axes (in points) are decorative noise
constexpr double kMinVectorDimension = 20.0;

/**
 * @brief Union-find over the indices 0..size-1
 */
class DisjointSet {
public:
  explicit DisjointSet(std::size_t size);

  /**
   * @brief Representative of the set containing x
   */
  std::size_t find(std::size_t x);

  /**
   * @brief Join the sets containing x and y
   * @return false if they were already the same set
   */
  bool merge(std::size_t x, std::size_t y);

  std::size_t size() const { return m_parent.size(); }

private:
  std::vector<std::size_t> m_parent;
  std::vector<unsigned> m_rank;
};

/**
 * @brief Overlapping candidates that share a clip, composited as one image
 */
struct ShapeGroup {
  ShapeKind kind = ShapeKind::Vector;
  BBox bbox;                          ///< Union of the members' bboxes
  std::optional<BBox> clip;           ///< Shared clip, absent when unclipped
  std::vector<ShapeCandidate> members; ///< In paint order
};

/**
 * @brief Check whether two effective clips are the same region
 *
 * Two absent clips match; an absent and a present clip never do.
 */
bool sameClip(const std::optional<BBox> &a, const std::optional<BBox> &b);

/**
 * @brief Merge overlapping candidates into groups
 *
 * Two candidates are connected when they are the same kind, have the same
 * effective clip and their bboxes overlap (touching counts). Groups are the
 * connected components, so the partition does not depend on input order.
 * Groups come back ordered by their first paint operation, members in paint
 * order.
 *
 * @param candidates Shape candidates of one page
 * @param margin Extra distance (points) still counted as overlap
 */
std::vector<ShapeGroup> groupShapes(const std::vector<ShapeCandidate> &candidates,
                                    double margin = 0.0);

/**
 * @brief Drop groups smaller than minDimension on both axes
 */
std::vector<ShapeGroup> filterGroups(std::vector<ShapeGroup> groups,
                                     double minDimension = kMinVectorDimension);

} // namespace pix

#endif // PIX_SHAPE_GROUPING_HPP
