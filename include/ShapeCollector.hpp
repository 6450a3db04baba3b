#ifndef PIX_SHAPE_COLLECTOR_HPP
#define PIX_SHAPE_COLLECTOR_HPP

#include "ClipResolver.hpp"
#include "PaintOps.hpp"
#include "PathGeometry.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pix {

/**
 * @brief How a candidate gets its pixels
 */
enum class ShapeKind {
  Vector, ///< Re-rendered from its paint operation
  Raster  ///< Resampled from an embedded image
};

/**
 * @brief One paint operation that may become (part of) an extracted image
 */
struct ShapeCandidate {
  ShapeKind kind = ShapeKind::Vector;
  BBox localBbox;          ///< Painted bounds in the op's local space
  std::string transform;   ///< Local -> page transform descriptor
  BBox bbox;               ///< Absolute bounds on the page
  std::optional<BBox> clip; ///< Effective clip, absent when unclipped
  std::size_t opIndex = 0;  ///< Index into PageDrawing::ops
};

/**
 * @brief Page facts the collector needs, passed explicitly per call
 */
struct CollectorContext {
  double pageWidth = 0.0;
  double pageHeight = 0.0;
  double pageLevelClipRatio = kPageLevelClipRatio;
  bool verbose = false;
};

/**
 * @brief Turn a page's paint operations into shape candidates
 *
 * For every op the local bbox is resolved (images use the unit square,
 * strokes grow by half their line width), the
 * transform maps it onto the page and the clip chain is reduced to a single
 * effective clip. A page-level clip is treated as no clip.
 *
 * Skipped ops:
 * - vector ops without coordinates, or with zero width or height on the page
 * - ops whose nested clips do not intersect
 * - ops lying entirely outside their clip
 *
 * @param drawing Recorded paint operations
 * @param context Page size and page-level threshold
 * @return Candidates in paint order
 */
std::vector<ShapeCandidate> collectShapes(const PageDrawing &drawing,
                                          const CollectorContext &context);

} // namespace pix

#endif // PIX_SHAPE_COLLECTOR_HPP
