#ifndef PIX_CLIP_RESOLVER_HPP
#define PIX_CLIP_RESOLVER_HPP

#include "PathGeometry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pix {

/// Fraction of the page area a clip must cover to count as page-level
constexpr double kPageLevelClipRatio = 0.9;

/**
 * @brief One level of a clip chain: a path in local space plus the transform
 * that places it on the page
 */
struct ClipPrimitive {
  std::string path;      ///< Path descriptor (see parsePathCommands)
  std::string transform; ///< "matrix(...)" descriptor, empty for identity
};

/// Clip levels ordered from the outermost scope to the innermost
using ClipChain = std::vector<ClipPrimitive>;

/**
 * @brief Effective region of a clip chain
 */
struct ClipBounds {
  enum State {
    NONE,   ///< No restriction (empty chain or nothing resolvable)
    REGION, ///< Content is restricted to `region`
    EMPTY   ///< Nested levels do not intersect, nothing is visible
  };

  State state = NONE;
  BBox region;
};

/**
 * @brief Absolute bounding box of a single clip level
 * @return The box, or std::nullopt if the path has no coordinates
 */
std::optional<BBox> resolveClipPrimitive(const ClipPrimitive &primitive);

/**
 * @brief Absolute bounding box of a clip element
 *
 * Accepts a path element (`<path d="..." transform="..."/>`) or a rect
 * element (`<rect x="" y="" width="" height="" transform=""/>`), optionally
 * wrapped in other markup such as a clipPath element. The first path or rect
 * found is used.
 *
 * @param clipContent Markup of the clip
 * @return The box, or std::nullopt for empty or unusable content
 */
std::optional<BBox> resolveClipBounds(const std::string &clipContent);

/**
 * @brief Reduce a clip chain to one region by intersecting every level
 *
 * Levels that cannot be resolved impose no restriction.
 */
ClipBounds resolveClipChain(const ClipChain &chain);

/**
 * @brief Check whether a clip is effectively the whole page
 *
 * True when the part of the clip inside [0, 0, pageWidth, pageHeight] covers
 * at least `ratio` of the page area. A missing box, or one that does not
 * touch the page, is never page-level.
 */
bool isPageLevelClip(const std::optional<BBox> &bbox, double pageWidth,
                     double pageHeight, double ratio = kPageLevelClipRatio);

} // namespace pix

#endif // PIX_CLIP_RESOLVER_HPP
