#ifndef PIX_PATH_GEOMETRY_HPP
#define PIX_PATH_GEOMETRY_HPP

#include <optional>
#include <string>
#include <vector>

namespace pix {

/**
 * @brief Axis-aligned bounding box (minX, minY, maxX, maxY)
 *
 * Coordinates are page points with the origin at the top-left corner unless
 * stated otherwise. A zero-area box is valid.
 */
struct BBox {
  double minX = 0.0;
  double minY = 0.0;
  double maxX = 0.0;
  double maxY = 0.0;

  double width() const { return maxX - minX; }
  double height() const { return maxY - minY; }
  double area() const { return width() * height(); }

  bool operator==(const BBox &other) const {
    return minX == other.minX && minY == other.minY && maxX == other.maxX &&
           maxY == other.maxY;
  }
  bool operator!=(const BBox &other) const { return !(*this == other); }
};

/**
 * @brief Geometric intersection of two boxes
 * @return The shared region, or std::nullopt if the boxes are disjoint.
 * Boxes that only touch yield a zero-area region.
 */
std::optional<BBox> intersect(const BBox &a, const BBox &b);

/**
 * @brief Smallest box containing both inputs
 */
BBox unite(const BBox &a, const BBox &b);

/**
 * @brief Check whether two boxes overlap
 *
 * Touching edges count as overlap. A positive margin grows the test region
 * on every side.
 */
bool overlaps(const BBox &a, const BBox &b, double margin = 0.0);

/**
 * @brief Compare two boxes allowing for floating point noise
 */
bool nearlyEqual(const BBox &a, const BBox &b, double tolerance = 1e-6);

struct Point {
  double x = 0.0;
  double y = 0.0;
};

/**
 * @brief One absolute drawing command decoded from a path descriptor
 */
struct PathCommand {
  enum Type { MOVE, LINE, CUBIC, CLOSE };

  Type type;
  std::vector<Point> points; ///< 1 for MOVE/LINE, 3 for CUBIC, 0 for CLOSE
};

/**
 * @brief Decode an SVG-like path descriptor into absolute commands
 *
 * Supported commands are M/m, L/l, H/h, V/v, C/c and Z/z. Relative commands
 * accumulate from the current pen position, H/V become LINE commands and
 * extra coordinate pairs after a move are implicit line-tos. Numbers may run
 * together when the second one starts with a sign or a dot, so ".073-.195"
 * reads as 0.073 and -0.195.
 *
 * Malformed tokens, unknown commands and incomplete argument lists are
 * skipped; this function never throws.
 *
 * @param descriptor Path data such as "M10 20 L30 40Z"
 * @return Decoded commands (possibly empty)
 */
std::vector<PathCommand> parsePathCommands(const std::string &descriptor);

/**
 * @brief Bounding box of a path descriptor in its local coordinates
 *
 * Cubic segments contribute their two control points and their end point,
 * so curves are bounded by their control polygon rather than the exact
 * curve extremum. Linear segments are exact.
 *
 * @param descriptor Path data
 * @return The box, or std::nullopt when no coordinate pair could be read
 */
std::optional<BBox> resolvePathBbox(const std::string &descriptor);

/**
 * @brief 2D affine matrix mapping local to parent coordinates
 *
 * x' = a*x + c*y + e, y' = b*x + d*y + f
 */
struct AffineMatrix {
  double a = 1.0;
  double b = 0.0;
  double c = 0.0;
  double d = 1.0;
  double e = 0.0;
  double f = 0.0;

  Point apply(const Point &p) const {
    return {a * p.x + c * p.y + e, b * p.x + d * p.y + f};
  }
  double determinant() const { return a * d - b * c; }
};

/**
 * @brief Parse a "matrix(a,b,c,d,e,f)" transform descriptor
 *
 * Values may be separated by commas and/or whitespace.
 *
 * @return The matrix, or std::nullopt for any other syntax
 */
std::optional<AffineMatrix> parseMatrixTransform(const std::string &transform);

/**
 * @brief Format a matrix as a "matrix(a,b,c,d,e,f)" descriptor
 */
std::string formatMatrixTransform(const AffineMatrix &matrix);

/**
 * @brief Map a local box into the parent coordinate space
 *
 * All four corners are transformed and the axis-aligned box spanning them is
 * returned, so rotations and reflections are handled.
 */
BBox applyTransform(const BBox &bbox, const AffineMatrix &matrix);

/**
 * @brief Map a local box through a transform descriptor
 *
 * An empty descriptor, or one that is not a matrix(...), leaves the box
 * unchanged.
 */
BBox applyTransform(const BBox &bbox, const std::string &transform);

} // namespace pix

#endif // PIX_PATH_GEOMETRY_HPP
