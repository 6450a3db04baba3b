#ifndef PIX_PAINT_OPS_HPP
#define PIX_PAINT_OPS_HPP

#include "ClipResolver.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace pix {

/**
 * @brief What a paint operation does
 */
enum class PaintKind {
  Fill,   ///< Fill with the non-zero winding rule
  EoFill, ///< Fill with the even-odd rule
  Stroke, ///< Stroke the path outline
  Image   ///< Paint an embedded raster image onto the unit square
};

/**
 * @brief Straight (non-premultiplied) color with opacity, components 0..1
 */
struct Rgba {
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;
  double a = 1.0;
};

/**
 * @brief One paint operation found while interpreting a page
 *
 * Geometry stays in the operation's local (user) space; `transform` maps it
 * onto the page. Images have no path and cover the unit square.
 */
struct PaintOp {
  PaintKind kind = PaintKind::Fill;
  std::string path;      ///< Absolute path descriptor in local space
  std::string transform; ///< "matrix(a,b,c,d,e,f)" local -> page
  ClipChain clipChain;   ///< Clips active when the op was painted
  Rgba color;            ///< Fill or stroke color
  double lineWidth = 1.0; ///< Stroke width in local units
  int imageIndex = -1;    ///< Index into PageDrawing::images for Image ops
};

/**
 * @brief Everything painted on one page, in paint order
 */
struct PageDrawing {
  double pageWidth = 0.0;  ///< Page width in points
  double pageHeight = 0.0; ///< Page height in points
  std::vector<PaintOp> ops;
  std::vector<cv::Mat> images; ///< Decoded images, BGRA (CV_8UC4)
  int droppedImages = 0;        ///< Embedded images that failed to decode
};

} // namespace pix

#endif // PIX_PAINT_OPS_HPP
