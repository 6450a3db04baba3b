#ifndef PIX_COMPOSITOR_HPP
#define PIX_COMPOSITOR_HPP

#include "PaintOps.hpp"
#include "ShapeGrouping.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace pix {

/// Pixels per point of every extracted raster (144 DPI)
constexpr double kDefaultRenderScale = 2.0;

/**
 * @brief An encoded PNG with its pixel dimensions
 */
struct PngImage {
  int width = 0;
  int height = 0;
  std::vector<unsigned char> bytes;
};

/**
 * @brief Encode an OpenCV image as PNG
 *
 * BGR input gives an RGB PNG, BGRA input an RGBA PNG.
 *
 * @throws std::runtime_error if encoding fails
 */
std::vector<unsigned char> encodePng(const cv::Mat &image);

/**
 * @brief Decode PNG bytes, keeping the alpha channel if present
 * @throws std::runtime_error if the bytes do not decode
 */
cv::Mat decodePng(const std::vector<unsigned char> &bytes);

/**
 * @brief Rasterizes shape groups into standalone transparent images
 *
 * The canvas covers the group bbox at the extraction scale, so canvas pixel
 * (0, 0) is the bbox origin and pixels line up with the full-page raster.
 */
class Compositor {
public:
  explicit Compositor(double scale = kDefaultRenderScale);

  double scale() const { return m_scale; }

  /**
   * @brief Canvas size in pixels for a page-space box (at least 1x1)
   * @throws std::runtime_error if a side is not finite or exceeds 20000 px
   */
  cv::Size canvasSize(const BBox &bbox) const;

  /**
   * @brief Rasterize a group to BGRA pixels
   *
   * Vector groups replay their paint operations with cairo on a transparent
   * surface clipped to the group clip. Raster groups resample each member
   * image through its placement transform and then zero the alpha of every
   * pixel whose centre lies outside the clip bbox.
   *
   * @param group Group to rasterize
   * @param drawing Paint operations and images the members refer to
   * @return CV_8UC4 image, straight (non-premultiplied) alpha
   * @throws std::runtime_error if the canvas is too large or cannot be
   * allocated
   */
  cv::Mat render(const ShapeGroup &group, const PageDrawing &drawing) const;

  /**
   * @brief Rasterize a group and encode it as an RGBA PNG
   */
  PngImage composite(const ShapeGroup &group, const PageDrawing &drawing) const;

private:
  cv::Mat renderVectorGroup(const ShapeGroup &group,
                            const PageDrawing &drawing) const;
  cv::Mat renderRasterGroup(const ShapeGroup &group,
                            const PageDrawing &drawing) const;
  void applyClipMask(cv::Mat &canvas, const ShapeGroup &group) const;

  double m_scale;
};

} // namespace pix

#endif // PIX_COMPOSITOR_HPP
