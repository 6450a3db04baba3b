#ifndef PIX_PAINT_OP_RECORDER_HPP
#define PIX_PAINT_OP_RECORDER_HPP

#include "PaintOps.hpp"

#include <GfxState.h>
#include <OutputDev.h>

#include <string>
#include <vector>

namespace pix {

/**
 * @brief Poppler output device that records a page's paint operations
 *
 * Instead of rasterizing, every fill, stroke and image draw is captured as a
 * PaintOp together with its transformation matrix and the clip chain in
 * effect. The device reports itself as upside-down so the recorded page
 * space has its origin at the top-left corner, like the rendered raster.
 *
 * Usage:
 * @code
 * pix::PaintOpRecorder recorder;
 * doc->displayPage(&recorder, pageNumber, 72.0, 72.0, 0, true, false, false);
 * pix::PageDrawing drawing = recorder.takeDrawing();
 * @endcode
 */
class PaintOpRecorder : public OutputDev {
public:
  explicit PaintOpRecorder(bool verbose = false);

  /**
   * @brief Hand over what was recorded for the current page
   */
  PageDrawing takeDrawing();

  /**
   * @brief Number of embedded images that failed to decode and were dropped
   */
  int droppedImageCount() const { return m_droppedImages; }

  // Required OutputDev overrides
  bool upsideDown() override { return true; }
  bool useDrawChar() override { return false; }
  bool interpretType3Chars() override { return false; }
  bool needNonText() override { return true; }

  void startPage(int pageNum, GfxState *state, XRef *xref) override;

  // Graphics state stack (q / Q)
  void saveState(GfxState *state) override;
  void restoreState(GfxState *state) override;

  // Clipping
  void clip(GfxState *state) override;
  void eoClip(GfxState *state) override;
  void clipToStrokePath(GfxState *state) override;

  // Path painting
  void stroke(GfxState *state) override;
  void fill(GfxState *state) override;
  void eoFill(GfxState *state) override;

  // Images
  void drawImage(GfxState *state, Object *ref, Stream *str, int width,
                 int height, GfxImageColorMap *colorMap, bool interpolate,
                 const int *maskColors, bool inlineImg) override;
  void drawImageMask(GfxState *state, Object *ref, Stream *str, int width,
                     int height, bool invert, bool interpolate,
                     bool inlineImg) override;
  void drawSoftMaskedImage(GfxState *state, Object *ref, Stream *str,
                           int width, int height, GfxImageColorMap *colorMap,
                           bool interpolate, Stream *maskStr, int maskWidth,
                           int maskHeight, GfxImageColorMap *maskColorMap,
                           bool maskInterpolate) override;

  /**
   * @brief Convert a Poppler path into an absolute path descriptor
   */
  static std::string describePath(const GfxPath *path);

  /**
   * @brief The current transformation matrix as a "matrix(...)" descriptor
   */
  static std::string describeTransform(const GfxState *state);

private:
  void recordPath(GfxState *state, PaintKind kind);
  void pushClip(GfxState *state);
  void recordImage(GfxState *state, cv::Mat image);

  cv::Mat decodeImage(Stream *str, int width, int height,
                      GfxImageColorMap *colorMap);
  cv::Mat decodeStencil(Stream *str, int width, int height, bool invert,
                        const GfxRGB &fill);
  cv::Mat decodeMask(Stream *maskStr, int maskWidth, int maskHeight,
                     GfxImageColorMap *maskColorMap);

  PageDrawing m_drawing;
  ClipChain m_clipChain;               ///< Clips of the current scope
  std::vector<ClipChain> m_savedClips; ///< One entry per saveState
  int m_droppedImages;
  bool m_verbose;
};

} // namespace pix

#endif // PIX_PAINT_OP_RECORDER_HPP
