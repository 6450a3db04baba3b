#include "PaintOpRecorder.hpp"

#include <opencv2/imgproc.hpp>

#include <iostream>
#include <sstream>
#include <utility>

#include <Stream.h>

namespace pix {

namespace {

// Images above this many pixels are treated as undecodable
constexpr long long kMaxImagePixels = 1LL << 28;

Rgba toRgba(const GfxRGB &rgb, double opacity) {
  Rgba color;
  color.r = colToDbl(rgb.r);
  color.g = colToDbl(rgb.g);
  color.b = colToDbl(rgb.b);
  color.a = opacity;
  return color;
}

} // anonymous namespace

PaintOpRecorder::PaintOpRecorder(bool verbose)
    : m_droppedImages(0), m_verbose(verbose) {}

PageDrawing PaintOpRecorder::takeDrawing() {
  PageDrawing drawing = std::move(m_drawing);
  drawing.droppedImages = m_droppedImages;
  m_drawing = PageDrawing();
  m_clipChain.clear();
  m_savedClips.clear();
  return drawing;
}

void PaintOpRecorder::startPage(int pageNum, GfxState *state, XRef * /*xref*/) {
  m_drawing = PageDrawing();
  m_clipChain.clear();
  m_savedClips.clear();
  m_droppedImages = 0;

  if (state) {
    m_drawing.pageWidth = state->getPageWidth();
    m_drawing.pageHeight = state->getPageHeight();
  }

  if (m_verbose) {
    std::cerr << "DEBUG: Recording paint ops for page " << pageNum << " ("
              << m_drawing.pageWidth << " x " << m_drawing.pageHeight
              << " pt)" << std::endl;
  }
}

void PaintOpRecorder::saveState(GfxState * /*state*/) {
  m_savedClips.push_back(m_clipChain);
}

void PaintOpRecorder::restoreState(GfxState * /*state*/) {
  // Unbalanced Q operators are common in the wild; ignore the extra ones
  if (m_savedClips.empty()) {
    return;
  }
  m_clipChain = std::move(m_savedClips.back());
  m_savedClips.pop_back();
}

void PaintOpRecorder::clip(GfxState *state) { pushClip(state); }

// The even-odd rule only changes which parts of the path are inside; the
// bounding region is the same.
void PaintOpRecorder::eoClip(GfxState *state) { pushClip(state); }

void PaintOpRecorder::clipToStrokePath(GfxState *state) { pushClip(state); }

void PaintOpRecorder::stroke(GfxState *state) {
  recordPath(state, PaintKind::Stroke);
}

void PaintOpRecorder::fill(GfxState *state) {
  recordPath(state, PaintKind::Fill);
}

void PaintOpRecorder::eoFill(GfxState *state) {
  recordPath(state, PaintKind::EoFill);
}

void PaintOpRecorder::drawImage(GfxState *state, Object * /*ref*/, Stream *str,
                                int width, int height,
                                GfxImageColorMap *colorMap,
                                bool /*interpolate*/,
                                const int * /*maskColors*/,
                                bool /*inlineImg*/) {
  cv::Mat image = decodeImage(str, width, height, colorMap);
  if (image.empty()) {
    return;
  }
  recordImage(state, image);
}

// Stencil masks paint the fill color wherever a sample is "on"
void PaintOpRecorder::drawImageMask(GfxState *state, Object * /*ref*/,
                                    Stream *str, int width, int height,
                                    bool invert, bool /*interpolate*/,
                                    bool /*inlineImg*/) {
  GfxRGB fill;
  state->getFillRGB(&fill);

  cv::Mat image = decodeStencil(str, width, height, invert, fill);
  if (image.empty()) {
    return;
  }
  recordImage(state, image);
}

void PaintOpRecorder::drawSoftMaskedImage(
    GfxState *state, Object * /*ref*/, Stream *str, int width, int height,
    GfxImageColorMap *colorMap, bool /*interpolate*/, Stream *maskStr,
    int maskWidth, int maskHeight, GfxImageColorMap *maskColorMap,
    bool /*maskInterpolate*/) {
  cv::Mat image = decodeImage(str, width, height, colorMap);
  if (image.empty()) {
    return;
  }

  cv::Mat mask = decodeMask(maskStr, maskWidth, maskHeight, maskColorMap);
  if (!mask.empty()) {
    try {
      if (mask.cols != image.cols || mask.rows != image.rows) {
        cv::resize(mask, mask, image.size(), 0, 0, cv::INTER_LINEAR);
      }
      int fromTo[] = {0, 3};
      cv::mixChannels(&mask, 1, &image, 1, fromTo, 1);
    } catch (const std::exception &e) {
      // Keep the image opaque rather than losing it
      std::cerr << "WARNING: Failed to apply soft mask: " << e.what()
                << std::endl;
    }
  }

  recordImage(state, image);
}

std::string PaintOpRecorder::describePath(const GfxPath *path) {
  std::ostringstream out;
  out.precision(10);

  if (!path) {
    return std::string();
  }

  for (int i = 0; i < path->getNumSubpaths(); i++) {
    const GfxSubpath *subpath = path->getSubpath(i);
    int numPoints = subpath->getNumPoints();
    if (numPoints == 0) {
      continue;
    }

    out << "M" << subpath->getX(0) << " " << subpath->getY(0);

    // Curve segments are stored as two flagged control points followed by
    // the end point
    int j = 1;
    while (j < numPoints) {
      if (subpath->getCurve(j) && j + 2 < numPoints) {
        out << "C" << subpath->getX(j) << " " << subpath->getY(j) << " "
            << subpath->getX(j + 1) << " " << subpath->getY(j + 1) << " "
            << subpath->getX(j + 2) << " " << subpath->getY(j + 2);
        j += 3;
      } else {
        out << "L" << subpath->getX(j) << " " << subpath->getY(j);
        j += 1;
      }
    }

    if (subpath->isClosed()) {
      out << "Z";
    }
  }

  return out.str();
}

std::string PaintOpRecorder::describeTransform(const GfxState *state) {
  const auto &ctm = state->getCTM();
  AffineMatrix matrix{ctm[0], ctm[1], ctm[2], ctm[3], ctm[4], ctm[5]};
  return formatMatrixTransform(matrix);
}

void PaintOpRecorder::recordPath(GfxState *state, PaintKind kind) {
  const GfxPath *path = state->getPath();
  if (!path || path->getNumSubpaths() == 0) {
    return;
  }

  PaintOp op;
  op.kind = kind;
  op.path = describePath(path);
  op.transform = describeTransform(state);
  op.clipChain = m_clipChain;
  op.lineWidth = state->getLineWidth();

  GfxRGB rgb;
  if (kind == PaintKind::Stroke) {
    state->getStrokeRGB(&rgb);
    op.color = toRgba(rgb, state->getStrokeOpacity());
  } else {
    state->getFillRGB(&rgb);
    op.color = toRgba(rgb, state->getFillOpacity());
  }

  m_drawing.ops.push_back(std::move(op));
}

void PaintOpRecorder::pushClip(GfxState *state) {
  const GfxPath *path = state->getPath();
  if (!path || path->getNumSubpaths() == 0) {
    return;
  }

  ClipPrimitive primitive;
  primitive.path = describePath(path);
  primitive.transform = describeTransform(state);
  m_clipChain.push_back(std::move(primitive));
}

void PaintOpRecorder::recordImage(GfxState *state, cv::Mat image) {
  PaintOp op;
  op.kind = PaintKind::Image;
  op.transform = describeTransform(state);
  op.clipChain = m_clipChain;
  op.color.a = state->getFillOpacity();
  op.imageIndex = static_cast<int>(m_drawing.images.size());

  if (m_verbose) {
    std::cerr << "DEBUG: Image " << op.imageIndex << " (" << image.cols << "x"
              << image.rows << ") placed by " << op.transform << std::endl;
  }

  m_drawing.images.push_back(std::move(image));
  m_drawing.ops.push_back(std::move(op));
}

cv::Mat PaintOpRecorder::decodeImage(Stream *str, int width, int height,
                                     GfxImageColorMap *colorMap) {
  if (width <= 0 || height <= 0 || !colorMap || !str ||
      static_cast<long long>(width) * height > kMaxImagePixels) {
    m_droppedImages++;
    return cv::Mat();
  }

  try {
    int nComps = colorMap->getNumPixelComps();
    int nBits = colorMap->getBits();

    ImageStream imgStr(str, width, nComps, nBits);
    imgStr.reset();

    // BGRA, opaque until a soft mask says otherwise
    cv::Mat mat(height, width, CV_8UC4);
    GfxRGB rgb;

    for (int row = 0; row < height; row++) {
      unsigned char *line = imgStr.getLine();
      if (!line) {
        imgStr.close();
        m_droppedImages++;
        std::cerr << "WARNING: Image data ended at row " << row << " of "
                  << height << ", dropping image" << std::endl;
        return cv::Mat();
      }

      unsigned char *imgRow = mat.ptr<unsigned char>(row);
      for (int col = 0; col < width; col++) {
        colorMap->getRGB(&line[col * nComps], &rgb);
        imgRow[col * 4 + 0] = colToByte(rgb.b);
        imgRow[col * 4 + 1] = colToByte(rgb.g);
        imgRow[col * 4 + 2] = colToByte(rgb.r);
        imgRow[col * 4 + 3] = 255;
      }
    }

    imgStr.close();
    return mat;
  } catch (const std::exception &e) {
    m_droppedImages++;
    std::cerr << "WARNING: Failed to decode image: " << e.what() << std::endl;
    return cv::Mat();
  }
}

cv::Mat PaintOpRecorder::decodeStencil(Stream *str, int width, int height,
                                       bool invert, const GfxRGB &fill) {
  if (width <= 0 || height <= 0 || !str ||
      static_cast<long long>(width) * height > kMaxImagePixels) {
    m_droppedImages++;
    return cv::Mat();
  }

  try {
    ImageStream imgStr(str, width, 1, 1);
    imgStr.reset();

    // Color everywhere so resampling does not darken the edges
    cv::Mat mat(height, width, CV_8UC4,
                cv::Scalar(colToByte(fill.b), colToByte(fill.g),
                           colToByte(fill.r), 0));
    // A 0 sample paints unless the decode array is inverted
    unsigned char paint = invert ? 1 : 0;

    for (int row = 0; row < height; row++) {
      unsigned char *line = imgStr.getLine();
      if (!line) {
        imgStr.close();
        m_droppedImages++;
        std::cerr << "WARNING: Stencil data ended at row " << row << " of "
                  << height << ", dropping image" << std::endl;
        return cv::Mat();
      }

      unsigned char *imgRow = mat.ptr<unsigned char>(row);
      for (int col = 0; col < width; col++) {
        imgRow[col * 4 + 3] = line[col] == paint ? 255 : 0;
      }
    }

    imgStr.close();
    return mat;
  } catch (const std::exception &e) {
    m_droppedImages++;
    std::cerr << "WARNING: Failed to decode stencil mask: " << e.what()
              << std::endl;
    return cv::Mat();
  }
}

cv::Mat PaintOpRecorder::decodeMask(Stream *maskStr, int maskWidth,
                                    int maskHeight,
                                    GfxImageColorMap *maskColorMap) {
  if (maskWidth <= 0 || maskHeight <= 0 || !maskColorMap || !maskStr ||
      static_cast<long long>(maskWidth) * maskHeight > kMaxImagePixels) {
    return cv::Mat();
  }

  try {
    int nComps = maskColorMap->getNumPixelComps();
    ImageStream maskImgStr(maskStr, maskWidth, nComps,
                           maskColorMap->getBits());
    maskImgStr.reset();

    cv::Mat mask(maskHeight, maskWidth, CV_8UC1);
    GfxGray gray;

    for (int row = 0; row < maskHeight; row++) {
      unsigned char *line = maskImgStr.getLine();
      if (!line) {
        maskImgStr.close();
        return cv::Mat();
      }
      unsigned char *maskRow = mask.ptr<unsigned char>(row);
      for (int col = 0; col < maskWidth; col++) {
        maskColorMap->getGray(&line[col * nComps], &gray);
        maskRow[col] = colToByte(gray);
      }
    }

    maskImgStr.close();
    return mask;
  } catch (const std::exception &e) {
    std::cerr << "WARNING: Failed to decode soft mask: " << e.what()
              << std::endl;
    return cv::Mat();
  }
}

} // namespace pix
