#include "Compositor.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <cairo.h>

namespace pix {

namespace {

// Largest canvas side we are willing to allocate
constexpr int kMaxCanvasSide = 20000;

using SurfacePtr =
    std::unique_ptr<cairo_surface_t, decltype(&cairo_surface_destroy)>;
using ContextPtr = std::unique_ptr<cairo_t, decltype(&cairo_destroy)>;

void appendPath(cairo_t *cr, const std::vector<PathCommand> &commands) {
  for (const auto &command : commands) {
    switch (command.type) {
    case PathCommand::MOVE:
      cairo_move_to(cr, command.points[0].x, command.points[0].y);
      break;
    case PathCommand::LINE:
      cairo_line_to(cr, command.points[0].x, command.points[0].y);
      break;
    case PathCommand::CUBIC:
      cairo_curve_to(cr, command.points[0].x, command.points[0].y,
                     command.points[1].x, command.points[1].y,
                     command.points[2].x, command.points[2].y);
      break;
    case PathCommand::CLOSE:
      cairo_close_path(cr);
      break;
    }
  }
}

// Cairo ARGB32 is premultiplied BGRA in memory on little-endian machines
cv::Mat surfaceToMat(cairo_surface_t *surface) {
  cairo_surface_flush(surface);

  int width = cairo_image_surface_get_width(surface);
  int height = cairo_image_surface_get_height(surface);
  int stride = cairo_image_surface_get_stride(surface);
  const unsigned char *data = cairo_image_surface_get_data(surface);

  cv::Mat mat(height, width, CV_8UC4);
  for (int row = 0; row < height; row++) {
    const unsigned char *src = data + row * stride;
    unsigned char *dst = mat.ptr<unsigned char>(row);
    for (int col = 0; col < width; col++) {
      unsigned int alpha = src[col * 4 + 3];
      if (alpha == 0) {
        dst[col * 4 + 0] = 0;
        dst[col * 4 + 1] = 0;
        dst[col * 4 + 2] = 0;
        dst[col * 4 + 3] = 0;
        continue;
      }
      for (int ch = 0; ch < 3; ch++) {
        unsigned int value = (src[col * 4 + ch] * 255 + alpha / 2) / alpha;
        dst[col * 4 + ch] = static_cast<unsigned char>(std::min(255u, value));
      }
      dst[col * 4 + 3] = static_cast<unsigned char>(alpha);
    }
  }
  return mat;
}

// Source-over of straight-alpha BGRA pixels
void blendOver(cv::Mat &dst, const cv::Mat &src, double opacity) {
  for (int row = 0; row < dst.rows; row++) {
    const unsigned char *s = src.ptr<unsigned char>(row);
    unsigned char *d = dst.ptr<unsigned char>(row);
    for (int col = 0; col < dst.cols; col++) {
      double sa = s[col * 4 + 3] / 255.0 * opacity;
      if (sa <= 0.0) {
        continue;
      }
      double da = d[col * 4 + 3] / 255.0;
      double oa = sa + da * (1.0 - sa);
      for (int ch = 0; ch < 3; ch++) {
        double value =
            (s[col * 4 + ch] * sa + d[col * 4 + ch] * da * (1.0 - sa)) / oa;
        d[col * 4 + ch] = cv::saturate_cast<unsigned char>(value);
      }
      d[col * 4 + 3] = cv::saturate_cast<unsigned char>(oa * 255.0);
    }
  }
}

} // anonymous namespace

std::vector<unsigned char> encodePng(const cv::Mat &image) {
  std::vector<unsigned char> buffer;
  if (image.empty() || !cv::imencode(".png", image, buffer)) {
    throw std::runtime_error("Failed to encode PNG");
  }
  return buffer;
}

cv::Mat decodePng(const std::vector<unsigned char> &bytes) {
  cv::Mat image;
  if (!bytes.empty()) {
    image = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
  }
  if (image.empty()) {
    throw std::runtime_error("Failed to decode PNG");
  }
  return image;
}

Compositor::Compositor(double scale) : m_scale(scale) {}

cv::Size Compositor::canvasSize(const BBox &bbox) const {
  // Tolerate float noise so a 100pt box is exactly 200px at 2x
  double width = std::ceil(bbox.width() * m_scale - 1e-6);
  double height = std::ceil(bbox.height() * m_scale - 1e-6);
  if (!std::isfinite(width) || !std::isfinite(height) ||
      width > kMaxCanvasSide || height > kMaxCanvasSide) {
    std::ostringstream message;
    message << "Canvas too large: " << width << "x" << height;
    throw std::runtime_error(message.str());
  }
  return cv::Size(static_cast<int>(std::max(1.0, width)),
                  static_cast<int>(std::max(1.0, height)));
}

cv::Mat Compositor::render(const ShapeGroup &group,
                           const PageDrawing &drawing) const {
  if (group.kind == ShapeKind::Raster) {
    return renderRasterGroup(group, drawing);
  }
  return renderVectorGroup(group, drawing);
}

PngImage Compositor::composite(const ShapeGroup &group,
                               const PageDrawing &drawing) const {
  cv::Mat pixels = render(group, drawing);

  PngImage png;
  png.width = pixels.cols;
  png.height = pixels.rows;
  png.bytes = encodePng(pixels);
  return png;
}

cv::Mat Compositor::renderVectorGroup(const ShapeGroup &group,
                                      const PageDrawing &drawing) const {
  cv::Size size = canvasSize(group.bbox);

  SurfacePtr surface(
      cairo_image_surface_create(CAIRO_FORMAT_ARGB32, size.width, size.height),
      &cairo_surface_destroy);
  if (cairo_surface_status(surface.get()) != CAIRO_STATUS_SUCCESS) {
    throw std::runtime_error("Failed to create Cairo image surface");
  }
  ContextPtr cr(cairo_create(surface.get()), &cairo_destroy);

  // A fresh image surface is fully transparent; map the group bbox origin to
  // canvas (0, 0)
  cairo_scale(cr.get(), m_scale, m_scale);
  cairo_translate(cr.get(), -group.bbox.minX, -group.bbox.minY);

  if (group.clip) {
    cairo_rectangle(cr.get(), group.clip->minX, group.clip->minY,
                    group.clip->width(), group.clip->height());
    cairo_clip(cr.get());
  }

  for (const auto &member : group.members) {
    if (member.opIndex >= drawing.ops.size()) {
      continue;
    }
    const PaintOp &op = drawing.ops[member.opIndex];
    AffineMatrix matrix =
        parseMatrixTransform(op.transform).value_or(AffineMatrix());
    if (std::abs(matrix.determinant()) < 1e-12) {
      continue; // Cairo rejects singular matrices
    }

    cairo_save(cr.get());

    cairo_matrix_t m;
    cairo_matrix_init(&m, matrix.a, matrix.b, matrix.c, matrix.d, matrix.e,
                      matrix.f);
    cairo_transform(cr.get(), &m);

    appendPath(cr.get(), parsePathCommands(op.path));
    cairo_set_source_rgba(cr.get(), op.color.r, op.color.g, op.color.b,
                          op.color.a);

    switch (op.kind) {
    case PaintKind::Fill:
      cairo_set_fill_rule(cr.get(), CAIRO_FILL_RULE_WINDING);
      cairo_fill(cr.get());
      break;
    case PaintKind::EoFill:
      cairo_set_fill_rule(cr.get(), CAIRO_FILL_RULE_EVEN_ODD);
      cairo_fill(cr.get());
      break;
    case PaintKind::Stroke: {
      double lineWidth = op.lineWidth;
      if (lineWidth <= 0.0) {
        // PDF line width 0 means the thinnest visible line: one device pixel
        double dx = 1.0;
        double dy = 0.0;
        cairo_device_to_user_distance(cr.get(), &dx, &dy);
        lineWidth = std::hypot(dx, dy);
      }
      cairo_set_line_width(cr.get(), lineWidth);
      cairo_stroke(cr.get());
      break;
    }
    case PaintKind::Image:
      cairo_new_path(cr.get());
      break;
    }

    cairo_restore(cr.get());
  }

  if (cairo_status(cr.get()) != CAIRO_STATUS_SUCCESS) {
    throw std::runtime_error(std::string("Cairo rendering failed: ") +
                             cairo_status_to_string(cairo_status(cr.get())));
  }

  return surfaceToMat(surface.get());
}

cv::Mat Compositor::renderRasterGroup(const ShapeGroup &group,
                                      const PageDrawing &drawing) const {
  cv::Size size = canvasSize(group.bbox);
  cv::Mat canvas(size, CV_8UC4, cv::Scalar(0, 0, 0, 0));

  for (const auto &member : group.members) {
    if (member.opIndex >= drawing.ops.size()) {
      continue;
    }
    const PaintOp &op = drawing.ops[member.opIndex];
    if (op.imageIndex < 0 ||
        op.imageIndex >= static_cast<int>(drawing.images.size())) {
      continue;
    }
    const cv::Mat &image = drawing.images[op.imageIndex];
    if (image.empty()) {
      continue;
    }

    AffineMatrix matrix =
        parseMatrixTransform(op.transform).value_or(AffineMatrix());
    if (std::abs(matrix.determinant()) < 1e-12) {
      continue;
    }

    // The image fills the unit square with row 0 at the top (v = 1):
    // u = col / w, v = 1 - row / h, then page -> canvas via bbox and scale
    double w = image.cols;
    double h = image.rows;
    double m00 = m_scale * matrix.a / w;
    double m01 = -m_scale * matrix.c / h;
    double m02 = m_scale * (matrix.c + matrix.e - group.bbox.minX);
    double m10 = m_scale * matrix.b / w;
    double m11 = -m_scale * matrix.d / h;
    double m12 = m_scale * (matrix.d + matrix.f - group.bbox.minY);

    // OpenCV samples at pixel centres
    m02 += 0.5 * (m00 + m01) - 0.5;
    m12 += 0.5 * (m10 + m11) - 0.5;

    cv::Mat transform = (cv::Mat_<double>(2, 3) << m00, m01, m02, m10, m11, m12);

    cv::Mat warped;
    cv::warpAffine(image, warped, transform, size, cv::INTER_LINEAR,
                   cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0, 0));
    blendOver(canvas, warped, op.color.a);
  }

  applyClipMask(canvas, group);
  return canvas;
}

void Compositor::applyClipMask(cv::Mat &canvas, const ShapeGroup &group) const {
  if (!group.clip) {
    return;
  }

  // Non-rectangular clips are approximated by their bbox
  double left = (group.clip->minX - group.bbox.minX) * m_scale;
  double top = (group.clip->minY - group.bbox.minY) * m_scale;
  double right = (group.clip->maxX - group.bbox.minX) * m_scale;
  double bottom = (group.clip->maxY - group.bbox.minY) * m_scale;

  for (int row = 0; row < canvas.rows; row++) {
    unsigned char *pixels = canvas.ptr<unsigned char>(row);
    double cy = row + 0.5;
    bool rowInside = cy >= top && cy <= bottom;
    for (int col = 0; col < canvas.cols; col++) {
      double cx = col + 0.5;
      if (!rowInside || cx < left || cx > right) {
        pixels[col * 4 + 3] = 0;
      }
    }
  }
}

} // namespace pix
