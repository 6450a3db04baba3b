#include "ShapeCollector.hpp"

#include <iostream>
#include <utility>

namespace pix {

namespace {

const BBox kUnitSquare{0.0, 0.0, 1.0, 1.0};

} // anonymous namespace

std::vector<ShapeCandidate> collectShapes(const PageDrawing &drawing,
                                          const CollectorContext &context) {
  std::vector<ShapeCandidate> candidates;
  int skipped = 0;

  for (std::size_t i = 0; i < drawing.ops.size(); i++) {
    const PaintOp &op = drawing.ops[i];

    ShapeCandidate candidate;
    candidate.opIndex = i;
    candidate.transform = op.transform;

    if (op.kind == PaintKind::Image) {
      if (op.imageIndex < 0 ||
          op.imageIndex >= static_cast<int>(drawing.images.size())) {
        skipped++;
        continue;
      }
      candidate.kind = ShapeKind::Raster;
      candidate.localBbox = kUnitSquare;
    } else {
      auto local = resolvePathBbox(op.path);
      if (!local) {
        skipped++;
        continue;
      }
      candidate.kind = ShapeKind::Vector;
      candidate.localBbox = *local;

      // Half the pen lies outside the path; width 0 is a device hairline
      if (op.kind == PaintKind::Stroke && op.lineWidth > 0.0) {
        double half = op.lineWidth / 2.0;
        candidate.localBbox.minX -= half;
        candidate.localBbox.minY -= half;
        candidate.localBbox.maxX += half;
        candidate.localBbox.maxY += half;
      }
    }

    candidate.bbox = applyTransform(candidate.localBbox, op.transform);

    // Hairlines and single points carry nothing worth extracting
    if (candidate.bbox.width() <= 0.0 || candidate.bbox.height() <= 0.0) {
      skipped++;
      continue;
    }

    ClipBounds clip = resolveClipChain(op.clipChain);
    if (clip.state == ClipBounds::EMPTY) {
      skipped++;
      continue;
    }

    if (clip.state == ClipBounds::REGION &&
        !isPageLevelClip(clip.region, context.pageWidth, context.pageHeight,
                         context.pageLevelClipRatio)) {
      if (!intersect(candidate.bbox, clip.region)) {
        skipped++;
        continue;
      }
      candidate.clip = clip.region;
    }

    candidates.push_back(std::move(candidate));
  }

  if (context.verbose) {
    std::cerr << "DEBUG: Collected " << candidates.size()
              << " shape candidates from " << drawing.ops.size()
              << " paint ops (" << skipped << " skipped)" << std::endl;
  }

  return candidates;
}

} // namespace pix
