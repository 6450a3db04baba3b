#include "ClipResolver.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace pix {

namespace {

// Value of `name="..."` (or single-quoted) inside one element's markup. The
// attribute must be preceded by whitespace so "d" does not match "id".
std::optional<std::string> attributeValue(const std::string &element,
                                          const std::string &name) {
  size_t pos = 0;
  while ((pos = element.find(name, pos)) != std::string::npos) {
    size_t after = pos + name.size();
    bool boundary =
        pos > 0 && std::isspace(static_cast<unsigned char>(element[pos - 1]));
    if (boundary) {
      size_t eq = after;
      while (eq < element.size() &&
             std::isspace(static_cast<unsigned char>(element[eq]))) {
        ++eq;
      }
      if (eq + 1 < element.size() && element[eq] == '=') {
        size_t quote = eq + 1;
        while (quote < element.size() &&
               std::isspace(static_cast<unsigned char>(element[quote]))) {
          ++quote;
        }
        if (quote < element.size() &&
            (element[quote] == '"' || element[quote] == '\'')) {
          size_t end = element.find(element[quote], quote + 1);
          if (end != std::string::npos) {
            return element.substr(quote + 1, end - quote - 1);
          }
        }
      }
    }
    pos = after;
  }
  return std::nullopt;
}

std::optional<double> numericAttribute(const std::string &element,
                                       const std::string &name) {
  auto value = attributeValue(element, name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  double number = std::strtod(value->c_str(), &end);
  if (end == value->c_str() || !std::isfinite(number)) {
    return std::nullopt;
  }
  return number;
}

// Markup of the first <path ...> or <rect ...> element, up to its '>'
std::string firstElement(const std::string &content, const std::string &tag) {
  size_t pos = 0;
  while ((pos = content.find("<" + tag, pos)) != std::string::npos) {
    size_t nameEnd = pos + 1 + tag.size();
    if (nameEnd < content.size() &&
        (std::isspace(static_cast<unsigned char>(content[nameEnd])) ||
         content[nameEnd] == '/' || content[nameEnd] == '>')) {
      size_t close = content.find('>', nameEnd);
      if (close == std::string::npos) {
        close = content.size();
      }
      return content.substr(pos, close - pos);
    }
    pos = nameEnd;
  }
  return std::string();
}

} // anonymous namespace

std::optional<BBox> resolveClipPrimitive(const ClipPrimitive &primitive) {
  auto local = resolvePathBbox(primitive.path);
  if (!local) {
    return std::nullopt;
  }
  return applyTransform(*local, primitive.transform);
}

std::optional<BBox> resolveClipBounds(const std::string &clipContent) {
  if (clipContent.empty()) {
    return std::nullopt;
  }

  std::string pathElement = firstElement(clipContent, "path");
  std::string rectElement = firstElement(clipContent, "rect");

  // Whichever element comes first in the markup wins
  bool usePath = !pathElement.empty();
  if (usePath && !rectElement.empty()) {
    usePath = clipContent.find(pathElement) < clipContent.find(rectElement);
  }

  if (usePath) {
    ClipPrimitive primitive;
    primitive.path = attributeValue(pathElement, "d").value_or("");
    primitive.transform = attributeValue(pathElement, "transform").value_or("");
    return resolveClipPrimitive(primitive);
  }

  if (!rectElement.empty()) {
    auto width = numericAttribute(rectElement, "width");
    auto height = numericAttribute(rectElement, "height");
    if (!width || !height || *width < 0.0 || *height < 0.0) {
      return std::nullopt;
    }
    double x = numericAttribute(rectElement, "x").value_or(0.0);
    double y = numericAttribute(rectElement, "y").value_or(0.0);

    BBox local{x, y, x + *width, y + *height};
    return applyTransform(
        local, attributeValue(rectElement, "transform").value_or(""));
  }

  return std::nullopt;
}

ClipBounds resolveClipChain(const ClipChain &chain) {
  ClipBounds bounds;

  for (const auto &primitive : chain) {
    auto level = resolveClipPrimitive(primitive);
    if (!level) {
      continue;
    }

    if (bounds.state == ClipBounds::NONE) {
      bounds.state = ClipBounds::REGION;
      bounds.region = *level;
      continue;
    }

    auto shared = intersect(bounds.region, *level);
    if (!shared) {
      bounds.state = ClipBounds::EMPTY;
      bounds.region = BBox();
      return bounds;
    }
    bounds.region = *shared;
  }

  return bounds;
}

bool isPageLevelClip(const std::optional<BBox> &bbox, double pageWidth,
                     double pageHeight, double ratio) {
  if (!bbox || pageWidth <= 0.0 || pageHeight <= 0.0) {
    return false;
  }

  BBox page{0.0, 0.0, pageWidth, pageHeight};
  auto visible = intersect(*bbox, page);
  if (!visible) {
    return false;
  }

  double visibleArea = visible->area();
  if (visibleArea <= 0.0) {
    return false;
  }
  return visibleArea >= ratio * page.area();
}

} // namespace pix
