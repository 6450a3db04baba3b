#include "PathGeometry.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace pix {

std::optional<BBox> intersect(const BBox &a, const BBox &b) {
  BBox result;
  result.minX = std::max(a.minX, b.minX);
  result.minY = std::max(a.minY, b.minY);
  result.maxX = std::min(a.maxX, b.maxX);
  result.maxY = std::min(a.maxY, b.maxY);

  if (result.minX > result.maxX || result.minY > result.maxY) {
    return std::nullopt;
  }
  return result;
}

BBox unite(const BBox &a, const BBox &b) {
  return {std::min(a.minX, b.minX), std::min(a.minY, b.minY),
          std::max(a.maxX, b.maxX), std::max(a.maxY, b.maxY)};
}

bool overlaps(const BBox &a, const BBox &b, double margin) {
  return !(a.maxX + margin < b.minX || b.maxX + margin < a.minX ||
           a.maxY + margin < b.minY || b.maxY + margin < a.minY);
}

bool nearlyEqual(const BBox &a, const BBox &b, double tolerance) {
  return std::abs(a.minX - b.minX) <= tolerance &&
         std::abs(a.minY - b.minY) <= tolerance &&
         std::abs(a.maxX - b.maxX) <= tolerance &&
         std::abs(a.maxY - b.maxY) <= tolerance;
}

namespace {

bool isCommandLetter(char c) {
  switch (c) {
  case 'M':
  case 'm':
  case 'L':
  case 'l':
  case 'H':
  case 'h':
  case 'V':
  case 'v':
  case 'C':
  case 'c':
  case 'Z':
  case 'z':
    return true;
  default:
    return false;
  }
}

bool startsNumber(const std::string &s, size_t pos) {
  char c = s[pos];
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return true;
  }
  if (c == '.' || c == '-' || c == '+') {
    return pos + 1 < s.size() &&
           (std::isdigit(static_cast<unsigned char>(s[pos + 1])) ||
            (c != '.' && s[pos + 1] == '.' && pos + 2 < s.size() &&
             std::isdigit(static_cast<unsigned char>(s[pos + 2]))));
  }
  return false;
}

// Reads [sign] digits [. digits] [e [sign] digits]. A second dot or a sign
// ends the number, which is how "0.5.5" and ".073-.195" split into two.
bool readNumber(const std::string &s, size_t &pos, double &value) {
  size_t start = pos;
  size_t i = pos;
  if (s[i] == '-' || s[i] == '+') {
    ++i;
  }

  bool digits = false;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
    ++i;
    digits = true;
  }
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      ++i;
      digits = true;
    }
  }
  if (!digits) {
    pos = start + 1;
    return false;
  }

  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    size_t j = i + 1;
    if (j < s.size() && (s[j] == '-' || s[j] == '+')) {
      ++j;
    }
    if (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) {
      while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) {
        ++j;
      }
      i = j;
    }
  }

  std::string token = s.substr(start, i - start);
  value = std::strtod(token.c_str(), nullptr);
  pos = i;
  return std::isfinite(value);
}

size_t arityOf(char command) {
  switch (std::toupper(static_cast<unsigned char>(command))) {
  case 'M':
  case 'L':
    return 2;
  case 'H':
  case 'V':
    return 1;
  case 'C':
    return 6;
  default:
    return 0;
  }
}

} // anonymous namespace

std::vector<PathCommand> parsePathCommands(const std::string &descriptor) {
  std::vector<PathCommand> commands;

  Point pen;
  Point subpathStart;
  char command = 0; // 0 = no command, or an unknown one whose args we drop
  std::vector<double> args;

  auto emit = [&]() {
    bool relative = std::islower(static_cast<unsigned char>(command)) != 0;
    double ox = relative ? pen.x : 0.0;
    double oy = relative ? pen.y : 0.0;

    switch (std::toupper(static_cast<unsigned char>(command))) {
    case 'M': {
      Point p{ox + args[0], oy + args[1]};
      commands.push_back({PathCommand::MOVE, {p}});
      pen = p;
      subpathStart = p;
      // Further pairs after a move are line-tos
      command = relative ? 'l' : 'L';
      break;
    }
    case 'L': {
      Point p{ox + args[0], oy + args[1]};
      commands.push_back({PathCommand::LINE, {p}});
      pen = p;
      break;
    }
    case 'H': {
      Point p{ox + args[0], pen.y};
      commands.push_back({PathCommand::LINE, {p}});
      pen = p;
      break;
    }
    case 'V': {
      Point p{pen.x, oy + args[0]};
      commands.push_back({PathCommand::LINE, {p}});
      pen = p;
      break;
    }
    case 'C': {
      Point c1{ox + args[0], oy + args[1]};
      Point c2{ox + args[2], oy + args[3]};
      Point end{ox + args[4], oy + args[5]};
      commands.push_back({PathCommand::CUBIC, {c1, c2, end}});
      pen = end;
      break;
    }
    default:
      break;
    }
    args.clear();
  };

  size_t pos = 0;
  while (pos < descriptor.size()) {
    char c = descriptor[pos];

    if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
      ++pos;
      continue;
    }

    if (isCommandLetter(c)) {
      command = c;
      args.clear();
      ++pos;
      if (c == 'Z' || c == 'z') {
        commands.push_back({PathCommand::CLOSE, {}});
        pen = subpathStart;
        command = 0;
      }
      continue;
    }

    if (startsNumber(descriptor, pos)) {
      double value = 0.0;
      if (!readNumber(descriptor, pos, value)) {
        continue;
      }
      size_t arity = arityOf(command);
      if (arity == 0) {
        continue;
      }
      args.push_back(value);
      if (args.size() == arity) {
        emit();
      }
      continue;
    }

    // Any other letter starts a command we do not understand
    if (std::isalpha(static_cast<unsigned char>(c))) {
      command = 0;
      args.clear();
    }
    ++pos;
  }

  return commands;
}

std::optional<BBox> resolvePathBbox(const std::string &descriptor) {
  if (descriptor.empty()) {
    return std::nullopt;
  }

  double minX = std::numeric_limits<double>::infinity();
  double minY = std::numeric_limits<double>::infinity();
  double maxX = -std::numeric_limits<double>::infinity();
  double maxY = -std::numeric_limits<double>::infinity();

  for (const auto &command : parsePathCommands(descriptor)) {
    for (const auto &p : command.points) {
      minX = std::min(minX, p.x);
      minY = std::min(minY, p.y);
      maxX = std::max(maxX, p.x);
      maxY = std::max(maxY, p.y);
    }
  }

  if (minX == std::numeric_limits<double>::infinity()) {
    return std::nullopt;
  }
  return BBox{minX, minY, maxX, maxY};
}

std::optional<AffineMatrix> parseMatrixTransform(const std::string &transform) {
  size_t open = transform.find("matrix(");
  if (open == std::string::npos) {
    return std::nullopt;
  }
  size_t close = transform.find(')', open);
  if (close == std::string::npos) {
    return std::nullopt;
  }

  std::string body = transform.substr(open + 7, close - open - 7);
  std::vector<double> values;
  size_t pos = 0;
  while (pos < body.size()) {
    char c = body[pos];
    if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
      ++pos;
      continue;
    }
    double value = 0.0;
    if (!startsNumber(body, pos) || !readNumber(body, pos, value)) {
      return std::nullopt;
    }
    values.push_back(value);
  }

  if (values.size() != 6) {
    return std::nullopt;
  }
  return AffineMatrix{values[0], values[1], values[2],
                      values[3], values[4], values[5]};
}

std::string formatMatrixTransform(const AffineMatrix &matrix) {
  std::ostringstream out;
  out.precision(12);
  out << "matrix(" << matrix.a << "," << matrix.b << "," << matrix.c << ","
      << matrix.d << "," << matrix.e << "," << matrix.f << ")";
  return out.str();
}

BBox applyTransform(const BBox &bbox, const AffineMatrix &matrix) {
  const Point corners[4] = {{bbox.minX, bbox.minY},
                            {bbox.maxX, bbox.minY},
                            {bbox.minX, bbox.maxY},
                            {bbox.maxX, bbox.maxY}};

  Point first = matrix.apply(corners[0]);
  BBox result{first.x, first.y, first.x, first.y};
  for (int i = 1; i < 4; i++) {
    Point p = matrix.apply(corners[i]);
    result.minX = std::min(result.minX, p.x);
    result.minY = std::min(result.minY, p.y);
    result.maxX = std::max(result.maxX, p.x);
    result.maxY = std::max(result.maxY, p.y);
  }
  return result;
}

BBox applyTransform(const BBox &bbox, const std::string &transform) {
  if (transform.empty()) {
    return bbox;
  }
  auto matrix = parseMatrixTransform(transform);
  if (!matrix) {
    return bbox;
  }
  return applyTransform(bbox, *matrix);
}

} // namespace pix
