#include "PageExtractor.hpp"
#include "PdfSource.hpp"
#include "ShapeCollector.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <thread>
#include <utility>

#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace pix {

namespace {

using DigestContextPtr =
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Input per base64 chunk; a multiple of 3 so chunks need no padding
constexpr std::size_t kHashChunk = 3 * 4096;
constexpr std::size_t kHashDigits = 16;

template <typename Bytes>
void writeFile(const fs::path &path, const Bytes &bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw ExtractionError("Cannot create " + path.string());
  }
  auto end =
      std::copy(bytes.begin(), bytes.end(), std::ostreambuf_iterator<char>(out));
  if (end.failed() || !out.flush()) {
    throw ExtractionError("Cannot write " + path.string());
  }
}

ExtractedImage makeImage(const PageRecord &record, int imageIndex, int width,
                         int height, std::vector<unsigned char> pngBytes) {
  ExtractedImage image;
  image.imageId = formatImageId(record.pageNumber, imageIndex);
  image.pageId = record.pageId;
  image.widthPx = width;
  image.heightPx = height;
  image.hash = contentHash(pngBytes);
  image.pngBytes = std::move(pngBytes);
  return image;
}

} // anonymous namespace

std::string defaultOutputRoot() {
  const char *root = std::getenv("BOOKS_ROOT");
  if (root && *root) {
    return root;
  }
  return "books";
}

std::string slugFromPath(const std::string &pdfPath) {
  std::string stem = fs::path(pdfPath).stem().string();

  std::string slug;
  bool pendingDash = false;
  for (char ch : stem) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (std::isalnum(c)) {
      if (pendingDash && !slug.empty()) {
        slug += '-';
      }
      pendingDash = false;
      slug += static_cast<char>(std::tolower(c));
    } else {
      pendingDash = true;
    }
  }

  if (slug.empty()) {
    return "document";
  }
  return slug;
}

std::string contentHash(const std::vector<unsigned char> &bytes) {
  DigestContextPtr context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
    throw ExtractionError("Cannot initialize SHA-256");
  }

  std::vector<unsigned char> encoded(4 * (kHashChunk / 3) + 1);
  for (std::size_t offset = 0; offset < bytes.size(); offset += kHashChunk) {
    std::size_t length = std::min(kHashChunk, bytes.size() - offset);
    int written = EVP_EncodeBlock(encoded.data(), bytes.data() + offset,
                                  static_cast<int>(length));
    if (EVP_DigestUpdate(context.get(), encoded.data(),
                         static_cast<std::size_t>(written)) != 1) {
      throw ExtractionError("Cannot update SHA-256");
    }
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLength = 0;
  if (EVP_DigestFinal_ex(context.get(), digest, &digestLength) != 1) {
    throw ExtractionError("Cannot finish SHA-256");
  }

  static const char kHexDigits[] = "0123456789abcdef";
  std::string hex;
  for (unsigned int i = 0; i < digestLength && hex.size() < kHashDigits; i++) {
    hex += kHexDigits[digest[i] >> 4];
    hex += kHexDigits[digest[i] & 0x0f];
  }
  return hex;
}

std::string formatPageId(int pageNumber) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "pg%03d", pageNumber);
  return buffer;
}

std::string formatImageId(int pageNumber, int imageIndex) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "_im%03d", imageIndex);
  return formatPageId(pageNumber) + buffer;
}

PageExtractor::PageExtractor(const ExtractionConfig &config)
    : m_config(config) {}

ExtractionResult
PageExtractor::extractDocument(const std::string &pdfPath,
                               const ProgressListener &listener,
                               const std::atomic<bool> *cancel) const {
  auto startTime = std::chrono::high_resolution_clock::now();

  ExtractionResult result;
  result.label = slugFromPath(pdfPath);

  try {
    std::unique_ptr<PdfDocument> document = PdfDocument::open(pdfPath);
    result.totalPagesInPdf = document->pageCount();

    int firstPage = std::max(1, m_config.startPage);
    int lastPage = result.totalPagesInPdf;
    if (m_config.endPage > 0) {
      lastPage = std::min(m_config.endPage, lastPage);
    }
    if (firstPage > lastPage) {
      throw ExtractionError("Page range " + std::to_string(m_config.startPage) +
                            "-" + std::to_string(m_config.endPage) +
                            " is outside the document (" +
                            std::to_string(result.totalPagesInPdf) + " pages)");
    }
    int totalPages = lastPage - firstPage + 1;

    if (m_config.verbose) {
      std::cerr << "DEBUG: Extracting pages " << firstPage << "-" << lastPage
                << " of " << result.totalPagesInPdf << " from " << pdfPath
                << std::endl;
    }

    for (int pageNumber = firstPage; pageNumber <= lastPage; pageNumber++) {
      std::this_thread::yield();
      if (cancel && cancel->load()) {
        throw ExtractionError("Extraction cancelled");
      }

      PdfPage page = document->loadPage(pageNumber - 1);
      PageRecord record = extractPage(page);
      if (m_config.writeOutputs) {
        writePageRecord(record, result.label);
      }
      result.pages.push_back(std::move(record));

      if (listener.onPage) {
        ProgressEvent event;
        event.page = pageNumber - firstPage + 1;
        event.totalPages = totalPages;
        event.label = result.label;
        listener.onPage(event);
      }
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.success = false;
    result.errorMessage = std::string("PDF extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  if (result.success) {
    if (listener.onComplete) {
      listener.onComplete();
    }
  } else if (listener.onError) {
    listener.onError(result.errorMessage);
  }

  return result;
}

PageRecord PageExtractor::extractPage(const PdfPage &page) const {
  PageRecord record;
  record.pageNumber = page.number();
  record.pageId = formatPageId(record.pageNumber);

  cv::Mat raster = page.renderToRaster(m_config.renderScale);
  record.pageImage =
      makeImage(record, 0, raster.cols, raster.rows, encodePng(raster));

  record.rawText = page.extractText();

  PageDrawing drawing = page.enumeratePaintOps(m_config.verbose);
  record.droppedImageCount = drawing.droppedImages;

  CollectorContext context;
  context.pageWidth = drawing.pageWidth;
  context.pageHeight = drawing.pageHeight;
  context.pageLevelClipRatio = m_config.pageLevelClipRatio;
  context.verbose = m_config.verbose;

  std::vector<ShapeCandidate> candidates = collectShapes(drawing, context);
  std::vector<ShapeGroup> groups = groupShapes(candidates, m_config.overlapMargin);
  std::size_t groupCount = groups.size();
  groups = filterGroups(std::move(groups), m_config.minVectorDimension);

  if (m_config.verbose) {
    std::cerr << "DEBUG: " << record.pageId << ": " << groupCount
              << " groups, " << groups.size() << " after filtering"
              << std::endl;
  }

  Compositor compositor(m_config.renderScale);
  int nextImageIndex = 1;
  for (const auto &group : groups) {
    PngImage png;
    try {
      png = compositor.composite(group, drawing);
    } catch (const std::exception &e) {
      std::cerr << "WARNING: " << record.pageId << ": skipping group at ("
                << group.bbox.minX << ", " << group.bbox.minY << "): "
                << e.what() << std::endl;
      continue;
    }

    record.images.push_back(makeImage(record, nextImageIndex++, png.width,
                                      png.height, std::move(png.bytes)));
  }

  return record;
}

fs::path PageExtractor::pagesDirectory(const std::string &label) const {
  return fs::path(m_config.outputRoot) / label / "extract" / "pages";
}

void PageExtractor::writePageRecord(const PageRecord &record,
                                    const std::string &label) const {
  fs::path pagesDir = pagesDirectory(label);
  fs::path pageDir = pagesDir / record.pageId;
  fs::path stagingDir = pagesDir / (record.pageId + ".tmp");
  fs::path previousDir = pagesDir / (record.pageId + ".old");

  try {
    fs::create_directories(pagesDir);
    fs::remove_all(stagingDir);
    fs::create_directories(stagingDir);

    writeFile(stagingDir / "page.png", record.pageImage.pngBytes);
    writeFile(stagingDir / "text.txt", record.rawText);

    if (!record.images.empty()) {
      fs::path imagesDir = stagingDir / "images";
      fs::create_directories(imagesDir);
      for (const auto &image : record.images) {
        writeFile(imagesDir / (image.imageId + ".png"), image.pngBytes);
      }
    }
  } catch (const ExtractionError &) {
    std::error_code ignored;
    fs::remove_all(stagingDir, ignored);
    throw;
  } catch (const fs::filesystem_error &e) {
    std::error_code ignored;
    fs::remove_all(stagingDir, ignored);
    throw ExtractionError(std::string("Cannot write page output: ") + e.what());
  }

  // The page directory is only ever missing between the two renames; a
  // failed swap puts the previous output back
  try {
    fs::remove_all(previousDir);
    if (fs::exists(pageDir)) {
      fs::rename(pageDir, previousDir);
    }
    try {
      fs::rename(stagingDir, pageDir);
    } catch (const fs::filesystem_error &) {
      std::error_code restoreError;
      if (fs::exists(previousDir, restoreError)) {
        fs::rename(previousDir, pageDir, restoreError);
      }
      throw;
    }
    fs::remove_all(previousDir);
  } catch (const fs::filesystem_error &e) {
    throw ExtractionError(std::string("Cannot replace page output: ") +
                          e.what());
  }

  if (m_config.verbose) {
    std::cerr << "DEBUG: Wrote " << pageDir.string() << " ("
              << record.images.size() << " images)" << std::endl;
  }
}

} // namespace pix
