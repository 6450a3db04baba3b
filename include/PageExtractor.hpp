#ifndef PIX_PAGE_EXTRACTOR_HPP
#define PIX_PAGE_EXTRACTOR_HPP

#include "ClipResolver.hpp"
#include "Compositor.hpp"
#include "ShapeGrouping.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace pix {

class PdfPage;

/**
 * @brief Output root used when none is configured
 *
 * Reads the BOOKS_ROOT environment variable, falling back to "books".
 */
std::string defaultOutputRoot();

/**
 * @brief Configuration for document extraction
 */
struct ExtractionConfig {
  std::string outputRoot = defaultOutputRoot(); ///< Root of the books tree
  double renderScale = kDefaultRenderScale;     ///< Pixels per point
  double minVectorDimension = kMinVectorDimension; ///< Noise threshold (pt)
  double pageLevelClipRatio = kPageLevelClipRatio; ///< Page-level coverage
  double overlapMargin = 0.0; ///< Extra grouping distance (pt)
  int startPage = 1;          ///< First page, 1-indexed inclusive
  int endPage = 0;            ///< Last page, inclusive; 0 means last page
  bool writeOutputs = true;   ///< Write page directories to outputRoot
  bool verbose = false;       ///< Print DEBUG diagnostics to stderr
};

/**
 * @brief One PNG produced for a page
 */
struct ExtractedImage {
  std::string imageId;   ///< pg{NNN}_im{MMM}
  std::string pageId;    ///< pg{NNN}
  int widthPx = 0;
  int heightPx = 0;
  std::vector<unsigned char> pngBytes;
  std::string hash;      ///< contentHash(pngBytes)
  bool isPruned = false; ///< Set by later review stages, never by extraction
};

/**
 * @brief Everything extracted from one page
 */
struct PageRecord {
  std::string pageId;
  int pageNumber = 0;                 ///< 1-indexed page in the PDF
  std::string rawText;                ///< UTF-8
  ExtractedImage pageImage;           ///< Full-page RGB raster, _im000
  std::vector<ExtractedImage> images; ///< RGBA groups in discovery order
  int droppedImageCount = 0;          ///< Embedded images that failed to decode
};

/**
 * @brief Progress notification, sent once per completed page
 */
struct ProgressEvent {
  int page = 0;       ///< 1..totalPages within the requested range
  int totalPages = 0; ///< Size of the requested range
  std::string label;  ///< Document label
};

/**
 * @brief Callbacks for extraction progress; unset callbacks are ignored
 *
 * Exactly one of onComplete or onError is called per extraction.
 */
struct ProgressListener {
  std::function<void(const ProgressEvent &)> onPage;
  std::function<void()> onComplete;
  std::function<void(const std::string &)> onError;
};

/**
 * @brief Result of extracting a document
 */
struct ExtractionResult {
  bool success = false;         ///< Whether every requested page was extracted
  std::string errorMessage;     ///< Error message if failed
  std::string label;            ///< Document label
  std::vector<PageRecord> pages; ///< Extracted pages in order
  int totalPagesInPdf = 0;      ///< Page count of the whole PDF
  double processingTimeMs = 0;  ///< Processing time in milliseconds
};

/**
 * @brief Document label derived from a PDF path
 *
 * Lower-cased file stem with runs of other characters collapsed to '-'.
 * Returns "document" if nothing usable remains.
 */
std::string slugFromPath(const std::string &pdfPath);

/**
 * @brief Content hash of encoded image bytes
 *
 * First 16 hex digits of the SHA-256 of the base64 text of the bytes, so
 * identical images share a hash across pages and runs.
 *
 * @throws ExtractionError if the digest cannot be computed
 */
std::string contentHash(const std::vector<unsigned char> &bytes);

/**
 * @brief Page identifier, e.g. pg007
 */
std::string formatPageId(int pageNumber);

/**
 * @brief Image identifier, e.g. pg007_im002; index 0 is the full page
 */
std::string formatImageId(int pageNumber, int imageIndex);

/**
 * @brief Sequences per-page extraction over a PDF document
 *
 * For every page: render the full-page raster, extract text, record paint
 * operations, collect and group shapes, drop decorative groups, composite
 * the rest and assign image ids. Pages run strictly in order.
 *
 * Example usage:
 * @code
 * pix::ExtractionConfig config;
 * config.startPage = 3;
 * pix::PageExtractor extractor(config);
 * pix::ExtractionResult result = extractor.extractDocument("book.pdf");
 * if (!result.success) {
 *     std::cerr << result.errorMessage << std::endl;
 * }
 * @endcode
 */
class PageExtractor {
public:
  explicit PageExtractor(const ExtractionConfig &config = ExtractionConfig());

  const ExtractionConfig &config() const { return m_config; }

  /**
   * @brief Extract the configured page range of a PDF
   *
   * Failures that make the document unusable (bad PDF, page render failure,
   * output write failure, cancellation) end the extraction; they are
   * reported through the result and listener.onError, never thrown.
   *
   * @param pdfPath Path to the PDF file
   * @param listener Progress callbacks
   * @param cancel Optional flag checked before each page
   */
  ExtractionResult extractDocument(const std::string &pdfPath,
                                   const ProgressListener &listener = {},
                                   const std::atomic<bool> *cancel = nullptr) const;

  /**
   * @brief Run the extraction pipeline on one page
   * @throws ExtractionError if the page cannot be rendered
   */
  PageRecord extractPage(const PdfPage &page) const;

  /**
   * @brief Directory holding the page directories of a document
   */
  std::filesystem::path pagesDirectory(const std::string &label) const;

  /**
   * @brief Write a page record below pagesDirectory(label)
   *
   * The page is written to a staging directory first, which then replaces
   * any previous output of the same page. If writing fails the previous
   * output is left as it was.
   *
   * @throws ExtractionError if a file cannot be written
   */
  void writePageRecord(const PageRecord &record, const std::string &label) const;

private:
  ExtractionConfig m_config;
};

} // namespace pix

#endif // PIX_PAGE_EXTRACTOR_HPP
