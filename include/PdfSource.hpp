#ifndef PIX_PDF_SOURCE_HPP
#define PIX_PDF_SOURCE_HPP

#include "PaintOps.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <stdexcept>
#include <string>

#include <GlobalParams.h>

class PDFDoc;

namespace poppler {
class document;
class page;
} // namespace poppler

namespace pix {

/**
 * @brief Error that aborts a whole document extraction
 *
 * Raised when the input is not a usable PDF or a page cannot be rendered.
 */
class ExtractionError : public std::runtime_error {
public:
  explicit ExtractionError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief One page of an open PdfDocument
 *
 * Pages borrow the document; they must not outlive it.
 */
class PdfPage {
public:
  PdfPage(PdfPage &&other) noexcept;
  PdfPage &operator=(PdfPage &&other) noexcept;
  ~PdfPage();

  PdfPage(const PdfPage &) = delete;
  PdfPage &operator=(const PdfPage &) = delete;

  /**
   * @brief 1-indexed page number
   */
  int number() const { return m_pageNumber; }

  /**
   * @brief Render the page to an opaque raster
   * @param scale Pixels per point (2.0 renders at 144 DPI)
   * @return BGR image (CV_8UC3)
   * @throws ExtractionError if Poppler cannot render the page
   */
  cv::Mat renderToRaster(double scale) const;

  /**
   * @brief Extract the page text as UTF-8
   */
  std::string extractText() const;

  /**
   * @brief Interpret the page and record its paint operations
   * @param verbose Log each recorded image to stderr
   */
  PageDrawing enumeratePaintOps(bool verbose = false) const;

private:
  friend class PdfDocument;
  PdfPage(PDFDoc *coreDoc, std::unique_ptr<poppler::page> page,
          int pageNumber);

  PDFDoc *m_coreDoc; ///< Owned by the PdfDocument
  std::unique_ptr<poppler::page> m_page;
  int m_pageNumber;
};

/**
 * @brief An open PDF file
 *
 * Wraps both Poppler front ends: the C++ wrapper for rendering and text, and
 * the core PDFDoc for paint operation recording.
 *
 * Example usage:
 * @code
 * auto doc = pix::PdfDocument::open("book.pdf");
 * for (int i = 0; i < doc->pageCount(); i++) {
 *     pix::PdfPage page = doc->loadPage(i);
 *     cv::Mat raster = page.renderToRaster(2.0);
 * }
 * @endcode
 */
class PdfDocument {
public:
  /**
   * @brief Open a PDF file
   * @throws ExtractionError if the file is missing, not a PDF, password
   * protected or has no pages
   */
  static std::unique_ptr<PdfDocument> open(const std::string &pdfPath);

  ~PdfDocument();

  PdfDocument(const PdfDocument &) = delete;
  PdfDocument &operator=(const PdfDocument &) = delete;

  int pageCount() const;

  /**
   * @brief Load a page
   * @param pageIndex 0-indexed page
   * @throws ExtractionError if the index is out of range or the page is broken
   */
  PdfPage loadPage(int pageIndex) const;

private:
  PdfDocument();

  GlobalParamsIniter m_globalParams; ///< Must outlive m_coreDoc
  std::unique_ptr<poppler::document> m_document;
  std::unique_ptr<PDFDoc> m_coreDoc;
};

} // namespace pix

#endif // PIX_PDF_SOURCE_HPP
