#include "PdfSource.hpp"
#include "PaintOpRecorder.hpp"

#include <opencv2/imgproc.hpp>

#include <iostream>
#include <utility>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

// Poppler low-level API for paint operation recording
#include <Error.h>
#include <PDFDoc.h>
#include <goo/GooString.h>

namespace pix {

namespace {

// Poppler reports every recoverable syntax problem on stderr; broken drawing
// state is routine in real books and handled by the resolvers instead.
void quietPopplerErrors(ErrorCategory /*category*/, Goffset /*pos*/,
                        const char * /*msg*/) {}

} // anonymous namespace

PdfPage::PdfPage(PDFDoc *coreDoc, std::unique_ptr<poppler::page> page,
                 int pageNumber)
    : m_coreDoc(coreDoc), m_page(std::move(page)), m_pageNumber(pageNumber) {}

PdfPage::PdfPage(PdfPage &&other) noexcept
    : m_coreDoc(other.m_coreDoc), m_page(std::move(other.m_page)),
      m_pageNumber(other.m_pageNumber) {
  other.m_coreDoc = nullptr;
}

PdfPage &PdfPage::operator=(PdfPage &&other) noexcept {
  if (this != &other) {
    m_coreDoc = other.m_coreDoc;
    m_page = std::move(other.m_page);
    m_pageNumber = other.m_pageNumber;
    other.m_coreDoc = nullptr;
  }
  return *this;
}

PdfPage::~PdfPage() = default;

cv::Mat PdfPage::renderToRaster(double scale) const {
  if (!m_page) {
    throw ExtractionError("Page " + std::to_string(m_pageNumber) +
                          " is not loaded");
  }

  // Create page renderer with antialiasing
  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  double dpi = 72.0 * scale;
  poppler::image popplerImage = renderer.render_page(m_page.get(), dpi, dpi);

  if (!popplerImage.is_valid()) {
    throw ExtractionError("Failed to render page " +
                          std::to_string(m_pageNumber));
  }

  int width = popplerImage.width();
  int height = popplerImage.height();

  // ARGB32 is BGRA in memory on little-endian machines
  cv::Mat mat = cv::Mat(height, width, CV_8UC4,
                        const_cast<char *>(popplerImage.const_data()),
                        popplerImage.bytes_per_row())
                    .clone();
  cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
  return mat;
}

std::string PdfPage::extractText() const {
  if (!m_page) {
    return std::string();
  }
  poppler::byte_array textBytes = m_page->text().to_utf8();
  return std::string(textBytes.begin(), textBytes.end());
}

PageDrawing PdfPage::enumeratePaintOps(bool verbose) const {
  PaintOpRecorder recorder(verbose);
  if (!m_coreDoc) {
    return recorder.takeDrawing();
  }

  // Same page box and crop as poppler::page_renderer so the recorded
  // geometry lines up with the rendered raster
  m_coreDoc->displayPage(&recorder, m_pageNumber, 72.0, 72.0,
                         0,      // rotation
                         false,  // useMediaBox
                         true,   // crop
                         false); // printing

  if (recorder.droppedImageCount() > 0) {
    std::cerr << "WARNING: Dropped " << recorder.droppedImageCount()
              << " undecodable image(s) on page " << m_pageNumber
              << std::endl;
  }
  return recorder.takeDrawing();
}

PdfDocument::PdfDocument() : m_globalParams(quietPopplerErrors) {}

PdfDocument::~PdfDocument() = default;

std::unique_ptr<PdfDocument> PdfDocument::open(const std::string &pdfPath) {
  std::unique_ptr<PdfDocument> pdf(new PdfDocument());

  pdf->m_document.reset(poppler::document::load_from_file(pdfPath));
  if (!pdf->m_document) {
    throw ExtractionError("Failed to load PDF file: " + pdfPath);
  }

  if (pdf->m_document->is_locked()) {
    throw ExtractionError("PDF file is password protected: " + pdfPath);
  }

  auto fileName = std::make_unique<GooString>(pdfPath);
  pdf->m_coreDoc.reset(new PDFDoc(std::move(fileName)));
  if (!pdf->m_coreDoc->isOk()) {
    throw ExtractionError("Failed to load PDF file: " + pdfPath);
  }

  if (pdf->pageCount() < 1) {
    throw ExtractionError("PDF has no pages");
  }

  return pdf;
}

int PdfDocument::pageCount() const { return m_document->pages(); }

PdfPage PdfDocument::loadPage(int pageIndex) const {
  if (pageIndex < 0 || pageIndex >= pageCount()) {
    throw ExtractionError("Page index " + std::to_string(pageIndex) +
                          " is out of range");
  }

  std::unique_ptr<poppler::page> page(m_document->create_page(pageIndex));
  if (!page) {
    throw ExtractionError("Failed to create page " +
                          std::to_string(pageIndex + 1));
  }

  return PdfPage(m_coreDoc.get(), std::move(page), pageIndex + 1);
}

} // namespace pix
