#include "PageExtractor.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

constexpr int kBarWidth = 30;

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_path> [options]\n"
      << "\nOptions:\n"
      << "  -s, --start <page>      First page to extract (default: 1)\n"
      << "  -e, --end <page>        Last page to extract (default: last)\n"
      << "  -o, --output <dir>      Output root (default: $BOOKS_ROOT or "
         "books)\n"
      << "  -m, --min-size <pt>     Minimum image size in points (default: "
         "20)\n"
      << "  -v, --verbose           Print diagnostics\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " book.pdf\n"
      << "  " << programName << " book.pdf -s 10 -e 20 -o out\n";
}

void drawProgress(const pix::ProgressEvent &event) {
  int filled = event.totalPages > 0
                   ? event.page * kBarWidth / event.totalPages
                   : kBarWidth;

  std::string bar;
  for (int i = 0; i < kBarWidth; i++) {
    bar += i < filled ? "█" : "░";
  }

  std::cerr << "\r" << event.label << "  " << bar << "  " << event.page << "/"
            << event.totalPages << " pages" << std::flush;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string pdfPath;
  pix::ExtractionConfig config;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    try {
      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-s" || arg == "--start") {
        if (i + 1 < argc) {
          config.startPage = std::stoi(argv[++i]);
        } else {
          std::cerr << "Error: --start requires an argument\n";
          return 1;
        }
      } else if (arg == "-e" || arg == "--end") {
        if (i + 1 < argc) {
          config.endPage = std::stoi(argv[++i]);
        } else {
          std::cerr << "Error: --end requires an argument\n";
          return 1;
        }
      } else if (arg == "-o" || arg == "--output") {
        if (i + 1 < argc) {
          config.outputRoot = argv[++i];
        } else {
          std::cerr << "Error: --output requires an argument\n";
          return 1;
        }
      } else if (arg == "-m" || arg == "--min-size") {
        if (i + 1 < argc) {
          config.minVectorDimension = std::stod(argv[++i]);
        } else {
          std::cerr << "Error: --min-size requires an argument\n";
          return 1;
        }
      } else if (arg == "-v" || arg == "--verbose") {
        config.verbose = true;
      } else if (arg[0] != '-') {
        pdfPath = arg;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    } catch (const std::exception &) {
      std::cerr << "Error: invalid value for " << arg << "\n";
      return 1;
    }
  }

  if (pdfPath.empty()) {
    std::cerr << "Error: No PDF path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  pix::ProgressListener listener;
  bool barShown = false;
  listener.onPage = [&barShown](const pix::ProgressEvent &event) {
    drawProgress(event);
    barShown = true;
  };
  listener.onComplete = []() { std::cerr << "  ✔\n"; };
  listener.onError = [&barShown](const std::string &message) {
    if (barShown) {
      std::cerr << "  ✘\n";
    }
    std::cerr << "Error: " << message << "\n";
  };

  pix::PageExtractor extractor(config);
  pix::ExtractionResult result = extractor.extractDocument(pdfPath, listener);

  if (!result.success) {
    return 1;
  }

  std::size_t imageCount = 0;
  for (const auto &page : result.pages) {
    imageCount += page.images.size();
  }
  std::cout << "Extracted " << result.pages.size() << " pages and "
            << imageCount << " images to "
            << extractor.pagesDirectory(result.label).string() << " in "
            << static_cast<long>(result.processingTimeMs) << " ms\n";

  return 0;
}
