#pragma once

#include <opencv2/core.hpp>

#include <string>

namespace pdfclassify {

struct PageInfo {
  int pageCount = 0;
  double widthPt = 0.0;
  double heightPt = 0.0;
};

// Access to the handful of PDF operations the detectors need.
// Implementations throw std::runtime_error on any failure.
class PdfSource {
public:
  virtual ~PdfSource() = default;

  // Page count and the size of page 1 in points, rotation applied.
  virtual PageInfo inspect(const std::string& pdfPath) = 0;

  // UTF-8 text of a single 1-based page.
  virtual std::string extractPageText(const std::string& pdfPath, int page) = 0;

  // 8-bit single channel raster of a single 1-based page.
  virtual cv::Mat renderPageGray(const std::string& pdfPath, int page, int dpi) = 0;
};

// Drives pdfinfo, pdftotext and pdftoppm from poppler-utils through a pipe.
class PopplerUtilsSource : public PdfSource {
public:
  PageInfo inspect(const std::string& pdfPath) override;
  std::string extractPageText(const std::string& pdfPath, int page) override;
  cv::Mat renderPageGray(const std::string& pdfPath, int page, int dpi) override;
};

// Parses `pdfinfo` output. Throws std::runtime_error when the page count is missing.
PageInfo parsePdfInfo(const std::string& pdfinfoOutput);

} // namespace pdfclassify
