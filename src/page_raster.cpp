#include "page_raster.hpp"

#include <opencv2/imgproc.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace pdfclassify {

namespace {

std::string purposeTag(const char* what, int dpi) {
  return std::string(what) + "@" + std::to_string(dpi);
}

} // namespace

cv::Mat renderFirstPage(const std::string& pdfPath, PdfSource& pdf, int dpi, DetectionCache* cache) {
  CacheKey key = CacheKey::forFile(pdfPath, purposeTag("raster", dpi));
  if (cache) {
    cv::Mat cached = cache->raster(key);
    if (!cached.empty()) return cached;
  }

  cv::Mat gray = pdf.renderPageGray(pdfPath, 1, dpi);
  if (gray.empty()) {
    throw std::runtime_error("renderer returned an empty image");
  }
  if (gray.channels() != 1) {
    cv::Mat converted;
    cv::cvtColor(gray, converted, gray.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    gray = converted;
  }
  spdlog::debug("Rendered {} at {} dpi: {}x{}", pdfPath, dpi, gray.cols, gray.rows);

  if (cache) cache->storeRaster(key, gray);
  return gray;
}

cv::Rect normalizedRect(const BBoxNorm& bbox, cv::Size size) {
  int x0 = std::clamp(static_cast<int>(size.width * bbox[0]), 0, size.width);
  int y0 = std::clamp(static_cast<int>(size.height * bbox[1]), 0, size.height);
  int x1 = std::clamp(static_cast<int>(size.width * bbox[2]), 0, size.width);
  int y1 = std::clamp(static_cast<int>(size.height * bbox[3]), 0, size.height);
  return cv::Rect(x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0));
}

cv::Mat preprocessPage(const cv::Mat& gray) {
  cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(2.0, cv::Size(8, 8));
  cv::Mat equalized;
  clahe->apply(gray, equalized);

  cv::Mat blurred;
  cv::GaussianBlur(equalized, blurred, cv::Size(3, 3), 0);
  return blurred;
}

cv::Mat renderAndPreprocess(const std::string& pdfPath, PdfSource& pdf, int dpi, DetectionCache* cache) {
  CacheKey key = CacheKey::forFile(pdfPath, purposeTag("preprocessed", dpi));
  if (cache) {
    cv::Mat cached = cache->raster(key);
    if (!cached.empty()) return cached;
  }

  cv::Mat processed = preprocessPage(renderFirstPage(pdfPath, pdf, dpi, cache));
  if (cache) cache->storeRaster(key, processed);
  return processed;
}

} // namespace pdfclassify
