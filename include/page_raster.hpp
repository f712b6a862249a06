#pragma once

#include "detection_cache.hpp"
#include "pdf_source.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace pdfclassify {

// Grayscale raster of page 1. Served from `cache` when present (pass nullptr to
// bypass it); otherwise rendered through `pdf` and stored. Rendering errors
// propagate as std::runtime_error.
cv::Mat renderFirstPage(const std::string& pdfPath, PdfSource& pdf, int dpi, DetectionCache* cache);

// Pixel rectangle of a normalized bbox, truncated like int(size * fraction) and clipped.
cv::Rect normalizedRect(const BBoxNorm& bbox, cv::Size size);

// Contrast-limited adaptive equalization, then a 3x3 Gaussian blur.
cv::Mat preprocessPage(const cv::Mat& gray);

// Preprocessed page 1, cached separately from the raw raster it is derived from.
cv::Mat renderAndPreprocess(const std::string& pdfPath, PdfSource& pdf, int dpi, DetectionCache* cache);

} // namespace pdfclassify
