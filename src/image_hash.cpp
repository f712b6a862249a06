#include "image_hash.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdfclassify {

namespace {

int hexValue(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
  return -1;
}

double median(std::vector<double> v) {
  if (v.empty()) return 0.0;
  size_t mid = v.size() / 2;
  std::nth_element(v.begin(), v.begin() + mid, v.end());
  double upper = v[mid];
  if (v.size() % 2 == 1) return upper;
  double lower = *std::max_element(v.begin(), v.begin() + mid);
  return (lower + upper) * 0.5;
}

std::vector<double> toValues(const cv::Mat& m) {
  cv::Mat d;
  m.convertTo(d, CV_64F);
  std::vector<double> values;
  values.reserve(d.total());
  for (int r = 0; r < d.rows; ++r) {
    const double* row = d.ptr<double>(r);
    values.insert(values.end(), row, row + d.cols);
  }
  return values;
}

std::vector<bool> aboveThreshold(const std::vector<double>& values, double threshold) {
  std::vector<bool> bits(values.size());
  for (size_t i = 0; i < values.size(); ++i) bits[i] = values[i] > threshold;
  return bits;
}

void requireGray(const cv::Mat& gray) {
  if (gray.empty() || gray.channels() != 1) {
    throw std::invalid_argument("hash input must be a non-empty single channel image");
  }
}

} // namespace

std::optional<ImageHash> ImageHash::fromHex(const std::string& hex) {
  if (hex.empty()) return std::nullopt;
  std::vector<bool> bits;
  bits.reserve(hex.size() * 4);
  for (char ch : hex) {
    int v = hexValue(ch);
    if (v < 0) return std::nullopt;
    for (int b = 3; b >= 0; --b) bits.push_back(((v >> b) & 1) != 0);
  }
  return ImageHash(std::move(bits));
}

std::string ImageHash::toHex() const {
  static const char* digits = "0123456789abcdef";
  std::string out;
  // Left-pad so the bit count is a multiple of four.
  size_t pad = (4 - bits_.size() % 4) % 4;
  int acc = 0;
  int n = static_cast<int>(pad);
  for (bool bit : bits_) {
    acc = (acc << 1) | (bit ? 1 : 0);
    if (++n == 4) {
      out.push_back(digits[acc]);
      acc = 0;
      n = 0;
    }
  }
  return out;
}

int ImageHash::distance(const ImageHash& other) const {
  if (bits_.size() != other.bits_.size()) {
    throw std::invalid_argument("cannot compare hashes of different widths");
  }
  int d = 0;
  for (size_t i = 0; i < bits_.size(); ++i) {
    if (bits_[i] != other.bits_[i]) d++;
  }
  return d;
}

cv::Mat resizeGray(const cv::Mat& gray, cv::Size size) {
  bool shrinking = size.width <= gray.cols && size.height <= gray.rows;
  cv::Mat out;
  cv::resize(gray, out, size, 0, 0, shrinking ? cv::INTER_AREA : cv::INTER_LANCZOS4);
  return out;
}

ImageHash perceptualHash(const cv::Mat& gray, int hashSize) {
  requireGray(gray);
  const int imgSize = hashSize * 4;
  cv::Mat small = resizeGray(gray, cv::Size(imgSize, imgSize));
  cv::Mat pixels;
  small.convertTo(pixels, CV_64F);

  cv::Mat coeffs;
  cv::dct(pixels, coeffs);
  // cv::dct is orthonormal; stored signatures use the unnormalized DCT-II,
  // whose first row and column are sqrt(2) larger relative to the rest.
  cv::Mat firstRow = coeffs.row(0);
  cv::Mat firstCol = coeffs.col(0);
  firstRow *= std::sqrt(2.0);
  firstCol *= std::sqrt(2.0);

  std::vector<double> low = toValues(coeffs(cv::Rect(0, 0, hashSize, hashSize)));
  return ImageHash(aboveThreshold(low, median(low)));
}

ImageHash differenceHash(const cv::Mat& gray, int hashSize) {
  requireGray(gray);
  cv::Mat small = resizeGray(gray, cv::Size(hashSize + 1, hashSize));
  std::vector<bool> bits;
  bits.reserve(static_cast<size_t>(hashSize) * hashSize);
  for (int r = 0; r < small.rows; ++r) {
    const uchar* row = small.ptr<uchar>(r);
    for (int c = 0; c < hashSize; ++c) bits.push_back(row[c + 1] > row[c]);
  }
  return ImageHash(std::move(bits));
}

ImageHash averageHash(const cv::Mat& gray, int hashSize) {
  requireGray(gray);
  cv::Mat small = resizeGray(gray, cv::Size(hashSize, hashSize));
  std::vector<double> values = toValues(small);
  double mean = cv::mean(small)[0];
  return ImageHash(aboveThreshold(values, mean));
}

ImageHash waveletHash(const cv::Mat& gray, int hashSize) {
  requireGray(gray);
  // Work on the largest power-of-two square that fits, as a Haar pyramid needs.
  int side = 1;
  while (side * 2 <= std::min(gray.cols, gray.rows)) side *= 2;
  side = std::max(side, hashSize);
  cv::Mat square = resizeGray(gray, cv::Size(side, side));

  // The Haar low band at the hash level is the block mean up to a constant,
  // and removing the top-level LL coefficient subtracts the global mean; neither
  // changes a comparison against the median.
  cv::Mat lowBand;
  cv::resize(square, lowBand, cv::Size(hashSize, hashSize), 0, 0, cv::INTER_AREA);
  std::vector<double> values = toValues(lowBand);
  return ImageHash(aboveThreshold(values, median(values)));
}

ImageHash computeHash(HashKind kind, const cv::Mat& gray, int hashSize) {
  switch (kind) {
    case HashKind::Perceptual: return perceptualHash(gray, hashSize);
    case HashKind::Difference: return differenceHash(gray, hashSize);
    case HashKind::Average: return averageHash(gray, hashSize);
    case HashKind::Wavelet: return waveletHash(gray, hashSize);
  }
  throw std::invalid_argument("unknown hash kind");
}

int defaultHashSize(HashKind kind) {
  return kind == HashKind::Perceptual ? 16 : 8;
}

std::optional<int> hashSizeForBits(size_t bitCount) {
  int side = static_cast<int>(std::lround(std::sqrt(static_cast<double>(bitCount))));
  if (side < 2 || static_cast<size_t>(side) * side != bitCount) return std::nullopt;
  return side;
}

const char* hashKindName(HashKind kind) {
  switch (kind) {
    case HashKind::Perceptual: return "phash";
    case HashKind::Difference: return "dhash";
    case HashKind::Average: return "ahash";
    case HashKind::Wavelet: return "whash";
  }
  return "unknown";
}

} // namespace pdfclassify
