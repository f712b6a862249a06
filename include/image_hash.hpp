#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pdfclassify {

enum class HashKind { Perceptual, Difference, Average, Wavelet };

// Fixed-width bit fingerprint. Bits are kept row-major, most significant first,
// which is the order of the hexadecimal form stored in signature files.
class ImageHash {
public:
  ImageHash() = default;
  explicit ImageHash(std::vector<bool> bits) : bits_(std::move(bits)) {}

  // Accepts upper or lower case hex. Returns nullopt on an empty or non-hex string.
  static std::optional<ImageHash> fromHex(const std::string& hex);
  std::string toHex() const;

  size_t size() const { return bits_.size(); }
  bool empty() const { return bits_.empty(); }
  const std::vector<bool>& bits() const { return bits_; }

  // Throws std::invalid_argument when widths differ.
  int distance(const ImageHash& other) const;

  bool operator==(const ImageHash& other) const { return bits_ == other.bits_; }
  bool operator!=(const ImageHash& other) const { return bits_ != other.bits_; }

private:
  std::vector<bool> bits_;
};

// All hash functions take an 8-bit single channel image.
ImageHash perceptualHash(const cv::Mat& gray, int hashSize = 16);
ImageHash differenceHash(const cv::Mat& gray, int hashSize = 8);
ImageHash averageHash(const cv::Mat& gray, int hashSize = 8);
ImageHash waveletHash(const cv::Mat& gray, int hashSize = 8);

ImageHash computeHash(HashKind kind, const cv::Mat& gray, int hashSize);

// Default hash size for each kind, as used when building region fingerprints.
int defaultHashSize(HashKind kind);

// Every kind yields hashSize * hashSize bits; nullopt when `bitCount` is not a square.
std::optional<int> hashSizeForBits(size_t bitCount);

const char* hashKindName(HashKind kind);

// Area interpolation when shrinking, Lanczos when enlarging.
cv::Mat resizeGray(const cv::Mat& gray, cv::Size size);

} // namespace pdfclassify
