#include <catch2/catch_all.hpp>

#include "image_hash.hpp"

#include <opencv2/core.hpp>

#include <stdexcept>
#include <string>

using namespace pdfclassify;

namespace {

cv::Mat halfBlackHalfWhite(int side) {
  cv::Mat img(side, side, CV_8UC1, cv::Scalar(255));
  img(cv::Rect(0, 0, side / 2, side)).setTo(cv::Scalar(0));
  return img;
}

cv::Mat horizontalRamp(int width, int height) {
  cv::Mat img(height, width, CV_8UC1);
  for (int r = 0; r < height; ++r) {
    for (int c = 0; c < width; ++c) img.at<uchar>(r, c) = static_cast<uchar>(c * 3);
  }
  return img;
}

// Deterministic texture with no ties near any hash threshold.
cv::Mat texture(int rows, int cols, int a, int b, int k, int m) {
  cv::Mat img(rows, cols, CV_8UC1);
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      img.at<uchar>(r, c) = static_cast<uchar>((r * a + c * b + r * c * k + r * r * 7) % m);
    }
  }
  return img;
}

} // namespace

TEST_CASE("hex form is most significant bit first", "[hash]") {
  auto hash = ImageHash::fromHex("80");
  REQUIRE(hash);
  REQUIRE(hash->size() == 8);
  REQUIRE(hash->bits()[0]);
  for (size_t i = 1; i < 8; ++i) REQUIRE_FALSE(hash->bits()[i]);

  auto mixed = ImageHash::fromHex("ABcd");
  REQUIRE(mixed);
  REQUIRE(mixed->toHex() == "abcd");
}

TEST_CASE("malformed hex is rejected", "[hash]") {
  REQUIRE_FALSE(ImageHash::fromHex(""));
  REQUIRE_FALSE(ImageHash::fromHex("12g4"));
  REQUIRE_FALSE(ImageHash::fromHex("0x12"));
}

TEST_CASE("distance counts differing bits and needs equal widths", "[hash]") {
  ImageHash a = *ImageHash::fromHex("00");
  ImageHash b = *ImageHash::fromHex("0f");
  REQUIRE(a.distance(b) == 4);
  REQUIRE(a.distance(a) == 0);
  REQUIRE_THROWS_AS(a.distance(*ImageHash::fromHex("0000")), std::invalid_argument);
}

TEST_CASE("average and wavelet hash of a split image", "[hash]") {
  cv::Mat img = halfBlackHalfWhite(64);
  REQUIRE(averageHash(img).toHex() == "0f0f0f0f0f0f0f0f");
  REQUIRE(waveletHash(img).toHex() == "0f0f0f0f0f0f0f0f");
}

TEST_CASE("difference hash of a brightening ramp sets every bit", "[hash]") {
  REQUIRE(differenceHash(horizontalRamp(72, 64)).toHex() == "ffffffffffffffff");
}

TEST_CASE("perceptual hash width follows hash size", "[hash]") {
  cv::Mat img = halfBlackHalfWhite(128);
  ImageHash h16 = perceptualHash(img, 16);
  ImageHash h8 = perceptualHash(img, 8);
  REQUIRE(h16.size() == 256);
  REQUIRE(h8.size() == 64);
  REQUIRE(perceptualHash(img.clone(), 16) == h16);

  cv::Mat other(128, 128, CV_8UC1, cv::Scalar(255));
  other(cv::Rect(0, 0, 64, 64)).setTo(cv::Scalar(0));
  other(cv::Rect(64, 64, 64, 64)).setTo(cv::Scalar(0));
  REQUIRE(perceptualHash(other, 16).distance(h16) > 0);
}

TEST_CASE("hash size is recovered from a square bit count", "[hash]") {
  REQUIRE(hashSizeForBits(64) == 8);
  REQUIRE(hashSizeForBits(256) == 16);
  REQUIRE_FALSE(hashSizeForBits(60));
  REQUIRE_FALSE(hashSizeForBits(1));
  REQUIRE(defaultHashSize(HashKind::Perceptual) == 16);
  REQUIRE(defaultHashSize(HashKind::Wavelet) == 8);
}

TEST_CASE("hashing rejects colour and empty input", "[hash]") {
  REQUIRE_THROWS_AS(averageHash(cv::Mat()), std::invalid_argument);
  REQUIRE_THROWS_AS(averageHash(cv::Mat(16, 16, CV_8UC3, cv::Scalar(0, 0, 0))), std::invalid_argument);
}

// Reference values from the imagehash algorithms applied to images already at
// the working size, where no resampling happens.
TEST_CASE("hashes at working size match reference values", "[hash]") {
  cv::Mat small = texture(8, 8, 37, 91, 13, 251);
  REQUIRE(averageHash(small).toHex() == "254a55aa542ddb33");
  REQUIRE(waveletHash(small).toHex() == "254a55aa562ddb33");

  REQUIRE(differenceHash(texture(8, 9, 29, 53, 11, 241)).toHex() == "f7eddbad5aab55a9");

  REQUIRE(perceptualHash(texture(64, 64, 37, 91, 13, 251), 16).toHex() ==
          "ecbaabaeba4350ea835f0441d36d52514c92abf77ce1ab0e4599745ed36e04e0");
  REQUIRE(perceptualHash(texture(32, 32, 37, 91, 13, 251), 8).toHex() == "fe610e05ddf0528b");
}
