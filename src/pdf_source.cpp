#include "pdf_source.hpp"

#include <opencv2/imgcodecs.hpp>

#include <cstdio>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pdfclassify {

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

void requireCommand(const std::string& command) {
  if (!commandExists(command)) {
    throw std::runtime_error(
      command + " not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }
}

std::string shellQuote(const std::string& s) {
  std::string out = "'";
  for (char ch : s) {
    if (ch == '\'') out += "'\\''";
    else out += ch;
  }
  out += "'";
  return out;
}

std::string runCaptureStdout(const std::string& cmd, const std::string& tool) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw std::runtime_error("Failed to open pipe to " + tool);
  }

  std::string output;
  char buffer[8192];
  while (true) {
    size_t n = std::fread(buffer, 1, sizeof(buffer), pipe);
    if (n > 0) output.append(buffer, n);
    if (n < sizeof(buffer)) break;
  }

  int rc = pclose(pipe);
  if (rc != 0) {
    throw std::runtime_error(tool + " returned non-zero exit code");
  }
  return output;
}

} // namespace

PageInfo parsePdfInfo(const std::string& pdfinfoOutput) {
  PageInfo info;
  bool havePages = false;
  int rotation = 0;

  std::regex pagesRe("^Pages:\\s+([0-9]+)\\s*$");
  std::regex sizeRe("^Page(?:\\s+1)? size:\\s+([0-9.]+) x ([0-9.]+).*$");
  std::regex rotRe("^Page(?:\\s+1)? rot:\\s+([0-9]+)\\s*$");
  std::regex lineBreak("\r?\n");

  std::sregex_token_iterator it(pdfinfoOutput.begin(), pdfinfoOutput.end(), lineBreak, -1);
  std::sregex_token_iterator end;
  for (; it != end; ++it) {
    std::string line = *it;
    std::smatch m;
    if (std::regex_match(line, m, pagesRe)) {
      info.pageCount = std::stoi(m[1].str());
      havePages = true;
    } else if (std::regex_match(line, m, sizeRe)) {
      info.widthPt = std::stod(m[1].str());
      info.heightPt = std::stod(m[2].str());
    } else if (std::regex_match(line, m, rotRe)) {
      rotation = std::stoi(m[1].str());
    }
  }

  if (!havePages) {
    throw std::runtime_error("pdfinfo output has no page count");
  }
  if (rotation % 180 == 90) std::swap(info.widthPt, info.heightPt);
  return info;
}

PageInfo PopplerUtilsSource::inspect(const std::string& pdfPath) {
  requireCommand("pdfinfo");
  return parsePdfInfo(runCaptureStdout("pdfinfo " + shellQuote(pdfPath) + " 2>/dev/null", "pdfinfo"));
}

std::string PopplerUtilsSource::extractPageText(const std::string& pdfPath, int page) {
  requireCommand("pdftotext");
  std::string cmd = "pdftotext -f " + std::to_string(page) + " -l " + std::to_string(page) +
                    " -enc UTF-8 -nopgbrk -q " + shellQuote(pdfPath) + " -";
  return runCaptureStdout(cmd, "pdftotext");
}

cv::Mat PopplerUtilsSource::renderPageGray(const std::string& pdfPath, int page, int dpi) {
  requireCommand("pdftoppm");
  std::string cmd = "pdftoppm -f " + std::to_string(page) + " -l " + std::to_string(page) +
                    " -r " + std::to_string(dpi) + " -gray -singlefile -q " + shellQuote(pdfPath) + " -";
  std::string pgm = runCaptureStdout(cmd, "pdftoppm");
  if (pgm.empty()) {
    throw std::runtime_error("pdftoppm produced no image for page " + std::to_string(page));
  }

  std::vector<uchar> bytes(pgm.begin(), pgm.end());
  cv::Mat gray = cv::imdecode(bytes, cv::IMREAD_GRAYSCALE);
  if (gray.empty()) {
    throw std::runtime_error("Failed to decode pdftoppm output");
  }
  return gray;
}

} // namespace pdfclassify
