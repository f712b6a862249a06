#include "text_detector.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <regex>
#include <string>

namespace pdfclassify {

namespace {

// Decodes one code point at `i` and advances past it. Returns false for a
// byte that does not start a valid sequence; `i` then advances by one.
bool decodeCodePoint(const std::string& s, size_t& i, std::uint32_t& cp) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  int extra = 0;
  if (c < 0x80) { cp = c; i += 1; return true; }
  if (c >= 0xF0 && c < 0xF8) { extra = 3; cp = c & 0x07; }
  else if (c >= 0xE0 && c < 0xF0) { extra = 2; cp = c & 0x0F; }
  else if (c >= 0xC0 && c < 0xE0) { extra = 1; cp = c & 0x1F; }
  else { i += 1; return false; }

  if (i + extra >= s.size()) {
    i += 1;
    return false;
  }
  std::uint32_t value = cp;
  for (int k = 1; k <= extra; ++k) {
    unsigned char cc = static_cast<unsigned char>(s[i + k]);
    if ((cc & 0xC0) != 0x80) {
      i += 1;
      return false;
    }
    value = (value << 6) | (cc & 0x3F);
  }
  cp = value;
  i += extra + 1;
  return true;
}

void appendUtf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool isSpace(std::uint32_t cp) {
  switch (cp) {
    case ' ': case '\t': case '\n': case '\r': case '\v': case '\f':
    case 0x00A0: case 0x202F: case 0x205F: case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200B;
  }
}

bool isZeroWidth(std::uint32_t cp) {
  return cp == 0x200C || cp == 0x200D || cp == 0xFEFF;
}

std::uint32_t foldCodePoint(std::uint32_t cp) {
  if (cp >= 'A' && cp <= 'Z') return cp + ('a' - 'A');
  if (cp == 0x064A || cp == 0x0649) return 0x06CC;  // Arabic yeh, alef maksura -> Persian yeh
  if (cp == 0x0643) return 0x06A9;                  // Arabic kaf -> Persian kaf
  if (cp >= 0x06F0 && cp <= 0x06F9) return '0' + (cp - 0x06F0);
  if (cp >= 0x0660 && cp <= 0x0669) return '0' + (cp - 0x0660);
  return cp;
}

// One wchar_t per code point, so regex classes and '.' match letters, not
// bytes. Undecodable bytes become U+FFFD.
std::wstring toCodePoints(const std::string& utf8) {
  std::wstring out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size()) {
    std::uint32_t cp = 0;
    if (!decodeCodePoint(utf8, i, cp)) cp = 0xFFFD;
    out.push_back(static_cast<wchar_t>(cp));
  }
  return out;
}

} // namespace

static_assert(sizeof(wchar_t) >= 4, "exclusion patterns need wchar_t to hold a full code point");

std::string extractFirstPageText(const std::string& pdfPath, PdfSource& pdf) {
  try {
    return pdf.extractPageText(pdfPath, 1);
  } catch (const std::exception& ex) {
    spdlog::warn("Text extraction failed for {}: {}", pdfPath, ex.what());
    return std::string();
  }
}

std::string normalizeText(const std::string& utf8) {
  std::string out;
  out.reserve(utf8.size());
  bool pendingSpace = false;

  size_t i = 0;
  while (i < utf8.size()) {
    size_t start = i;
    std::uint32_t cp = 0;
    if (!decodeCodePoint(utf8, i, cp)) {
      if (pendingSpace && !out.empty()) out.push_back(' ');
      pendingSpace = false;
      out.push_back(utf8[start]);
      continue;
    }
    if (isZeroWidth(cp)) continue;
    if (isSpace(cp)) {
      pendingSpace = true;
      continue;
    }
    if (pendingSpace && !out.empty()) out.push_back(' ');
    pendingSpace = false;
    appendUtf8(out, foldCodePoint(cp));
  }
  return out;
}

TextExclusionResult findExcludedTemplates(const std::string& normalizedText, const TemplateDatabase& db) {
  TextExclusionResult result;
  const std::wstring wideText = toCodePoints(normalizedText);

  for (const auto& kv : db) {
    const std::string& templateId = kv.first;
    const TextSignature& text = kv.second.text;
    bool excluded = false;

    for (const std::string& keyword : text.exclusionKeywords) {
      std::string needle = normalizeText(keyword);
      if (!needle.empty() && normalizedText.find(needle) != std::string::npos) {
        spdlog::debug("{} excluded by keyword '{}'", templateId, keyword);
        excluded = true;
        break;
      }
    }

    for (size_t p = 0; !excluded && p < text.uniqueTextPatterns.size(); ++p) {
      const std::string& pattern = text.uniqueTextPatterns[p];
      if (pattern.empty()) continue;
      try {
        std::wregex re(toCodePoints(pattern), std::wregex::ECMAScript);
        if (std::regex_search(wideText, re)) {
          spdlog::debug("{} excluded by pattern '{}'", templateId, pattern);
          excluded = true;
        }
      } catch (const std::regex_error& ex) {
        std::string warning = "Invalid exclusion pattern for " + templateId + ": '" + pattern + "' (" + ex.what() + ")";
        spdlog::warn("{}", warning);
        result.warnings.push_back(warning);
      }
    }

    if (excluded) result.excluded.insert(templateId);
  }
  return result;
}

TextExclusionResult detectByText(const std::string& pdfPath, const TemplateDatabase& db, PdfSource& pdf) {
  std::string text = extractFirstPageText(pdfPath, pdf);
  if (text.empty()) {
    TextExclusionResult none;
    none.warnings.push_back("No text extracted from page 1; text exclusion skipped");
    return none;
  }
  return findExcludedTemplates(normalizeText(text), db);
}

} // namespace pdfclassify
