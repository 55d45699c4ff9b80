#pragma once

#include <string>
#include <vector>

// Page-text source for a local PDF. Page order is preserved; a page without
// a text layer comes back as an empty string.
class TextExtractor {
public:
  virtual ~TextExtractor() = default;

  // Throws ImportError(DocumentLoadFailed) if the document cannot be opened.
  virtual int pageCount(const std::string& pdfPath) const = 0;

  // Text of the page at pageIndex (0-based).
  virtual std::string pageText(const std::string& pdfPath, int pageIndex) const = 0;

  virtual std::vector<std::string> pages(const std::string& pdfPath) const = 0;
};

// Uses the poppler-utils tools: `pdfinfo` for the page count and
// `pdftotext -layout` for the text, one form feed per page.
class PdftotextExtractor : public TextExtractor {
public:
  int pageCount(const std::string& pdfPath) const override;
  std::string pageText(const std::string& pdfPath, int pageIndex) const override;
  std::vector<std::string> pages(const std::string& pdfPath) const override;
};

// Splits pdftotext output on form feeds. The trailing feed after the last
// page does not produce an extra page.
std::vector<std::string> splitPages(const std::string& text);
