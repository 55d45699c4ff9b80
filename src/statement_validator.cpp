#include "statement_validator.hpp"

#include "import_error.hpp"
#include "text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

bool operator==(const ValidationResult& a, const ValidationResult& b) {
  return a.ok == b.ok && a.reason == b.reason;
}

StatementValidator::StatementValidator(const TextExtractor& extractor, ImportLimits limits)
  : extractor_(extractor), limits_(std::move(limits)) {}

ValidationResult StatementValidator::validate(const std::string& pdfPath) const {
  int pages = 0;
  try {
    pages = extractor_.pageCount(pdfPath);
  } catch (const ImportError& e) {
    spdlog::debug("StatementValidator: {}", e.what());
    return {false, "Invalid PDF file"};
  }

  if (pages <= 0) return {false, "PDF has no pages"};
  if (pages > limits_.maxPages) {
    return {false, "PDF has too many pages (" + std::to_string(pages) + "). Maximum: " +
                   std::to_string(limits_.maxPages)};
  }

  std::string firstPage;
  try {
    firstPage = extractor_.pageText(pdfPath, 0);
  } catch (const ImportError& e) {
    spdlog::debug("StatementValidator: {}", e.what());
    return {false, "Cannot read PDF content"};
  }

  if (utf8Length(firstPage) >= limits_.maxPageCharacters) {
    return {false, "PDF content too large"};
  }

  const std::string content = toLowerUtf8(firstPage);
  bool hasMarker = std::any_of(limits_.statementMarkers.begin(), limits_.statementMarkers.end(),
    [&](const std::string& marker) { return content.find(marker) != std::string::npos; });
  if (!hasMarker) {
    return {false, "PDF does not appear to be a ZKB statement"};
  }

  return {true, "Valid ZKB statement"};
}
