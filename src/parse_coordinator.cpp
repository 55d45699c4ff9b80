#include "parse_coordinator.hpp"

#include "import_error.hpp"
#include "text_utils.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <system_error>
#include <utility>
#include <vector>

ParseCoordinator::ParseCoordinator(const TextExtractor& extractor, ImportLimits limits,
                                   TransactionLineParser parser)
  : extractor_(extractor), limits_(std::move(limits)), parser_(std::move(parser)) {}

ParseResult ParseCoordinator::parseStatement(const std::filesystem::path& stagedPath,
                                             const std::string& sourceName) const {
  const std::string name = sourceName.empty() ? stagedPath.filename().string() : sourceName;
  const std::string pdfPath = stagedPath.string();

  // The gateway already checked the size; it is not taken on trust here.
  std::error_code ec;
  std::uintmax_t fileSize = std::filesystem::file_size(stagedPath, ec);
  if (ec) {
    spdlog::warn("ParseCoordinator: cannot stat staged document: {}", ec.message());
    return ParseResult::fatal(name, ErrorKind::DocumentLoadFailed,
                              "Failed to load PDF document");
  }
  if (fileSize > limits_.maxFileSize) {
    return ParseResult::fatal(name, ErrorKind::FileTooLarge,
                              "File too large: " + formatMegabytes(fileSize));
  }

  int pageCount = 0;
  std::vector<std::string> pages;
  try {
    pageCount = extractor_.pageCount(pdfPath);
    if (pageCount > limits_.maxPages) {
      return ParseResult::fatal(name, ErrorKind::PageLimitExceeded,
                                "PDF has too many pages (" + std::to_string(pageCount) +
                                "). Maximum: " + std::to_string(limits_.maxPages));
    }
    pages = extractor_.pages(pdfPath);
  } catch (const ImportError& e) {
    spdlog::warn("ParseCoordinator: {}", e.what());
    return ParseResult::fatal(name, ErrorKind::DocumentLoadFailed,
                              "Failed to load PDF document");
  }

  std::string fullText;
  for (const std::string& page : pages) {
    if (utf8Length(page) >= limits_.maxPageCharacters) {
      return ParseResult::fatal(name, ErrorKind::ContentTooLarge, "PDF content too large");
    }
    // Pages without a text layer contribute nothing.
    if (page.empty()) continue;
    fullText += page;
    fullText += '\n';
  }

  std::vector<std::string> rawLines = splitLines(fullText);
  std::vector<Transaction> transactions;
  std::vector<std::string> parseErrors;
  std::optional<ErrorKind> errorKind;

  for (const std::string& line : rawLines) {
    if (classifier_.isNoise(line)) continue;
    if (auto transaction = parser_.parse(line)) {
      transactions.push_back(std::move(*transaction));
    }
  }

  if (transactions.empty()) {
    parseErrors.push_back(kNoTransactionsWarning);
    errorKind = ErrorKind::NoTransactionsFound;
  }

  spdlog::info("ParseCoordinator: {} page(s), {} line(s), {} transaction(s)",
               pageCount, rawLines.size(), transactions.size());

  return ParseResult(std::move(transactions), std::move(rawLines), std::move(parseErrors), name,
                     errorKind);
}
