#pragma once

#include "extractor.hpp"
#include "import_config.hpp"
#include "line_classifier.hpp"
#include "transaction.hpp"
#include "transaction_parser.hpp"

#include <filesystem>
#include <string>

// Runs the whole statement pipeline over one staged document: limit checks,
// page extraction, noise filtering, line parsing and categorization.
class ParseCoordinator {
public:
  explicit ParseCoordinator(const TextExtractor& extractor, ImportLimits limits = ImportLimits(),
                            TransactionLineParser parser = TransactionLineParser());

  // Never throws for document problems: limit violations and load failures
  // come back as a fatal ParseResult. An empty sourceName falls back to the
  // file name of stagedPath.
  ParseResult parseStatement(const std::filesystem::path& stagedPath,
                             const std::string& sourceName = std::string()) const;

  static constexpr const char* kNoTransactionsWarning =
    "No transactions found in PDF. Check if format matches ZKB statement.";

private:
  const TextExtractor& extractor_;
  ImportLimits limits_;
  LineClassifier classifier_;
  TransactionLineParser parser_;
};
