#pragma once

#include "extractor.hpp"
#include "import_config.hpp"

#include <string>

struct ValidationResult {
  bool ok = false;
  std::string reason;
};

bool operator==(const ValidationResult& a, const ValidationResult& b);

// Cheap pre-check run before a full parse: the document loads, its page count
// is within limits and its first page looks like a bank statement.
class StatementValidator {
public:
  explicit StatementValidator(const TextExtractor& extractor, ImportLimits limits = ImportLimits());

  // Reports the first failing check, or success.
  ValidationResult validate(const std::string& pdfPath) const;

private:
  const TextExtractor& extractor_;
  ImportLimits limits_;
};
