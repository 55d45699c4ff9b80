#pragma once

#include "document_gateway.hpp"
#include "extractor.hpp"
#include "parse_coordinator.hpp"
#include "statement_validator.hpp"
#include "transaction.hpp"

// Entry points for a host: every access to the user's document goes through
// the gateway, so nothing of it outlives the call.
class StatementImporter {
public:
  StatementImporter(DocumentGateway& gateway, const TextExtractor& extractor,
                    ImportLimits limits = ImportLimits());

  // Parses a statement for dry-run review. Throws ImportError when the
  // document cannot be accessed, validated or staged.
  ParseResult importStatement(const DocumentHandle& handle);

  // Quick check before a full import; never throws for document problems.
  ValidationResult checkStatement(const DocumentHandle& handle);

private:
  DocumentGateway& gateway_;
  StatementValidator validator_;
  ParseCoordinator coordinator_;
};
