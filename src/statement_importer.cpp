#include "statement_importer.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

StatementImporter::StatementImporter(DocumentGateway& gateway, const TextExtractor& extractor,
                                     ImportLimits limits)
  : gateway_(gateway), validator_(extractor, limits), coordinator_(extractor, limits) {}

ParseResult StatementImporter::importStatement(const DocumentHandle& handle) {
  return gateway_.withSecureAccess(handle, [&](const std::filesystem::path& staged) {
    return coordinator_.parseStatement(staged, handle.displayName());
  });
}

ValidationResult StatementImporter::checkStatement(const DocumentHandle& handle) {
  try {
    return gateway_.withSecureAccess(handle, [&](const std::filesystem::path& staged) {
      return validator_.validate(staged.string());
    });
  } catch (const ImportError& e) {
    spdlog::info("StatementImporter: {} ({})", e.what(), errorKindName(e.kind()));
    return {false, e.what()};
  }
}
