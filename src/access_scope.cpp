#include "access_scope.hpp"

#include <unistd.h>

#include <system_error>
#include <utility>

bool LocalAccessScope::acquire(const std::filesystem::path& document) {
  std::error_code ec;
  if (!std::filesystem::exists(document, ec)) return true;
  return ::access(document.c_str(), R_OK) == 0;
}

ScopedAccess::ScopedAccess(AccessScope& scope, std::filesystem::path document)
  : scope_(scope), document_(std::move(document)), acquired_(scope_.acquire(document_)) {}

ScopedAccess::~ScopedAccess() {
  if (acquired_) scope_.release(document_);
}
