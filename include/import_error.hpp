#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  FileTooLarge,
  InvalidFileType,
  FileNotFound,
  ScopeAccessFailed,
  PageLimitExceeded,
  ContentTooLarge,
  DocumentLoadFailed,
  NoTransactionsFound,
  IOFailure
};

const char* errorKindName(ErrorKind kind);

// Raised by the document gateway and the text extractor. The message is
// meant for the user; kind() is meant for code.
class ImportError : public std::runtime_error {
public:
  ImportError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};
