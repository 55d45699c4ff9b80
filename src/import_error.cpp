#include "import_error.hpp"

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::FileTooLarge: return "FileTooLarge";
    case ErrorKind::InvalidFileType: return "InvalidFileType";
    case ErrorKind::FileNotFound: return "FileNotFound";
    case ErrorKind::ScopeAccessFailed: return "ScopeAccessFailed";
    case ErrorKind::PageLimitExceeded: return "PageLimitExceeded";
    case ErrorKind::ContentTooLarge: return "ContentTooLarge";
    case ErrorKind::DocumentLoadFailed: return "DocumentLoadFailed";
    case ErrorKind::NoTransactionsFound: return "NoTransactionsFound";
    case ErrorKind::IOFailure: return "IOFailure";
  }
  return "Unknown";
}
