#pragma once

#include "access_scope.hpp"
#include "import_config.hpp"
#include "import_error.hpp"
#include "storage_protection.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

// A user-selected document as handed over by the host's file picker.
class DocumentHandle {
public:
  explicit DocumentHandle(std::filesystem::path path, std::string displayName = std::string());

  const std::filesystem::path& path() const { return path_; }
  // The original file name unless the host supplied a label.
  const std::string& displayName() const { return displayName_; }

private:
  std::filesystem::path path_;
  std::string displayName_;
};

// Owner-only copy of a document inside the staging directory, under a random
// opaque name. The copy is securely destroyed when the object goes away.
class StagedDocument {
public:
  // Throws ImportError(IOFailure); a partial copy is destroyed first.
  StagedDocument(const std::filesystem::path& original, const std::filesystem::path& stagingDirectory,
                 const StorageProtection& protection, std::size_t overwriteBytes);
  ~StagedDocument();

  StagedDocument(const StagedDocument&) = delete;
  StagedDocument& operator=(const StagedDocument&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::size_t overwriteBytes_;
};

// Overwrites the first min(size, overwriteBytes) bytes with RAND_bytes data,
// syncs, then unlinks. A missing file is not an error.
// Throws ImportError(IOFailure).
void secureDeleteFile(const std::filesystem::path& file, std::size_t overwriteBytes);

// 32 lowercase hex characters from OpenSSL's RAND_bytes, with no weaker
// fallback. Throws ImportError(IOFailure) if the generator fails.
std::string generateOpaqueName();

// Mediates every access to a statement document: validates the original,
// works on a protected staged copy only, and destroys that copy on every
// exit path. The original is never modified.
class DocumentGateway {
public:
  explicit DocumentGateway(GatewayConfig config = GatewayConfig(), ImportLimits limits = ImportLimits(),
                  std::shared_ptr<StorageProtection> protection =
                    std::make_shared<OwnerOnlyStorageProtection>(),
                  std::shared_ptr<AccessScope> accessScope = std::make_shared<LocalAccessScope>());

  // Runs body(stagedPath) and returns its result. Throws ImportError for
  // scope, validation and staging failures; exceptions from body propagate
  // after the staged copy is gone.
  template <typename Body>
  auto withSecureAccess(const DocumentHandle& handle, Body&& body)
    -> decltype(std::forward<Body>(body)(std::declval<const std::filesystem::path&>())) {
    ScopedAccess access(*accessScope_, handle.path());
    if (!access.acquired()) {
      throw ImportError(ErrorKind::ScopeAccessFailed, "Failed to access file securely");
    }

    validate(handle);

    StagedDocument staged(handle.path(), prepareStagingDirectory(), *protection_,
                          config_.overwriteBytes);
    return std::forward<Body>(body)(staged.path());
  }

  // Existence, size and type checks on the original. Throws ImportError.
  void validate(const DocumentHandle& handle) const;

  // Throws ImportError(IOFailure).
  void secureDelete(const std::filesystem::path& file) const;

  // Destroys leftovers of earlier runs (e.g. after a crash). Returns how many
  // files were removed; failures are logged and skipped.
  std::size_t purgeStagingArea() const;

  const std::filesystem::path& stagingDirectory() const { return config_.stagingDirectory; }

private:
  // Creates the staging directory if absent and protects it.
  std::filesystem::path prepareStagingDirectory() const;

  GatewayConfig config_;
  ImportLimits limits_;
  std::shared_ptr<StorageProtection> protection_;
  std::shared_ptr<AccessScope> accessScope_;
};
