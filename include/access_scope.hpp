#pragma once

#include <filesystem>

// Permission to read a user-selected document, held for the duration of
// one gateway access. Implementations must tolerate concurrent use.
class AccessScope {
public:
  virtual ~AccessScope() = default;

  // false when the platform refuses access.
  virtual bool acquire(const std::filesystem::path& document) = 0;
  virtual void release(const std::filesystem::path& document) noexcept = 0;
};

// Local files need no grant beyond read permission. A missing file is
// granted so that validation can report it as not found.
class LocalAccessScope : public AccessScope {
public:
  bool acquire(const std::filesystem::path& document) override;
  void release(const std::filesystem::path&) noexcept override {}
};

// Holds an acquired scope until destruction.
class ScopedAccess {
public:
  ScopedAccess(AccessScope& scope, std::filesystem::path document);
  ~ScopedAccess();

  ScopedAccess(const ScopedAccess&) = delete;
  ScopedAccess& operator=(const ScopedAccess&) = delete;

  bool acquired() const { return acquired_; }

private:
  AccessScope& scope_;
  std::filesystem::path document_;
  bool acquired_;
};
