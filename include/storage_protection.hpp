#pragma once

#include <filesystem>

// Makes staged data unreadable to anyone but the owning user. Both calls
// throw ImportError(IOFailure) when protection cannot be applied.
class StorageProtection {
public:
  virtual ~StorageProtection() = default;

  virtual void protectDirectory(const std::filesystem::path& dir) const = 0;
  virtual void protectFile(const std::filesystem::path& file) const = 0;
};

// For platforms, filesystems and tests without a protection mechanism.
class NoopStorageProtection : public StorageProtection {
public:
  void protectDirectory(const std::filesystem::path&) const override {}
  void protectFile(const std::filesystem::path&) const override {}
};

// POSIX owner-only permissions: 0700 for directories, 0600 for files.
class OwnerOnlyStorageProtection : public StorageProtection {
public:
  void protectDirectory(const std::filesystem::path& dir) const override;
  void protectFile(const std::filesystem::path& file) const override;
};
