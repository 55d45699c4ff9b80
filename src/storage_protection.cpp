#include "storage_protection.hpp"

#include "import_error.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace {

void applyPermissions(const fs::path& target, fs::perms perms) {
  std::error_code ec;
  fs::permissions(target, perms, fs::perm_options::replace, ec);
  if (ec) {
    throw ImportError(ErrorKind::IOFailure,
      "Failed to protect " + target.filename().string() + ": " + ec.message());
  }
}

} // namespace

void OwnerOnlyStorageProtection::protectDirectory(const fs::path& dir) const {
  applyPermissions(dir, fs::perms::owner_all);
}

void OwnerOnlyStorageProtection::protectFile(const fs::path& file) const {
  applyPermissions(file, fs::perms::owner_read | fs::perms::owner_write);
}
