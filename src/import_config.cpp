#include "import_config.hpp"

#include <system_error>

std::filesystem::path GatewayConfig::defaultStagingDirectory() {
  std::error_code ec;
  std::filesystem::path base = std::filesystem::temp_directory_path(ec);
  if (ec) base = "/tmp";
  return base / "stmtimport" / "SecureProcessing";
}
