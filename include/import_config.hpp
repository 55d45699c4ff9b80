#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// Hard limits applied to every statement document.
struct ImportLimits {
  std::uintmax_t maxFileSize = 10 * 1024 * 1024;
  int maxPages = 100;
  // A page must have strictly fewer characters than this.
  std::size_t maxPageCharacters = 1000000;
  std::string allowedExtension = "pdf";
  // Lowercase; at least one must appear on the first page.
  std::vector<std::string> statementMarkers = {"zürcher kantonalbank", "zkb", "kontoauszug"};
};

struct GatewayConfig {
  std::filesystem::path stagingDirectory = defaultStagingDirectory();
  std::size_t overwriteBytes = 1024;

  static std::filesystem::path defaultStagingDirectory();
};
