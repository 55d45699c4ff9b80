#pragma once

#include "document_gateway.hpp"
#include "extractor.hpp"
#include "import_error.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

// Serves fixed page texts regardless of the path it is given.
class FakeExtractor : public TextExtractor {
public:
  std::vector<std::string> pageTexts;
  bool loadFails = false;
  // Overrides the page count when >= 0.
  int reportedPageCount = -1;
  mutable std::string lastPath;

  int pageCount(const std::string& pdfPath) const override {
    lastPath = pdfPath;
    if (loadFails) throw ImportError(ErrorKind::DocumentLoadFailed, "cannot open document");
    return reportedPageCount >= 0 ? reportedPageCount : static_cast<int>(pageTexts.size());
  }

  std::string pageText(const std::string& pdfPath, int pageIndex) const override {
    lastPath = pdfPath;
    if (loadFails) throw ImportError(ErrorKind::DocumentLoadFailed, "cannot open document");
    if (pageIndex < 0 || pageIndex >= static_cast<int>(pageTexts.size())) return std::string();
    return pageTexts[static_cast<size_t>(pageIndex)];
  }

  std::vector<std::string> pages(const std::string& pdfPath) const override {
    lastPath = pdfPath;
    if (loadFails) throw ImportError(ErrorKind::DocumentLoadFailed, "cannot open document");
    return pageTexts;
  }
};

// Unique scratch directory, removed with everything in it.
class TempDir {
public:
  TempDir() : path_(std::filesystem::temp_directory_path() / ("stmtimport-test-" + generateOpaqueName())) {
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline std::filesystem::path writeFile(const std::filesystem::path& file, const std::string& content) {
  std::ofstream out(file, std::ios::binary);
  out << content;
  return file;
}

inline std::string readFile(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::size_t countFiles(const std::filesystem::path& dir) {
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) return 0;
  std::size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    count++;
  }
  return count;
}
