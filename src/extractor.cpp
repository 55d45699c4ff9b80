#include "extractor.hpp"

#include "import_error.hpp"
#include "text_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <regex>
#include <string>

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  int rc = std::system(test.c_str());
  return rc == 0;
}

void requireTool(const std::string& command) {
  if (!commandExists(command)) {
    throw ImportError(ErrorKind::DocumentLoadFailed,
      command + " not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils).");
  }
}

std::string shellQuote(const std::string& value) {
  std::string quoted = "'";
  for (char ch : value) {
    if (ch == '\'') quoted += "'\\''";
    else quoted += ch;
  }
  quoted += "'";
  return quoted;
}

std::string runCaptureStdout(const std::string& cmd) {
  std::string output;

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw ImportError(ErrorKind::DocumentLoadFailed, "Failed to open pipe to poppler-utils");
  }

  char buffer[4096];
  size_t n = 0;
  while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    output.append(buffer, n);
  }

  int rc = pclose(pipe);
  if (rc != 0) {
    spdlog::warn("PdftotextExtractor: command exited with status {}", rc);
    throw ImportError(ErrorKind::DocumentLoadFailed, "Failed to load PDF document");
  }

  return output;
}

} // namespace

std::vector<std::string> splitPages(const std::string& text) {
  std::vector<std::string> result;
  size_t start = 0;
  while (start < text.size()) {
    size_t feed = text.find('\f', start);
    if (feed == std::string::npos) {
      result.push_back(text.substr(start));
      break;
    }
    result.push_back(text.substr(start, feed - start));
    start = feed + 1;
  }
  return result;
}

int PdftotextExtractor::pageCount(const std::string& pdfPath) const {
  requireTool("pdfinfo");
  std::string info = runCaptureStdout("pdfinfo " + shellQuote(pdfPath) + " 2>/dev/null");

  std::regex pagesLine("^Pages:\\s+(\\d{1,9})\\s*$");
  for (const std::string& line : splitLines(info)) {
    std::smatch m;
    if (std::regex_match(line, m, pagesLine)) return std::stoi(m[1].str());
  }
  throw ImportError(ErrorKind::DocumentLoadFailed, "Failed to load PDF document");
}

std::string PdftotextExtractor::pageText(const std::string& pdfPath, int pageIndex) const {
  requireTool("pdftotext");
  std::string page = std::to_string(pageIndex + 1);
  std::string text = runCaptureStdout("pdftotext -layout -nopgbrk -q -f " + page + " -l " + page +
                                      " " + shellQuote(pdfPath) + " -");
  spdlog::debug("PdftotextExtractor: page {} yielded {} bytes", pageIndex + 1, text.size());
  return text;
}

std::vector<std::string> PdftotextExtractor::pages(const std::string& pdfPath) const {
  requireTool("pdftotext");
  std::string text = runCaptureStdout("pdftotext -layout -q " + shellQuote(pdfPath) + " -");
  std::vector<std::string> result = splitPages(text);
  spdlog::debug("PdftotextExtractor: extracted {} page(s)", result.size());
  return result;
}
