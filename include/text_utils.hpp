#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

std::string trim(const std::string& s);

// Lowercases ASCII letters and the two-byte UTF-8 Latin-1 capitals
// (À..Þ, except ×), so "ZÜRICH" becomes "zürich". Other bytes pass through.
std::string toLowerUtf8(const std::string& s);

// Number of code points, counting each UTF-8 lead byte.
std::size_t utf8Length(const std::string& s);

// Splits on '\n' and strips one trailing '\r' per line. A final newline
// does not produce an extra empty line.
std::vector<std::string> splitLines(const std::string& text);

// "10.5 MB", one decimal, binary megabytes.
std::string formatMegabytes(std::uintmax_t bytes);
