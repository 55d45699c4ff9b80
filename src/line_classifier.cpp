#include "line_classifier.hpp"

#include "text_utils.hpp"

#include <cctype>
#include <cstring>

namespace {

// Lines starting with one of these are headers or balances.
const char* const kHeaderPrefixes[] = {
  "IBAN", "Saldo", "Balance", "Kontostand", "ZKB", "Kontoauszug"
};

// Two words separated by any amount of whitespace.
struct HeaderPhrase {
  const char* first;
  const char* second;
};

const HeaderPhrase kHeaderPhrases[] = {
  {"Zürcher", "Kantonalbank"},
  {"Account", "Statement"}
};

// Followed by whitespace and a page number.
const char* const kPageMarkers[] = {"Page", "Seite"};

bool isBlank(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool startsWithAt(const std::string& s, size_t pos, const char* prefix) {
  return pos <= s.size() && s.compare(pos, std::strlen(prefix), prefix) == 0;
}

// Position after at least one blank starting at pos, npos if there is none.
size_t skipBlanks(const std::string& s, size_t pos) {
  size_t end = pos;
  while (end < s.size() && isBlank(s[end])) end++;
  return end > pos ? end : std::string::npos;
}

bool isPageMarker(const std::string& s) {
  for (const char* marker : kPageMarkers) {
    if (!startsWithAt(s, 0, marker)) continue;
    size_t next = skipBlanks(s, std::strlen(marker));
    if (next != std::string::npos && next < s.size() && s[next] >= '0' && s[next] <= '9') {
      return true;
    }
  }
  return false;
}

bool isHeader(const std::string& s) {
  for (const char* prefix : kHeaderPrefixes) {
    if (startsWithAt(s, 0, prefix)) return true;
  }
  for (const HeaderPhrase& phrase : kHeaderPhrases) {
    if (!startsWithAt(s, 0, phrase.first)) continue;
    size_t next = skipBlanks(s, std::strlen(phrase.first));
    if (next != std::string::npos && startsWithAt(s, next, phrase.second)) return true;
  }
  return false;
}

// "---" or "===" and longer.
bool isSeparator(const std::string& s) {
  if (s.size() < 3 || (s[0] != '-' && s[0] != '=')) return false;
  return s[1] == s[0] && s[2] == s[0];
}

} // namespace

bool LineClassifier::isNoise(const std::string& line) const {
  const std::string trimmed = trim(line);
  if (trimmed.empty()) return true;

  return isPageMarker(trimmed) || isHeader(trimmed) || isSeparator(trimmed);
}
