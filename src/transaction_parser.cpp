#include "transaction_parser.hpp"

#include "text_utils.hpp"

#include <cctype>
#include <cstddef>
#include <utility>

namespace {

const char* const kDatePattern = "(\\d{1,2})\\.(\\d{1,2})\\.(\\d{4}|\\d{2})";

// Optional currency prefix of an amount token, consumed and not stored.
const char* const kCurrencyCodes[] = {"CHF", "EUR", "USD", "GBP"};

const std::string kTypographicApostrophe = "’";

// Beyond this many integer digits the value no longer fits in minor units.
constexpr size_t kMaxIntegerDigits = 15;

std::optional<int> toNumber(const std::string& digits) {
  if (digits.empty() || digits.size() > 4) return std::nullopt;
  int value = 0;
  for (char ch : digits) {
    if (ch < '0' || ch > '9') return std::nullopt;
    value = value * 10 + (ch - '0');
  }
  return value;
}

bool isDigit(char ch) { return ch >= '0' && ch <= '9'; }

bool isBlank(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

// True when count digits start at pos.
bool hasDigits(const std::string& s, size_t pos, size_t count) {
  if (pos > s.size() || s.size() - pos < count) return false;
  for (size_t i = 0; i < count; ++i) {
    if (!isDigit(s[pos + i])) return false;
  }
  return true;
}

// Length of a thousands separator at pos, 0 if there is none.
size_t separatorAt(const std::string& s, size_t pos) {
  if (pos < s.size() && s[pos] == '\'') return 1;
  const size_t width = kTypographicApostrophe.size();
  if (pos <= s.size() && s.compare(pos, width, kTypographicApostrophe) == 0) return width;
  return 0;
}

// [CUR ws*] [-] (d{1,3} ('ddd)+ | d+) [(.|,)dd]
struct AmountToken {
  size_t begin = 0;
  size_t end = 0;
  bool negative = false;
  size_t magnitudeBegin = 0;
};

// Longest amount token starting exactly at pos.
std::optional<AmountToken> amountAt(const std::string& text, size_t pos) {
  AmountToken token;
  token.begin = pos;
  size_t cursor = pos;

  for (const char* code : kCurrencyCodes) {
    if (text.compare(cursor, 3, code) == 0) {
      cursor += 3;
      while (cursor < text.size() && isBlank(text[cursor])) cursor++;
      break;
    }
  }
  if (cursor < text.size() && text[cursor] == '-') {
    token.negative = true;
    cursor++;
  }

  token.magnitudeBegin = cursor;
  size_t digits = 0;
  while (cursor < text.size() && isDigit(text[cursor])) {
    cursor++;
    digits++;
  }
  if (digits == 0) return std::nullopt;

  // Grouped thousands only follow a short leading group.
  if (digits <= 3) {
    for (;;) {
      size_t separator = separatorAt(text, cursor);
      if (separator == 0 || !hasDigits(text, cursor + separator, 3)) break;
      cursor += separator + 3;
    }
  }
  if (cursor < text.size() && (text[cursor] == '.' || text[cursor] == ',') &&
      hasDigits(text, cursor + 1, 2)) {
    cursor += 3;
  }

  token.end = cursor;
  return token;
}

// Scans left to right without overlap; the last token is the ledger amount,
// earlier ones belong to the details.
std::optional<AmountToken> lastAmountToken(const std::string& text, size_t from) {
  std::optional<AmountToken> last;
  size_t pos = from;
  while (pos < text.size()) {
    if (std::optional<AmountToken> token = amountAt(text, pos)) {
      pos = token->end;
      last = token;
    } else {
      pos++;
    }
  }
  return last;
}

} // namespace

std::optional<CalendarDate> parseSwissDate(const std::string& token) {
  size_t firstDot = token.find('.');
  if (firstDot == std::string::npos) return std::nullopt;
  size_t secondDot = token.find('.', firstDot + 1);
  if (secondDot == std::string::npos) return std::nullopt;

  std::optional<int> day = toNumber(token.substr(0, firstDot));
  std::optional<int> month = toNumber(token.substr(firstDot + 1, secondDot - firstDot - 1));
  std::string yearText = token.substr(secondDot + 1);
  std::optional<int> year = toNumber(yearText);
  if (!day || !month || !year) return std::nullopt;

  // Full year first, then the short form.
  int fullYear = 0;
  if (yearText.size() == 4) {
    fullYear = *year;
  } else if (yearText.size() == 2) {
    fullYear = 2000 + *year;
  } else {
    return std::nullopt;
  }

  if (!CalendarDate::isValid(fullYear, *month, *day)) return std::nullopt;
  return CalendarDate{fullYear, *month, *day};
}

std::optional<Amount> parseSwissAmount(const std::string& token) {
  std::string integerPart;
  std::string fraction;
  bool inFraction = false;
  for (size_t i = 0; i < token.size(); ++i) {
    char ch = token[i];
    if (ch >= '0' && ch <= '9') {
      (inFraction ? fraction : integerPart) += ch;
    } else if (ch == '.' || ch == ',') {
      if (inFraction) return std::nullopt;
      inFraction = true;
    } else if (ch == '\'') {
      continue;
    } else if (token.compare(i, 3, "’") == 0) {
      i += 2;
    } else {
      return std::nullopt;
    }
  }

  if (integerPart.empty() || integerPart.size() > kMaxIntegerDigits) return std::nullopt;
  if (inFraction && fraction.size() != 2) return std::nullopt;

  std::int64_t units = 0;
  for (char ch : integerPart) units = units * 10 + (ch - '0');
  units *= 100;
  if (inFraction) units += (fraction[0] - '0') * 10 + (fraction[1] - '0');
  return Amount{units};
}

TransactionLineParser::TransactionLineParser(Categorizer categorizer)
  : categorizer_(std::move(categorizer)),
    datePattern_(kDatePattern, std::regex::ECMAScript | std::regex::optimize) {}

std::optional<Transaction> TransactionLineParser::parse(const std::string& line) const {
  const std::string text = trim(line);

  std::smatch dateMatch;
  if (!std::regex_search(text, dateMatch, datePattern_)) return std::nullopt;
  const size_t dateEnd = static_cast<size_t>(dateMatch.position(0) + dateMatch.length(0));

  std::optional<AmountToken> token = lastAmountToken(text, dateEnd);
  if (!token) return std::nullopt;

  std::optional<Amount> amount =
    parseSwissAmount(text.substr(token->magnitudeBegin, token->end - token->magnitudeBegin));
  if (!amount) return std::nullopt;

  std::string details = trim(text.substr(dateEnd, token->begin - dateEnd));

  std::optional<CalendarDate> date = parseSwissDate(dateMatch[0].str());
  if (!date) return std::nullopt;

  Direction direction = token->negative ? Direction::Debit : Direction::Credit;
  Category category = categorizer_.categorize(details);
  return Transaction(*date, std::move(details), *amount, direction, category);
}
