#include "transaction.hpp"

#include <cstdio>
#include <utility>

std::string CalendarDate::toIsoString() const {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
  return buffer;
}

bool CalendarDate::isValid(int year, int month, int day) {
  if (year < 1 || month < 1 || month > 12 || day < 1) return false;
  static const int daysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int limit = daysInMonth[month - 1];
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) limit = 29;
  return day <= limit;
}

bool operator==(const CalendarDate& a, const CalendarDate& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const CalendarDate& a, const CalendarDate& b) { return !(a == b); }

std::string Amount::toString() const {
  std::string whole = std::to_string(minorUnits / 100);
  int cents = static_cast<int>(minorUnits % 100);
  return whole + (cents < 10 ? ".0" : ".") + std::to_string(cents);
}

bool operator==(const Amount& a, const Amount& b) { return a.minorUnits == b.minorUnits; }

bool operator!=(const Amount& a, const Amount& b) { return !(a == b); }

const char* directionName(Direction direction) {
  return direction == Direction::Debit ? "debit" : "credit";
}

Transaction::Transaction(CalendarDate date, std::string details, Amount amount,
                         Direction direction, Category category)
  : date_(date),
    details_(details.empty() ? kUnknownDetails : std::move(details)),
    amount_(amount),
    direction_(direction),
    category_(category) {}

ParseResult::ParseResult(std::vector<Transaction> transactions, std::vector<std::string> rawLines,
                         std::vector<std::string> parseErrors, std::string sourceName,
                         std::optional<ErrorKind> errorKind)
  : transactions_(std::move(transactions)),
    rawLines_(std::move(rawLines)),
    parseErrors_(std::move(parseErrors)),
    sourceName_(std::move(sourceName)),
    errorKind_(errorKind) {}

ParseResult ParseResult::fatal(std::string sourceName, ErrorKind kind, std::string error) {
  return ParseResult({}, {}, {std::move(error)}, std::move(sourceName), kind);
}

std::string formatAmount(const Amount& amount) {
  std::string digits = std::to_string(amount.minorUnits / 100);
  std::string grouped;
  for (size_t i = 0; i < digits.size(); ++i) {
    if (i > 0 && (digits.size() - i) % 3 == 0) grouped += '\'';
    grouped += digits[i];
  }
  int cents = static_cast<int>(amount.minorUnits % 100);
  return "CHF " + grouped + (cents < 10 ? ".0" : ".") + std::to_string(cents);
}

std::string displayAmount(const Transaction& transaction) {
  const char* sign = transaction.direction() == Direction::Credit ? "+" : "−";
  return std::string(sign) + " " + formatAmount(transaction.amount());
}

StatementSummary summarize(const std::vector<Transaction>& transactions) {
  StatementSummary summary;
  for (const Transaction& t : transactions) {
    if (t.direction() == Direction::Credit) {
      summary.totalCredits.minorUnits += t.amount().minorUnits;
    } else {
      summary.totalDebits.minorUnits += t.amount().minorUnits;
    }
  }
  summary.balanceMinorUnits = summary.totalCredits.minorUnits - summary.totalDebits.minorUnits;
  summary.transactionCount = transactions.size();
  return summary;
}
