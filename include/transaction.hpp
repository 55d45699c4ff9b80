#pragma once

#include "category.hpp"
#include "import_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct CalendarDate {
  int year = 1970;
  int month = 1;
  int day = 1;

  // YYYY-MM-DD
  std::string toIsoString() const;

  static bool isValid(int year, int month, int day);
};

bool operator==(const CalendarDate& a, const CalendarDate& b);
bool operator!=(const CalendarDate& a, const CalendarDate& b);

// Exact non-negative money magnitude in hundredths.
struct Amount {
  std::int64_t minorUnits = 0;

  // "7500.00"
  std::string toString() const;
};

bool operator==(const Amount& a, const Amount& b);
bool operator!=(const Amount& a, const Amount& b);

enum class Direction { Debit, Credit };

const char* directionName(Direction direction);

class Transaction {
public:
  static constexpr const char* kUnknownDetails = "Unknown Transaction";

  // Empty details are replaced by kUnknownDetails.
  Transaction(CalendarDate date, std::string details, Amount amount, Direction direction,
              Category category);

  const CalendarDate& date() const { return date_; }
  const std::string& details() const { return details_; }
  const Amount& amount() const { return amount_; }
  Direction direction() const { return direction_; }
  Category category() const { return category_; }

  // Host-side recategorization.
  void setCategory(Category category) { category_ = category; }

private:
  CalendarDate date_;
  std::string details_;
  Amount amount_;
  Direction direction_;
  Category category_;
};

// Outcome of one parse invocation. Immutable once built.
class ParseResult {
public:
  ParseResult(std::vector<Transaction> transactions, std::vector<std::string> rawLines,
              std::vector<std::string> parseErrors, std::string sourceName,
              std::optional<ErrorKind> errorKind = std::nullopt);

  // Structural failure: no transactions, no raw lines, a single error.
  static ParseResult fatal(std::string sourceName, ErrorKind kind, std::string error);

  const std::vector<Transaction>& transactions() const { return transactions_; }
  const std::vector<std::string>& rawLines() const { return rawLines_; }
  const std::vector<std::string>& parseErrors() const { return parseErrors_; }
  const std::string& sourceName() const { return sourceName_; }

  // Kind of the first error, if any. NoTransactionsFound is the only soft one.
  std::optional<ErrorKind> errorKind() const { return errorKind_; }
  bool hasFatalError() const {
    return errorKind_.has_value() && *errorKind_ != ErrorKind::NoTransactionsFound;
  }
  // What a host needs before opening the dry-run review.
  bool readyForReview() const { return parseErrors_.empty() && !transactions_.empty(); }

private:
  std::vector<Transaction> transactions_;
  std::vector<std::string> rawLines_;
  std::vector<std::string> parseErrors_;
  std::string sourceName_;
  std::optional<ErrorKind> errorKind_;
};

// Swiss display format: "CHF 7'500.00".
std::string formatAmount(const Amount& amount);

// "+ CHF 45.80" for credits, "− CHF 45.80" for debits.
std::string displayAmount(const Transaction& transaction);

struct StatementSummary {
  Amount totalCredits;
  Amount totalDebits;
  // Credits minus debits, may be negative.
  std::int64_t balanceMinorUnits = 0;
  std::size_t transactionCount = 0;
};

StatementSummary summarize(const std::vector<Transaction>& transactions);
