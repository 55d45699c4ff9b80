#pragma once

#include "category.hpp"
#include "transaction.hpp"

#include <optional>
#include <regex>
#include <string>

// Extracts one transaction from a statement line of the form
//   dd.mm.yyyy <details> [CUR] [-]1'234.56
// Lines that do not fit yield std::nullopt; nothing is ever reported.
class TransactionLineParser {
public:
  explicit TransactionLineParser(Categorizer categorizer = Categorizer());

  std::optional<Transaction> parse(const std::string& line) const;

private:
  Categorizer categorizer_;
  std::regex datePattern_;
};

// Day-month-year with a four or two digit year ("15.01.2026", "15.01.26").
std::optional<CalendarDate> parseSwissDate(const std::string& token);

// Normalizes "7'500.00" / "1234,50" / "45" into an exact amount. The sign,
// if any, must already be stripped.
std::optional<Amount> parseSwissAmount(const std::string& token);
