#include <catch2/catch.hpp>

#include "transaction.hpp"

#include <vector>

TEST_CASE("Transaction substitutes empty details", "[transaction]") {
  Transaction t(CalendarDate{2026, 1, 15}, "", Amount{100}, Direction::Debit, Category::Other);
  REQUIRE(t.details() == "Unknown Transaction");

  t.setCategory(Category::Dining);
  REQUIRE(t.category() == Category::Dining);
}

TEST_CASE("amounts render exactly", "[transaction]") {
  REQUIRE(Amount{4580}.toString() == "45.80");
  REQUIRE(Amount{5}.toString() == "0.05");
  REQUIRE(formatAmount(Amount{750000}) == "CHF 7'500.00");
  REQUIRE(formatAmount(Amount{123456789}) == "CHF 1'234'567.89");
  REQUIRE(formatAmount(Amount{0}) == "CHF 0.00");
}

TEST_CASE("displayAmount prefixes the direction", "[transaction]") {
  Transaction credit(CalendarDate{2026, 1, 15}, "COOP", Amount{4580}, Direction::Credit,
                     Category::Groceries);
  Transaction debit(CalendarDate{2026, 1, 13}, "Lohn", Amount{750000}, Direction::Debit,
                    Category::Salary);

  REQUIRE(displayAmount(credit) == "+ CHF 45.80");
  REQUIRE(displayAmount(debit) == "− CHF 7'500.00");
}

TEST_CASE("summarize totals credits and debits", "[transaction]") {
  std::vector<Transaction> transactions = {
    Transaction(CalendarDate{2026, 1, 15}, "COOP", Amount{4580}, Direction::Credit, Category::Groceries),
    Transaction(CalendarDate{2026, 1, 14}, "SBB", Amount{1240}, Direction::Credit, Category::Transport),
    Transaction(CalendarDate{2026, 1, 13}, "Lohn", Amount{750000}, Direction::Debit, Category::Salary)
  };

  StatementSummary summary = summarize(transactions);

  REQUIRE(summary.transactionCount == 3);
  REQUIRE(summary.totalCredits == Amount{5820});
  REQUIRE(summary.totalDebits == Amount{750000});
  REQUIRE(summary.balanceMinorUnits == 5820 - 750000);
}

TEST_CASE("CalendarDate renders ISO dates and knows leap years", "[transaction]") {
  REQUIRE(CalendarDate{2026, 1, 5}.toIsoString() == "2026-01-05");
  REQUIRE(CalendarDate::isValid(2000, 2, 29));
  REQUIRE_FALSE(CalendarDate::isValid(1900, 2, 29));
  REQUIRE_FALSE(CalendarDate::isValid(2026, 4, 31));
}
