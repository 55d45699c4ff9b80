#include <catch2/catch.hpp>

#include "parse_coordinator.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

namespace {

const std::string kPageOne =
  "Zürcher Kantonalbank\n"
  "Kontoauszug Januar 2026\n"
  "15.01.2026 COOP Zürich, Kaufvertrag CHF 45.80\n"
  "14.01.2026 SBB Billett Zürich HB CHF 12.40\n"
  "Seite 1";

const std::string kPageTwo =
  "13.01.2026 Lohnzahlung Januar 2026 -7'500.00\n"
  "-----\n"
  "Saldo: CHF 8'234.56";

} // namespace

TEST_CASE("parseStatement collects transactions in document order", "[coordinator]") {
  TempDir dir;
  auto staged = writeFile(dir.path() / "staged.pdf", "%PDF-1.4");
  FakeExtractor extractor;
  extractor.pageTexts = {kPageOne, kPageTwo};
  ParseCoordinator coordinator(extractor);

  ParseResult result = coordinator.parseStatement(staged, "ZKB_Statement_January_2026.pdf");

  REQUIRE(result.sourceName() == "ZKB_Statement_January_2026.pdf");
  REQUIRE(result.parseErrors().empty());
  REQUIRE_FALSE(result.hasFatalError());
  REQUIRE(result.readyForReview());

  const auto& transactions = result.transactions();
  REQUIRE(transactions.size() == 3);
  REQUIRE(transactions[0].details() == "COOP Zürich, Kaufvertrag");
  REQUIRE(transactions[0].category() == Category::Groceries);
  REQUIRE(transactions[1].details() == "SBB Billett Zürich HB");
  REQUIRE(transactions[1].category() == Category::Transport);
  REQUIRE(transactions[2].amount() == Amount{750000});
  REQUIRE(transactions[2].direction() == Direction::Debit);
  REQUIRE(transactions[2].category() == Category::Salary);

  const auto& lines = result.rawLines();
  REQUIRE(lines.size() == 8);
  REQUIRE(lines.front() == "Zürcher Kantonalbank");
  REQUIRE(lines[4] == "Seite 1");
  REQUIRE(lines.back() == "Saldo: CHF 8'234.56");
}

TEST_CASE("parseStatement warns softly when nothing matches", "[coordinator]") {
  TempDir dir;
  auto staged = writeFile(dir.path() / "staged.pdf", "%PDF-1.4");
  FakeExtractor extractor;
  extractor.pageTexts = {"Zürcher Kantonalbank\nSeite 2\n-----\nKein Umsatz in dieser Periode"};
  ParseCoordinator coordinator(extractor);

  ParseResult result = coordinator.parseStatement(staged);

  REQUIRE(result.transactions().empty());
  REQUIRE(result.parseErrors() ==
          std::vector<std::string>{ParseCoordinator::kNoTransactionsWarning});
  REQUIRE(result.errorKind() == ErrorKind::NoTransactionsFound);
  REQUIRE_FALSE(result.hasFatalError());
  REQUIRE_FALSE(result.readyForReview());
  REQUIRE(result.rawLines().size() == 4);
  REQUIRE(result.sourceName() == "staged.pdf");
}

TEST_CASE("parseStatement never reports noise or unparsable lines", "[coordinator]") {
  TempDir dir;
  auto staged = writeFile(dir.path() / "staged.pdf", "%PDF-1.4");
  FakeExtractor extractor;
  extractor.pageTexts = {"Seite 2\n-----\nDatum Buchungstext Betrag\n"
                         "31.02.2026 Falsches Datum 10.00\n"
                         "20.01.2026 Netflix Abonnement 17.90"};
  ParseCoordinator coordinator(extractor);

  ParseResult result = coordinator.parseStatement(staged);

  REQUIRE(result.parseErrors().empty());
  REQUIRE(result.transactions().size() == 1);
  REQUIRE(result.transactions()[0].category() == Category::Entertainment);
}

TEST_CASE("parseStatement skips pages without text", "[coordinator]") {
  TempDir dir;
  auto staged = writeFile(dir.path() / "staged.pdf", "%PDF-1.4");
  FakeExtractor extractor;
  extractor.pageTexts = {"", "21.01.2026 Spotify Premium 12.95\r\n", ""};
  ParseCoordinator coordinator(extractor);

  ParseResult result = coordinator.parseStatement(staged);

  REQUIRE(result.rawLines() == std::vector<std::string>{"21.01.2026 Spotify Premium 12.95", ""});
  REQUIRE(result.transactions().size() == 1);
}

TEST_CASE("parseStatement enforces the page limit", "[coordinator]") {
  TempDir dir;
  auto staged = writeFile(dir.path() / "staged.pdf", "%PDF-1.4");
  FakeExtractor extractor;
  ParseCoordinator coordinator(extractor);

  SECTION("exactly 100 pages pass") {
    extractor.pageTexts = std::vector<std::string>(100, "");
    ParseResult result = coordinator.parseStatement(staged);
    REQUIRE_FALSE(result.hasFatalError());
    REQUIRE(result.errorKind() == ErrorKind::NoTransactionsFound);
  }

  SECTION("101 pages fail") {
    extractor.pageTexts = std::vector<std::string>(101, "15.01.2026 COOP 1.00");
    ParseResult result = coordinator.parseStatement(staged);
    REQUIRE(result.hasFatalError());
    REQUIRE(result.errorKind() == ErrorKind::PageLimitExceeded);
    REQUIRE(result.parseErrors() ==
            std::vector<std::string>{"PDF has too many pages (101). Maximum: 100"});
    REQUIRE(result.transactions().empty());
    REQUIRE(result.rawLines().empty());
  }
}

TEST_CASE("parseStatement fails structurally on bad documents", "[coordinator]") {
  TempDir dir;
  FakeExtractor extractor;
  extractor.pageTexts = {"15.01.2026 COOP Zürich 45.80"};

  SECTION("document does not load") {
    auto staged = writeFile(dir.path() / "staged.pdf", "not a pdf");
    extractor.loadFails = true;
    ParseResult result = ParseCoordinator(extractor).parseStatement(staged);
    REQUIRE(result.errorKind() == ErrorKind::DocumentLoadFailed);
    REQUIRE(result.parseErrors() == std::vector<std::string>{"Failed to load PDF document"});
    REQUIRE(result.transactions().empty());
  }

  SECTION("staged file is larger than allowed") {
    auto staged = writeFile(dir.path() / "staged.pdf", std::string(11, 'x'));
    ImportLimits limits;
    limits.maxFileSize = 10;
    ParseResult result = ParseCoordinator(extractor, limits).parseStatement(staged);
    REQUIRE(result.errorKind() == ErrorKind::FileTooLarge);
    REQUIRE(result.parseErrors().size() == 1);
    REQUIRE(result.parseErrors()[0].rfind("File too large", 0) == 0);
  }

  SECTION("page text exceeds the content limit") {
    auto staged = writeFile(dir.path() / "staged.pdf", "%PDF-1.4");
    ImportLimits limits;
    limits.maxPageCharacters = 100;
    extractor.pageTexts.push_back(std::string(100, 'x'));
    ParseResult result = ParseCoordinator(extractor, limits).parseStatement(staged);
    REQUIRE(result.errorKind() == ErrorKind::ContentTooLarge);
    REQUIRE(result.transactions().empty());
  }

  SECTION("staged file is missing") {
    ParseResult result = ParseCoordinator(extractor).parseStatement(dir.path() / "gone.pdf");
    REQUIRE(result.errorKind() == ErrorKind::DocumentLoadFailed);
  }
}

TEST_CASE("parseStatement accepts pages just under the content limit", "[coordinator]") {
  TempDir dir;
  auto staged = writeFile(dir.path() / "staged.pdf", "%PDF-1.4");
  FakeExtractor extractor;
  ImportLimits limits;
  limits.maxPageCharacters = 100;

  SECTION("ASCII page") {
    extractor.pageTexts = {"15.01.2026 COOP Zürich 45.80", std::string(99, 'x')};
  }
  SECTION("characters are counted, not bytes") {
    std::string umlauts;
    for (int i = 0; i < 99; ++i) umlauts += "ü";
    extractor.pageTexts = {"15.01.2026 COOP Zürich 45.80", umlauts};
  }

  ParseResult result = ParseCoordinator(extractor, limits).parseStatement(staged);
  REQUIRE_FALSE(result.hasFatalError());
  REQUIRE(result.parseErrors().empty());
  REQUIRE(result.transactions().size() == 1);
}

TEST_CASE("parseStatement handles pages made of very long lines", "[coordinator]") {
  TempDir dir;
  auto staged = writeFile(dir.path() / "staged.pdf", "%PDF-1.4");
  FakeExtractor extractor;
  const std::string reference(100000, '7');
  extractor.pageTexts = {
    "Zürcher Kantonalbank\n" + std::string(100000, '-') + "\n" +
    "15.01.2026 Referenz " + reference + " 45.80\n" +
    std::string(100000, '=') + "\n" + reference
  };

  ParseResult result = ParseCoordinator(extractor).parseStatement(staged);

  REQUIRE_FALSE(result.hasFatalError());
  REQUIRE(result.parseErrors().empty());
  REQUIRE(result.transactions().size() == 1);
  REQUIRE(result.transactions()[0].amount() == Amount{4580});
  REQUIRE(result.rawLines().size() == 5);
}
