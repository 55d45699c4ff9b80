#include "document_gateway.hpp"
#include "extractor.hpp"
#include "import_config.hpp"
#include "statement_importer.hpp"
#include "transaction.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    if (ch == '"' || ch == '\\') out += '\\';
    out += ch;
  }
  return out;
}

std::string signedAmount(std::int64_t minorUnits) {
  if (minorUnits < 0) return "-" + formatAmount(Amount{-minorUnits});
  return formatAmount(Amount{minorUnits});
}

void printUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " [--validate-only] [--raw] [--verbose] [--staging-dir=dir] [--max-pages=N]"
               " <statement.pdf>\n"
            << "       " << program << " --purge [--staging-dir=dir]\n";
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::string pdfPath;
    bool validateOnly = false;
    bool printRaw = false;
    bool purge = false;
    bool verbose = false;
    GatewayConfig gatewayConfig;
    ImportLimits limits;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--validate-only") {
        validateOnly = true;
      } else if (arg == "--raw") {
        printRaw = true;
      } else if (arg == "--purge") {
        purge = true;
      } else if (arg == "--verbose") {
        verbose = true;
      } else if (arg.rfind("--staging-dir=", 0) == 0) {
        gatewayConfig.stagingDirectory = arg.substr(std::string("--staging-dir=").size());
      } else if (arg.rfind("--max-pages=", 0) == 0) {
        limits.maxPages = std::stoi(arg.substr(std::string("--max-pages=").size()));
      } else if (pdfPath.empty()) {
        pdfPath = arg;
      }
    }

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

    DocumentGateway gateway(gatewayConfig, limits);

    if (purge) {
      std::size_t removed = gateway.purgeStagingArea();
      std::cout << "Purged " << removed << " staged file(s) from '"
                << gateway.stagingDirectory().string() << "'\n";
      return 0;
    }

    if (pdfPath.empty()) {
      printUsage(argv[0]);
      return 2;
    }

    PdftotextExtractor extractor;
    StatementImporter importer(gateway, extractor, limits);
    DocumentHandle handle(pdfPath);

    if (validateOnly) {
      ValidationResult check = importer.checkStatement(handle);
      std::cout << (check.ok ? "OK: " : "INVALID: ") << check.reason << "\n";
      return check.ok ? 0 : 1;
    }

    ParseResult result = importer.importStatement(handle);
    if (result.hasFatalError()) {
      std::cerr << "Error: " << result.parseErrors().front() << "\n";
      return 1;
    }

    // Dry-run view of the result
    std::cout << "{\n";
    std::cout << "  \"source\": \"" << escape(result.sourceName()) << "\",\n";
    std::cout << "  \"transactions\": [\n";
    const auto& transactions = result.transactions();
    for (size_t i = 0; i < transactions.size(); ++i) {
      const Transaction& t = transactions[i];
      std::cout << "    {\"date\": \"" << t.date().toIsoString() << "\", "
                << "\"details\": \"" << escape(t.details()) << "\", "
                << "\"amount\": \"" << t.amount().toString() << "\", "
                << "\"direction\": \"" << directionName(t.direction()) << "\", "
                << "\"category\": \"" << categoryName(t.category()) << "\", "
                << "\"display\": \"" << displayAmount(t) << "\"}"
                << (i + 1 == transactions.size() ? "\n" : ",\n");
    }
    std::cout << "  ],\n";

    StatementSummary summary = summarize(transactions);
    std::cout << "  \"summary\": {\"income\": \"" << formatAmount(summary.totalCredits)
              << "\", \"expenses\": \"" << formatAmount(summary.totalDebits)
              << "\", \"balance\": \"" << signedAmount(summary.balanceMinorUnits) << "\"},\n";

    auto printArray = [&](const char* name, const std::vector<std::string>& arr, bool last) {
      std::cout << "  \"" << name << "\": [";
      for (size_t i = 0; i < arr.size(); ++i) {
        std::cout << "\"" << escape(arr[i]) << "\"" << (i + 1 == arr.size() ? "" : ", ");
      }
      std::cout << (last ? "]\n" : "],\n");
    };

    printArray("parseErrors", result.parseErrors(), !printRaw);
    if (printRaw) printArray("rawLines", result.rawLines(), true);
    std::cout << "}\n";

    return 0;
  } catch (const ImportError& ex) {
    std::cerr << "Error: " << ex.what() << " [" << errorKindName(ex.kind()) << "]\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
