#pragma once

#include <string>
#include <vector>

enum class Category {
  Groceries,
  Transport,
  Rent,
  Utilities,
  Healthcare,
  Dining,
  Shopping,
  Insurance,
  Salary,
  Entertainment,
  Education,
  Savings,
  Other
};

// Display name, e.g. "Groceries".
const char* categoryName(Category category);

// All variants in priority order, Other last.
const std::vector<Category>& allCategories();

struct CategoryRule {
  Category category;
  std::vector<std::string> keywords;  // lowercase substrings
};

// Swiss German, German and English merchant keywords, in priority order.
const std::vector<CategoryRule>& defaultCategoryRules();

// Maps free-text transaction details to a category. The first rule whose
// keyword occurs in the lowercased details wins; no match yields Other.
class Categorizer {
public:
  Categorizer();
  explicit Categorizer(std::vector<CategoryRule> rules);

  Category categorize(const std::string& details) const;

  const std::vector<CategoryRule>& rules() const { return rules_; }

private:
  std::vector<CategoryRule> rules_;
};
