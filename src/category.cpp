#include "category.hpp"

#include "text_utils.hpp"

#include <utility>

const char* categoryName(Category category) {
  switch (category) {
    case Category::Groceries: return "Groceries";
    case Category::Transport: return "Transport";
    case Category::Rent: return "Rent";
    case Category::Utilities: return "Utilities";
    case Category::Healthcare: return "Healthcare";
    case Category::Dining: return "Dining";
    case Category::Shopping: return "Shopping";
    case Category::Insurance: return "Insurance";
    case Category::Salary: return "Salary";
    case Category::Entertainment: return "Entertainment";
    case Category::Education: return "Education";
    case Category::Savings: return "Savings";
    case Category::Other: return "Other";
  }
  return "Other";
}

const std::vector<Category>& allCategories() {
  static const std::vector<Category> categories = {
    Category::Groceries, Category::Transport, Category::Rent, Category::Utilities,
    Category::Healthcare, Category::Dining, Category::Shopping, Category::Insurance,
    Category::Salary, Category::Entertainment, Category::Education, Category::Savings,
    Category::Other
  };
  return categories;
}

const std::vector<CategoryRule>& defaultCategoryRules() {
  static const std::vector<CategoryRule> rules = {
    {Category::Groceries, {"coop", "migros", "denner", "aldi", "lidl", "spar", "volg"}},
    {Category::Transport, {"sbb", "zvv", "vbz", "mobility", "uber", "taxi", "publibike", "lime"}},
    {Category::Rent, {"miete", "rent", "wohnung", "immobilien"}},
    {Category::Utilities, {"ewz", "swisscom", "salt", "sunrise", "elektrizität", "strom", "gas",
                           "wasser", "utilities"}},
    {Category::Healthcare, {"krankenkasse", "css", "helsana", "sanitas", "apotheke", "pharmacy",
                            "arzt", "zahnarzt", "spital", "hospital"}},
    {Category::Dining, {"restaurant", "café", "coffee", "starbucks", "mcdonald", "burger king",
                        "pizzeria", "bar"}},
    {Category::Shopping, {"h&m", "zara", "manor", "globus", "jelmoli", "amazon", "digitec",
                          "galaxus"}},
    {Category::Insurance, {"versicherung", "insurance", "allianz", "axa", "zurich insurance",
                           "helvetia"}},
    {Category::Salary, {"lohn", "gehalt", "salary", "lohnzahlung"}},
    {Category::Entertainment, {"kino", "cinema", "netflix", "spotify", "apple music", "theater",
                               "konzert"}},
    {Category::Education, {"eth", "universität", "university", "uzh", "schule", "school"}},
    {Category::Savings, {"sparkonto", "savings", "3a", "vorsorgekonto"}}
  };
  return rules;
}

Categorizer::Categorizer() : rules_(defaultCategoryRules()) {}

Categorizer::Categorizer(std::vector<CategoryRule> rules) : rules_(std::move(rules)) {}

Category Categorizer::categorize(const std::string& details) const {
  const std::string normalized = toLowerUtf8(details);
  for (const CategoryRule& rule : rules_) {
    for (const std::string& keyword : rule.keywords) {
      if (normalized.find(keyword) != std::string::npos) return rule.category;
    }
  }
  return Category::Other;
}
