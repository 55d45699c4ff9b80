#pragma once

#include <string>

// Recognizes layout lines of a statement (page markers, headers, balances,
// separators, blank lines) that never carry a transaction.
class LineClassifier {
public:
  // The line is trimmed before matching; markers are case-sensitive and
  // only match at the start of the line. Runs in linear time on any input.
  bool isNoise(const std::string& line) const;
};
