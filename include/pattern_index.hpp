#pragma once
#include <string>
#include <vector>

namespace vb
{
class ItemModel;

// glob matching over the labels of one model column
class PatternIndex
{
public:
  explicit PatternIndex(const ItemModel& model, int column = 0);

  // '*' any run, '?' one character, [seq] / [!seq] character sets with
  // ranges; case-sensitive and anchored at both ends
  static bool match(const std::string& label, const std::string& pattern);

  // rows whose label matches, in row order
  std::vector<int> filter_rows(const std::string& pattern) const;

private:
  const ItemModel& model;
  int column;
};
} // namespace vb
