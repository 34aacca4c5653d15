#pragma once
#include <string>
#include <vector>
#include "util/signal.hpp"

namespace vb
{
// source table behind one list view: row_count x column_count text cells
class ItemModel
{
public:
  explicit ItemModel(int column_count, std::vector<std::string> headers = {});

  int row_count() const;
  int column_count() const;

  // resizes the table, new cells are empty, emits rows_reset
  void set_row_count(int rows);
  void set_item(int row, int column, const std::string& text);
  const std::string& item(int row, int column = 0) const;
  const std::string& header(int column) const;

  bool is_valid_row(int row) const;
  bool is_null(int row) const;

  // rows whose label in column equals text, in row order
  std::vector<int> find_items(const std::string& text, int column = 0) const;

  ConnectionId subscribe(std::function<void(int)> on_rows_reset);
  void unsubscribe(ConnectionId id);

private:
  int columns;
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> cells;
  Signal<int> rows_reset;
};
} // namespace vb
