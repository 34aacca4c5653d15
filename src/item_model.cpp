#include "item_model.hpp"

#include "errors.hpp"
#include "util/vb_log.hpp"

namespace vb
{
ItemModel::ItemModel(int column_count, std::vector<std::string> headers) : columns(column_count), headers(std::move(headers))
{
    VB_ASSERT(columns > 0, ValidationError, "ItemModel needs at least one column (" << columns << " given)!");
    this->headers.resize(columns);
}

int ItemModel::row_count() const
{
    return int(cells.size());
}

int ItemModel::column_count() const
{
    return columns;
}

void ItemModel::set_row_count(int rows)
{
    VB_ASSERT(rows >= 0, ValidationError, "set_row_count() expects a positive row count (" << rows << " given)!");
    cells.resize(rows, std::vector<std::string>(columns));
    rows_reset.emit(rows);
}

void ItemModel::set_item(int row, int column, const std::string& text)
{
    VB_ASSERT(is_valid_row(row) && column >= 0 && column < columns, ValidationError, "set_item() index (" << row << ", " << column << ") is out of range!");
    cells[row][column] = text;
}

const std::string& ItemModel::item(int row, int column) const
{
    VB_ASSERT(is_valid_row(row) && column >= 0 && column < columns, ValidationError, "item() index (" << row << ", " << column << ") is out of range!");
    return cells[row][column];
}

const std::string& ItemModel::header(int column) const
{
    return headers.at(column);
}

bool ItemModel::is_valid_row(int row) const
{
    return row >= 0 && row < row_count();
}

bool ItemModel::is_null(int row) const
{
    if (!is_valid_row(row)) return true;
    return cells[row][0].empty();
}

std::vector<int> ItemModel::find_items(const std::string& text, int column) const
{
    std::vector<int> rows;
    if (column < 0 || column >= columns) return rows;
    for (int row = 0; row < row_count(); ++row)
    {
        if (cells[row][column] == text) rows.push_back(row);
    }
    return rows;
}

ConnectionId ItemModel::subscribe(std::function<void(int)> on_rows_reset)
{
    return rows_reset.connect(std::move(on_rows_reset));
}

void ItemModel::unsubscribe(ConnectionId id)
{
    rows_reset.disconnect(id);
}
} // namespace vb
