#include "selection_model.hpp"

#include <algorithm>
#include <iterator>

namespace vb
{
void SelectionModel::select(const std::vector<int>& rows, SelectionFlag flag)
{
    std::set<int> next = selection;
    switch (flag)
    {
        case SelectionFlag::ClearAndSelect:
            next = std::set<int>(rows.begin(), rows.end());
            break;
        case SelectionFlag::Select:
            next.insert(rows.begin(), rows.end());
            break;
        case SelectionFlag::Deselect:
            for (int row : rows) next.erase(row);
            break;
        case SelectionFlag::Toggle:
            for (int row : rows)
            {
                if (!next.erase(row)) next.insert(row);
            }
            break;
    }

    std::vector<int> selected;
    std::vector<int> deselected;
    std::set_difference(next.begin(), next.end(), selection.begin(), selection.end(), std::back_inserter(selected));
    std::set_difference(selection.begin(), selection.end(), next.begin(), next.end(), std::back_inserter(deselected));
    if (selected.empty() && deselected.empty()) return;

    selection = std::move(next);
    selection_changed.emit(selected, deselected);
}

void SelectionModel::clear()
{
    select({}, SelectionFlag::ClearAndSelect);
}

void SelectionModel::prune(int row_count)
{
    selection.erase(selection.lower_bound(row_count), selection.end());
}

bool SelectionModel::is_selected(int row) const
{
    return selection.count(row) > 0;
}

bool SelectionModel::has_selection() const
{
    return !selection.empty();
}

std::vector<int> SelectionModel::selected_rows() const
{
    return std::vector<int>(selection.begin(), selection.end());
}

ConnectionId SelectionModel::subscribe(Listener listener)
{
    return selection_changed.connect(std::move(listener));
}

void SelectionModel::unsubscribe(ConnectionId id)
{
    selection_changed.disconnect(id);
}
} // namespace vb
