#include "list_view.hpp"

#include <algorithm>

namespace vb
{
ListView::ListView(std::string name, SelectionMode mode) : name(std::move(name)), mode(mode)
{}

void ListView::set_selection_mode(SelectionMode selection_mode)
{
    mode = selection_mode;
}

void ListView::scroll_to(int row)
{
    scroll.kind = ScrollRequest::Row;
    scroll.row = row;
}

void ListView::scroll_to_top()
{
    scroll.kind = ScrollRequest::Top;
    scroll.row = -1;
}

ScrollRequest ListView::take_scroll_request()
{
    ScrollRequest request = scroll;
    scroll = ScrollRequest{};
    return request;
}

void ListView::click(int row, bool ctrl, bool shift, const std::vector<int>& shown_rows)
{
    if (mode == SelectionMode::Single)
    {
        anchor = row;
        selection.select({row}, SelectionFlag::ClearAndSelect);
        return;
    }

    if (ctrl)
    {
        anchor = row;
        selection.select({row}, SelectionFlag::Toggle);
        return;
    }

    auto first = std::find(shown_rows.begin(), shown_rows.end(), anchor);
    auto last = std::find(shown_rows.begin(), shown_rows.end(), row);
    if (shift && first != shown_rows.end() && last != shown_rows.end())
    {
        // range between the anchor and the clicked row in display order
        if (first > last) std::swap(first, last);
        selection.select(std::vector<int>(first, last + 1), SelectionFlag::ClearAndSelect);
        return;
    }

    anchor = row;
    selection.select({row}, SelectionFlag::ClearAndSelect);
}
} // namespace vb
