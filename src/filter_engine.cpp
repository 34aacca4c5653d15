#include "filter_engine.hpp"

#include <algorithm>

#include "errors.hpp"
#include "pattern_index.hpp"
#include "sync_controller.hpp"
#include "util/vb_log.hpp"

namespace vb
{
FilterEngine::FilterEngine(ItemModel& model, ListView& view) : model(model), view(view)
{
    model_connection = model.subscribe([this](int row_count) { on_rows_reset(row_count); });
    view_connection = view.selection_model().subscribe([this](const std::vector<int>& selected, const std::vector<int>& deselected)
    {
        on_selection_changed(selected, deselected);
    });
    invalidate_filter();
}

FilterEngine::~FilterEngine()
{
    model.unsubscribe(model_connection);
    view.selection_model().unsubscribe(view_connection);
}

void FilterEngine::invalidate_filter()
{
    active.clear();
    inactive.clear();

    // overrides only survive the pass they were granted for
    std::set<int> pass_overrides;
    pass_overrides.swap(overrides);
    std::set<int> selected(cached_selection.begin(), cached_selection.end());

    for (int row = 0; row < model.row_count(); ++row)
    {
        filter_accepts_row(row, selected, pass_overrides);
    }
}

bool FilterEngine::filter_accepts_row(int row, const std::set<int>& selected, std::set<int>& pass_overrides)
{
    if (model.is_null(row))
    {
        VB_DEBUG(view.get_name() << ": row " << row << " contains null data.");
        inactive.push_back(row);
        return false;
    }

    if (visible.count(row) || selected.count(row))
    {
        active.push_back(row);
        return true;
    }

    if (pass_overrides.erase(row))
    {
        active.push_back(row);
        return true;
    }

    VB_DEBUG(view.get_name() << ": row " << row << " is marked as hidden.");
    inactive.push_back(row);
    return false;
}

void FilterEngine::set_visible(const std::vector<int>& rows)
{
    validate_rows(rows, "set_visible");
    visible = std::set<int>(rows.begin(), rows.end());
    invalidate_filter();
}

void FilterEngine::set_overrides(const std::vector<int>& rows)
{
    validate_rows(rows, "set_overrides");
    overrides = std::set<int>(rows.begin(), rows.end());
    invalidate_filter();
}

void FilterEngine::set_selected_rows(const std::vector<int>& rows)
{
    validate_rows(rows, "set_selected_rows");
    cached_selection = rows;
}

void FilterEngine::set_auto_select(bool enabled)
{
    auto_select = enabled;
    if (auto_select) events.emit(*this, FilterEvent::MatchRequested);
}

std::vector<int> FilterEngine::filter_rows_by_pattern(const std::string& pattern, int column) const
{
    VB_ASSERT(column >= 0 && column < model.column_count(), ValidationError, "filter_rows_by_pattern() column " << column << " is out of range!");
    return PatternIndex(model, column).filter_rows(pattern);
}

std::vector<int> FilterEngine::get_rows_by_text(const std::vector<std::string>& texts, int column) const
{
    std::vector<int> rows;
    for (const auto& text : texts)
    {
        auto found = model.find_items(text, column);
        rows.insert(rows.end(), found.begin(), found.end());
    }
    return rows;
}

void FilterEngine::select_rows(const std::vector<int>& rows)
{
    validate_rows(rows, "select_rows");

    // reveal hidden rows for one pass so they can take the selection,
    // null rows can never be shown so they get no override
    std::vector<int> hidden;
    for (int row : rows)
    {
        if (is_row_hidden(row) && !model.is_null(row)) hidden.push_back(row);
    }
    if (!hidden.empty()) set_overrides(hidden);

    VB_DEBUG(view.get_name() << ": attempting to select " << rows.size() << " row(s)");
    if (!rows.empty())
    {
        std::vector<int> shown;
        for (int row : rows)
        {
            if (!is_row_hidden(row)) shown.push_back(row);
        }
        view.selection_model().select(shown, SelectionFlag::ClearAndSelect);
        if (!is_row_hidden(rows.front())) view.scroll_to(rows.front());
    } else if (!active.empty())
    {
        view.selection_model().select({active.front()}, SelectionFlag::ClearAndSelect);
        view.scroll_to_top();
    } else
    {
        VB_DEBUG(view.get_name() << ": unable to perform selection change request.");
    }
}

bool FilterEngine::is_row_hidden(int row) const
{
    return std::find(inactive.begin(), inactive.end(), row) != inactive.end();
}

bool FilterEngine::is_row_selected(int row) const
{
    return view.selection_model().is_selected(row);
}

std::vector<int> FilterEngine::get_selected_rows() const
{
    return view.selection_model().selected_rows();
}

std::vector<std::string> FilterEngine::get_selected_items(int column) const
{
    std::vector<std::string> items;
    for (int row : get_selected_rows())
    {
        items.push_back(model.item(row, column));
    }
    return items;
}

void FilterEngine::on_selection_changed(const std::vector<int>&, const std::vector<int>&)
{
    // a transient empty selection must not clobber the cached one
    std::vector<int> rows = get_selected_rows();
    if (rows.empty())
    {
        VB_DEBUG(view.get_name() << ": selection is empty.");
        return;
    }

    set_selected_rows(rows);
    invalidate_filter();

    if (auto_select)
    {
        try
        {
            events.emit(*this, FilterEvent::MatchRequested);
        }
        catch (const Error&)
        {
            // the selection is cached already, downstream state follows it
            events.emit(*this, FilterEvent::SelectionChanged);
            throw;
        }
    } else
    {
        VB_DEBUG(view.get_name() << ": selection update is not required.");
    }
    events.emit(*this, FilterEvent::SelectionChanged);
}

ConnectionId FilterEngine::subscribe(Listener listener)
{
    return events.connect(std::move(listener));
}

void FilterEngine::unsubscribe(ConnectionId id)
{
    events.disconnect(id);
}

void FilterEngine::set_sibling(FilterEngine* engine, SyncContext* context)
{
    sibling = engine;
    sync_context = context;
}

bool FilterEngine::is_pending() const
{
    return sync_context && sync_context->is_pending();
}

void FilterEngine::validate_rows(const std::vector<int>& rows, const char* caller) const
{
    for (int row : rows)
    {
        VB_ASSERT(model.is_valid_row(row), ValidationError, caller << "() expects row ids in [0, " << model.row_count() << ") (" << row << " given)!");
    }
}

void FilterEngine::on_rows_reset(int row_count)
{
    auto out_of_range = [row_count](int row) { return row >= row_count; };
    visible.erase(visible.lower_bound(row_count), visible.end());
    overrides.erase(overrides.lower_bound(row_count), overrides.end());
    cached_selection.erase(std::remove_if(cached_selection.begin(), cached_selection.end(), out_of_range), cached_selection.end());
    view.selection_model().prune(row_count);
    invalidate_filter();
}
} // namespace vb
