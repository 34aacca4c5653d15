#pragma once
#include <set>
#include <string>
#include <vector>
#include "item_model.hpp"
#include "list_view.hpp"
#include "util/signal.hpp"

namespace vb
{
class SyncContext;

enum class FilterEvent
{
  MatchRequested,   // the sibling should adopt this engine's selection
  SelectionChanged  // downstream state depending on the selection is stale
};

// decides which rows of one list are shown and keeps the cached selection
// of its view; two engines are paired as siblings by a SyncController
class FilterEngine
{
public:
  using Listener = std::function<void(FilterEngine& engine, FilterEvent event)>;

  FilterEngine(ItemModel& model, ListView& view);
  ~FilterEngine();
  FilterEngine(const FilterEngine&) = delete;
  FilterEngine& operator=(const FilterEngine&) = delete;

  // full filter pass over every row of the model
  void invalidate_filter();

  const std::set<int>& get_visible() const { return visible; }
  size_t num_visible() const { return visible.size(); }
  void set_visible(const std::vector<int>& rows);

  const std::set<int>& get_overrides() const { return overrides; }
  void set_overrides(const std::vector<int>& rows);

  // cached selection, updating it emits nothing
  const std::vector<int>& selected_rows() const { return cached_selection; }
  void set_selected_rows(const std::vector<int>& rows);

  bool get_auto_select() const { return auto_select; }
  void set_auto_select(bool enabled);

  const std::vector<int>& active_rows() const { return active; }
  size_t num_active_rows() const { return active.size(); }
  const std::vector<int>& inactive_rows() const { return inactive; }
  size_t num_inactive_rows() const { return inactive.size(); }

  std::vector<int> filter_rows_by_pattern(const std::string& pattern, int column = 0) const;
  std::vector<int> get_rows_by_text(const std::vector<std::string>& texts, int column = 0) const;

  void select_rows(const std::vector<int>& rows);
  bool is_row_hidden(int row) const;
  bool is_row_selected(int row) const;
  std::vector<int> get_selected_rows() const;
  std::vector<std::string> get_selected_items(int column = 0) const;

  // bound to the view's selection model
  void on_selection_changed(const std::vector<int>& selected, const std::vector<int>& deselected);

  ConnectionId subscribe(Listener listener);
  void unsubscribe(ConnectionId id);

  FilterEngine* get_sibling() const { return sibling; }
  void set_sibling(FilterEngine* engine, SyncContext* context);
  bool is_pending() const;

  const ItemModel& get_model() const { return model; }
  ListView& get_view() { return view; }
  const ListView& get_view() const { return view; }

private:
  ItemModel& model;
  ListView& view;
  std::set<int> visible;
  std::set<int> overrides;
  std::vector<int> cached_selection;
  std::vector<int> active;
  std::vector<int> inactive;
  bool auto_select = true;
  FilterEngine* sibling = nullptr;
  SyncContext* sync_context = nullptr;
  ConnectionId model_connection = 0;
  ConnectionId view_connection = 0;
  Signal<FilterEngine&, FilterEvent> events;

  bool filter_accepts_row(int row, const std::set<int>& selected, std::set<int>& pass_overrides);
  void validate_rows(const std::vector<int>& rows, const char* caller) const;
  void on_rows_reset(int row_count);
};
} // namespace vb
