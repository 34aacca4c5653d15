#pragma once
#include <set>
#include <vector>
#include "util/signal.hpp"

namespace vb
{
enum class SelectionFlag
{
  ClearAndSelect,
  Select,
  Deselect,
  Toggle
};

// selection of source rows owned by one view
class SelectionModel
{
public:
  using Listener = std::function<void(const std::vector<int>& selected, const std::vector<int>& deselected)>;

  // emits selection_changed only when the selection actually changes
  void select(const std::vector<int>& rows, SelectionFlag flag);
  void clear();

  // drops rows >= row_count without emitting, used when the model is reset
  void prune(int row_count);

  bool is_selected(int row) const;
  bool has_selection() const;
  std::vector<int> selected_rows() const;

  ConnectionId subscribe(Listener listener);
  void unsubscribe(ConnectionId id);

private:
  std::set<int> selection;
  Signal<const std::vector<int>&, const std::vector<int>&> selection_changed;
};
} // namespace vb
