#pragma once
#include <string>
#include <vector>
#include "selection_model.hpp"

namespace vb
{
enum class SelectionMode
{
  Single,
  Extended
};

struct ScrollRequest
{
  enum Kind
  {
    None,
    Row,
    Top
  };

  Kind kind = None;
  int row = -1;
};

// everything a drawn list needs besides its rows: selection, selection
// mode and a pending scroll request for the next frame
class ListView
{
public:
  explicit ListView(std::string name, SelectionMode mode = SelectionMode::Single);

  const std::string& get_name() const { return name; }
  SelectionModel& selection_model() { return selection; }
  const SelectionModel& selection_model() const { return selection; }

  SelectionMode get_selection_mode() const { return mode; }
  void set_selection_mode(SelectionMode selection_mode);

  void scroll_to(int row);
  void scroll_to_top();
  ScrollRequest take_scroll_request();

  // mouse click on row; shown_rows is the row order currently on screen
  void click(int row, bool ctrl, bool shift, const std::vector<int>& shown_rows);

private:
  std::string name;
  SelectionMode mode;
  SelectionModel selection;
  ScrollRequest scroll;
  int anchor = -1;
};
} // namespace vb
