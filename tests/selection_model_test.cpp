#include <catch2/catch.hpp>

#include "errors.hpp"
#include "item_model.hpp"
#include "list_view.hpp"
#include "selection_model.hpp"

using namespace vb;

TEST_CASE("item model keeps cells when resized", "[model]")
{
  ItemModel model(2, {"Name", "Weight"});
  int resets = 0;
  int last_count = -1;
  model.subscribe([&](int rows) { ++resets; last_count = rows; });

  model.set_row_count(2);
  model.set_item(0, 0, "Root");
  model.set_item(1, 1, "0.5");
  model.set_row_count(3);

  REQUIRE(resets == 2);
  REQUIRE(last_count == 3);
  REQUIRE(model.item(0) == "Root");
  REQUIRE(model.item(1, 1) == "0.5");
  REQUIRE(model.item(2).empty());
  REQUIRE(model.header(1) == "Weight");
}

TEST_CASE("item model null rows and lookups", "[model]")
{
  ItemModel model(1);
  model.set_row_count(3);
  model.set_item(0, 0, "Root");
  model.set_item(2, 0, "Root");

  CHECK_FALSE(model.is_null(0));
  CHECK(model.is_null(1));
  CHECK(model.is_null(5));
  CHECK(model.find_items("Root") == std::vector<int>{0, 2});
  CHECK(model.find_items("Root", 4).empty());
  CHECK_THROWS_AS(model.item(3), ValidationError);
  CHECK_THROWS_AS(model.set_item(0, 1, "x"), ValidationError);
  CHECK_THROWS_AS(model.set_row_count(-1), ValidationError);
}

TEST_CASE("selection model reports only real changes", "[selection]")
{
  SelectionModel selection;
  std::vector<std::vector<int>> selected_log;
  std::vector<std::vector<int>> deselected_log;
  selection.subscribe([&](const std::vector<int>& selected, const std::vector<int>& deselected)
  {
    selected_log.push_back(selected);
    deselected_log.push_back(deselected);
  });

  selection.select({3, 1}, SelectionFlag::ClearAndSelect);
  REQUIRE(selection.selected_rows() == std::vector<int>{1, 3});
  REQUIRE(selected_log.size() == 1);
  REQUIRE(selected_log[0] == std::vector<int>{1, 3});

  // same selection again
  selection.select({1, 3}, SelectionFlag::ClearAndSelect);
  REQUIRE(selected_log.size() == 1);

  selection.select({1, 2}, SelectionFlag::Toggle);
  REQUIRE(selection.selected_rows() == std::vector<int>{2, 3});
  REQUIRE(selected_log[1] == std::vector<int>{2});
  REQUIRE(deselected_log[1] == std::vector<int>{1});

  selection.select({3}, SelectionFlag::Deselect);
  selection.select({5}, SelectionFlag::Select);
  REQUIRE(selection.selected_rows() == std::vector<int>{2, 5});

  selection.prune(3);
  REQUIRE(selection.selected_rows() == std::vector<int>{2});
  REQUIRE(selected_log.size() == 4);

  selection.clear();
  REQUIRE_FALSE(selection.has_selection());
  REQUIRE(selected_log.size() == 5);
}

TEST_CASE("list view clicks follow the selection mode", "[view]")
{
  ListView view("weights");
  std::vector<int> shown = {4, 0, 2, 7};

  SECTION("single selection replaces")
  {
    view.click(0, true, false, shown);
    view.click(2, true, false, shown);
    REQUIRE(view.selection_model().selected_rows() == std::vector<int>{2});
  }

  SECTION("ctrl toggles in extended mode")
  {
    view.set_selection_mode(SelectionMode::Extended);
    view.click(0, false, false, shown);
    view.click(2, true, false, shown);
    view.click(0, true, false, shown);
    REQUIRE(view.selection_model().selected_rows() == std::vector<int>{2});
  }

  SECTION("shift selects the displayed range")
  {
    view.set_selection_mode(SelectionMode::Extended);
    view.click(4, false, false, shown);
    view.click(2, false, true, shown);
    REQUIRE(view.selection_model().selected_rows() == std::vector<int>{0, 2, 4});
  }
}

TEST_CASE("scroll requests are taken once", "[view]")
{
  ListView view("influences");
  REQUIRE(view.take_scroll_request().kind == ScrollRequest::None);

  view.scroll_to(6);
  ScrollRequest request = view.take_scroll_request();
  REQUIRE(request.kind == ScrollRequest::Row);
  REQUIRE(request.row == 6);
  REQUIRE(view.take_scroll_request().kind == ScrollRequest::None);

  view.scroll_to_top();
  REQUIRE(view.take_scroll_request().kind == ScrollRequest::Top);
}
