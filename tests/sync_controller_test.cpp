#include <catch2/catch.hpp>

#include "errors.hpp"
#include "sync_controller.hpp"

using namespace vb;

namespace
{
struct SyncedList
{
  SyncedList(const std::string& name, int rows) : model(1), view(name), engine(model, view)
  {
    model.set_row_count(rows);
    std::vector<int> all;
    for (int row = 0; row < rows; ++row)
    {
      model.set_item(row, 0, name + std::to_string(row));
      all.push_back(row);
    }
    engine.set_visible(all);
  }

  void click(int row) { view.click(row, false, false, engine.active_rows()); }

  ItemModel model;
  ListView view;
  FilterEngine engine;
};

void count_events(FilterEngine& engine, FilterEvent kind, int& counter)
{
  engine.subscribe([&counter, kind](FilterEngine&, FilterEvent event)
  {
    if (event == kind) ++counter;
  });
}
} // namespace

TEST_CASE("a selection is pushed to the sibling", "[sync]")
{
  SyncedList a("a", 4);
  SyncedList b("b", 4);
  SyncController sync;
  sync.pair(a.engine, b.engine);

  REQUIRE(sync.is_paired());
  REQUIRE(a.engine.get_sibling() == &b.engine);
  REQUIRE(b.engine.get_sibling() == &a.engine);

  a.click(2);
  REQUIRE(b.engine.get_selected_rows() == std::vector<int>{2});
  REQUIRE(b.engine.selected_rows() == std::vector<int>{2});

  b.click(1);
  REQUIRE(a.engine.get_selected_rows() == std::vector<int>{1});
  REQUIRE_FALSE(sync.get_context().is_pending());
}

TEST_CASE("the sibling's echo does not travel back", "[sync]")
{
  SyncedList a("a", 4);
  SyncedList b("b", 4);
  SyncController sync;
  sync.pair(a.engine, b.engine);

  int a_changes = 0;
  a.view.selection_model().subscribe([&](const std::vector<int>&, const std::vector<int>&) { ++a_changes; });
  int a_requests = 0;
  int b_requests = 0;
  count_events(a.engine, FilterEvent::MatchRequested, a_requests);
  count_events(b.engine, FilterEvent::MatchRequested, b_requests);

  bool pending_seen = false;
  b.view.selection_model().subscribe([&](const std::vector<int>&, const std::vector<int>&)
  {
    pending_seen = b.engine.is_pending() && a.engine.is_pending();
  });

  a.click(3);

  REQUIRE(a_changes == 1);
  REQUIRE(a_requests == 1);
  // b asks for a match but the push back is suppressed
  REQUIRE(b_requests == 1);
  REQUIRE(pending_seen);
  REQUIRE(a.engine.get_selected_rows() == std::vector<int>{3});
  REQUIRE_FALSE(a.engine.is_pending());
}

TEST_CASE("a rejected push clears the pending flag and still announces the change", "[sync]")
{
  SyncedList a("a", 4);
  SyncedList b("b", 2);
  SyncController sync;
  sync.pair(a.engine, b.engine);
  int a_changes = 0;
  count_events(a.engine, FilterEvent::SelectionChanged, a_changes);

  REQUIRE_THROWS_AS(a.click(3), ValidationError);
  REQUIRE_FALSE(sync.get_context().is_pending());
  REQUIRE(a.engine.selected_rows() == std::vector<int>{3});
  REQUIRE(a_changes == 1);

  a.click(1);
  REQUIRE(b.engine.get_selected_rows() == std::vector<int>{1});
}

TEST_CASE("separate pairs do not block each other", "[sync]")
{
  SyncedList a1("a", 3);
  SyncedList b1("b", 3);
  SyncedList a2("c", 3);
  SyncedList b2("d", 3);
  SyncController first;
  SyncController second;
  first.pair(a1.engine, b1.engine);
  second.pair(a2.engine, b2.engine);

  // while the first pair is pushing, drive the second pair
  b1.engine.subscribe([&](FilterEngine&, FilterEvent event)
  {
    if (event == FilterEvent::SelectionChanged) a2.click(2);
  });

  a1.click(1);
  REQUIRE(b1.engine.get_selected_rows() == std::vector<int>{1});
  REQUIRE(b2.engine.get_selected_rows() == std::vector<int>{2});
}

TEST_CASE("nothing is pushed without auto select or after unpairing", "[sync]")
{
  SyncedList a("a", 3);
  SyncedList b("b", 3);
  SyncController sync;
  sync.pair(a.engine, b.engine);

  SECTION("auto select off")
  {
    a.engine.set_auto_select(false);
    a.click(2);
    REQUIRE_FALSE(b.view.selection_model().has_selection());
  }

  SECTION("unpaired")
  {
    sync.unpair();
    REQUIRE_FALSE(sync.is_paired());
    REQUIRE(a.engine.get_sibling() == nullptr);
    a.click(2);
    REQUIRE_FALSE(b.view.selection_model().has_selection());
    REQUIRE_FALSE(a.engine.is_pending());
  }

  SECTION("manual match")
  {
    a.engine.set_auto_select(false);
    a.click(1);
    sync.match_selection(a.engine);
    REQUIRE(b.engine.get_selected_rows() == std::vector<int>{1});
  }
}
