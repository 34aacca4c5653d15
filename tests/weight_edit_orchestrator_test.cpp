#include <catch2/catch.hpp>

#include "errors.hpp"
#include "weight_edit_orchestrator.hpp"

using namespace vb;

namespace
{
struct EditCall
{
  InfluenceId active;
  std::vector<InfluenceId> sources;
  float amount;
  float falloff;
};

// scripted host, records everything the orchestrator asks for
class FakeHost : public WeightSource, public HostCallbacks
{
public:
  std::vector<std::string> selection = {"skin"};
  bool accept_object = true;
  bool valid = false;
  int resets = 0;

  InfluenceList influence_list;
  SoftSelection soft;
  WeightSnapshot weights;

  bool fail_influences = false;
  int throw_on_edit = -1;
  bool reject_commit = false;
  mutable int edit_calls = 0;
  mutable int weights_for_calls = 0;
  mutable int average_calls = 0;
  mutable std::vector<EditCall> edits;
  std::vector<WeightSnapshot> committed;

  InfluenceId selected_influence = -1;
  mutable std::vector<InfluenceId> queried_influences;
  std::vector<VertexId> affected = {7, 9};
  std::vector<VertexId> host_selection;
  int copies = 0;
  int pastes = 0;
  int averaged_pastes = 0;
  int blends = 0;

  std::map<CallbackId, std::pair<int, Callback>> callbacks;
  CallbackId next_id = 1;

  std::vector<std::string> active_selection() const override { return selection; }

  bool try_set_object(const std::string& name) override
  {
    valid = accept_object && name == "skin";
    return valid;
  }

  void reset_object() override
  {
    valid = false;
    ++resets;
  }

  bool is_valid() const override { return valid; }
  std::string object_name() const override { return "skin"; }
  InfluenceList influences() const override
  {
    if (fail_influences) throw Error("influences unavailable");
    return influence_list;
  }
  SoftSelection current_soft_selection() const override { return soft; }

  WeightSnapshot weights_for(const std::vector<VertexId>& vertices) const override
  {
    ++weights_for_calls;
    WeightSnapshot snapshot;
    for (VertexId vertex : vertices)
    {
      auto found = weights.find(vertex);
      if (found != weights.end()) snapshot[vertex] = found->second;
    }
    return snapshot;
  }

  InfluenceWeights average_weights(const WeightSnapshot& snapshot) const override
  {
    ++average_calls;
    InfluenceWeights average;
    for (const auto& [vertex, vertex_weights] : snapshot)
    {
      for (const auto& [id, weight] : vertex_weights) average[id] += weight / float(snapshot.size());
    }
    return average;
  }

  InfluenceWeights set_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float amount, float falloff) const override
  {
    InfluenceWeights result = record(existing, active, sources, amount, falloff);
    result[active] = amount * falloff;
    return result;
  }

  InfluenceWeights increment_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float amount, float falloff) const override
  {
    InfluenceWeights result = record(existing, active, sources, amount, falloff);
    result[active] += amount * falloff;
    return result;
  }

  InfluenceWeights scale_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float percent, float falloff) const override
  {
    InfluenceWeights result = record(existing, active, sources, percent, falloff);
    result[active] *= 1.0f + percent * falloff;
    return result;
  }

  void apply_weights(const WeightSnapshot& updates) override
  {
    if (reject_commit) throw Error("commit rejected");
    committed.push_back(updates);
    for (const auto& [vertex, vertex_weights] : updates) weights[vertex] = vertex_weights;
  }

  void select_influence(InfluenceId id) override { selected_influence = id; }

  std::vector<VertexId> vertices_by_influence(const std::vector<InfluenceId>& ids) const override
  {
    queried_influences = ids;
    return affected;
  }

  void set_selection(const std::vector<VertexId>& vertices) override { host_selection = vertices; }
  void copy_weights() override { ++copies; }
  void paste_weights() override { ++pastes; }
  void paste_averaged_weights() override { ++averaged_pastes; }
  void blend_vertices() override { ++blends; }

  CallbackId add_selection_changed_callback(Callback callback) override { return add(0, std::move(callback)); }
  CallbackId add_undo_callback(Callback callback) override { return add(1, std::move(callback)); }
  CallbackId add_redo_callback(Callback callback) override { return add(2, std::move(callback)); }
  void remove_callback(CallbackId id) override { callbacks.erase(id); }

  void fire(int kind)
  {
    auto current = callbacks;
    for (auto& [id, entry] : current)
    {
      if (entry.first == kind) entry.second();
    }
  }

private:
  CallbackId add(int kind, Callback callback)
  {
    callbacks[next_id] = {kind, std::move(callback)};
    return next_id++;
  }

  InfluenceWeights record(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float amount, float falloff) const
  {
    if (edit_calls++ == throw_on_edit) throw Error("edit failed");
    edits.push_back({active, sources, amount, falloff});
    return existing;
  }
};

// four influences, one vertex touched by all of them
FakeHost make_host()
{
  FakeHost host;
  host.influence_list.add(0, "Root");
  host.influence_list.add(1, "Spine");
  host.influence_list.add(2, "L_Arm");
  host.influence_list.add(3, "R_Arm");
  host.soft = {{10, 1.0f}};
  host.weights[10] = {{0, 0.25f}, {1, 0.25f}, {2, 0.25f}, {3, 0.25f}};
  return host;
}
} // namespace

TEST_CASE("binding needs a selected object the host accepts", "[orchestrator]")
{
  FakeHost host = make_host();
  WeightEditOrchestrator editor(host, host);

  SECTION("nothing selected")
  {
    host.selection.clear();
    REQUIRE_FALSE(editor.set_envelope(true));
  }

  SECTION("object rejected")
  {
    host.accept_object = false;
    REQUIRE_FALSE(editor.set_envelope(true));
  }

  REQUIRE(editor.get_state() == WeightEditOrchestrator::State::Inactive);
  REQUIRE_FALSE(editor.is_bound());
  REQUIRE(host.callbacks.empty());
  REQUIRE(editor.get_influence_model().row_count() == 0);
}

TEST_CASE("a host failure while binding leaves nothing bound", "[orchestrator]")
{
  FakeHost host = make_host();
  host.fail_influences = true;
  WeightEditOrchestrator editor(host, host);

  REQUIRE_FALSE(editor.set_envelope(true));
  REQUIRE(editor.get_state() == WeightEditOrchestrator::State::Inactive);
  REQUIRE(host.callbacks.empty());
  REQUIRE_FALSE(host.valid);
  REQUIRE(host.resets == 1);
  REQUIRE(editor.get_influence_model().row_count() == 0);
  REQUIRE(editor.get_weight_model().row_count() == 0);

  host.fail_influences = false;
  REQUIRE(editor.set_envelope(true));
  REQUIRE(host.callbacks.size() == 3);
}

TEST_CASE("binding fills both lists", "[orchestrator]")
{
  FakeHost host = make_host();
  host.influence_list.add(5, "Head");
  WeightEditOrchestrator editor(host, host);

  REQUIRE(editor.set_envelope(true));
  REQUIRE(editor.get_state() == WeightEditOrchestrator::State::Bound);
  REQUIRE(host.callbacks.size() == 3);

  // id 4 is unused and shows up as a null row
  ItemModel& influences = editor.get_influence_model();
  REQUIRE(influences.row_count() == 6);
  REQUIRE(influences.is_null(4));
  REQUIRE(influences.item(5) == "Head");
  REQUIRE(editor.get_influence_filter().get_visible() == std::set<int>{0, 1, 2, 3, 5});

  // the first row is selected and matched in the weight list
  REQUIRE(editor.get_influence_filter().selected_rows() == std::vector<int>{0});
  REQUIRE(editor.get_weight_filter().selected_rows() == std::vector<int>{0});
  REQUIRE(editor.active_influence() == 0);
  REQUIRE(host.selected_influence == 0);

  ItemModel& weights = editor.get_weight_model();
  REQUIRE(weights.item(1, WeightEditOrchestrator::WEIGHT_COLUMN) == "0.25");
  REQUIRE(weights.item(5, WeightEditOrchestrator::WEIGHT_COLUMN) == "0.0");
  REQUIRE(editor.get_weight_filter().get_visible() == std::set<int>{0, 1, 2, 3});
  REQUIRE(editor.get_weight_filter().is_row_hidden(5));
  REQUIRE(editor.can_show_context_menu());
}

TEST_CASE("several vertices show their average", "[orchestrator]")
{
  FakeHost host = make_host();
  host.soft = {{10, 1.0f}, {11, 0.5f}};
  host.weights[11] = {{1, 1.0f}};
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));

  REQUIRE(host.average_calls == 1);
  REQUIRE(editor.get_vertex_weights().at(1) == Approx(0.625f));
  REQUIRE(editor.get_weight_model().item(1, 1) == "0.625");
  REQUIRE(editor.get_weight_model().item(0, 1) == "0.125");
}

TEST_CASE("releasing the envelope unbinds", "[orchestrator]")
{
  FakeHost host = make_host();
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));

  REQUIRE_FALSE(editor.set_envelope(false));
  REQUIRE(editor.get_state() == WeightEditOrchestrator::State::Inactive);
  REQUIRE(host.callbacks.empty());
  REQUIRE(host.resets == 1);
  REQUIRE(editor.get_influence_model().row_count() == 0);
  REQUIRE(editor.get_weight_model().row_count() == 0);
  REQUIRE(editor.get_soft_selection().empty());
  REQUIRE_FALSE(editor.can_show_context_menu());
}

TEST_CASE("edits do nothing while inactive", "[orchestrator]")
{
  FakeHost host = make_host();
  WeightEditOrchestrator editor(host, host);

  editor.set_weights(0.5f);
  editor.increment_weights(0.1f, false);
  editor.scale_weights(0.1f, true);
  editor.apply_preset(1.0f);
  editor.paste_weights();
  editor.blend_vertices();
  editor.select_affected_vertices();

  REQUIRE(host.edit_calls == 0);
  REQUIRE(host.committed.empty());
  REQUIRE(host.pastes == 0);
  REQUIRE(host.blends == 0);
  REQUIRE(host.host_selection.empty());
}

TEST_CASE("sources are the other active rows", "[orchestrator]")
{
  FakeHost host = make_host();
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));

  editor.get_influence_filter().select_rows({1});
  REQUIRE(editor.get_weight_filter().selected_rows() == std::vector<int>{1});
  REQUIRE(host.selected_influence == 1);
  REQUIRE(editor.source_influences() == std::vector<InfluenceId>{0, 2, 3});
}

TEST_CASE("precision sources are the other selected rows", "[orchestrator]")
{
  FakeHost host = make_host();
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));

  editor.set_precision(true);
  REQUIRE(editor.get_weight_view().get_selection_mode() == SelectionMode::Extended);
  REQUIRE_FALSE(editor.get_influence_filter().get_auto_select());

  editor.get_influence_filter().select_rows({1});
  editor.get_weight_filter().select_rows({0, 1});
  REQUIRE(editor.active_influence() == 1);
  REQUIRE(editor.source_influences() == std::vector<InfluenceId>{0});

  editor.set_precision(false);
  REQUIRE(editor.get_weight_view().get_selection_mode() == SelectionMode::Single);
  REQUIRE(editor.get_weight_filter().get_auto_select());
}

TEST_CASE("an edit becomes one batch", "[orchestrator]")
{
  FakeHost host = make_host();
  host.soft = {{10, 1.0f}, {11, 0.5f}, {12, 0.25f}};
  host.weights[11] = {{0, 1.0f}};
  host.weights[12] = {{1, 1.0f}};
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));
  editor.get_influence_filter().select_rows({2});
  int reads = host.weights_for_calls;

  editor.set_weights(0.8f);

  REQUIRE(host.committed.size() == 1);
  REQUIRE(host.committed[0].size() == 3);
  REQUIRE(host.edits.size() == 3);
  REQUIRE(host.edits[1].active == 2);
  REQUIRE(host.edits[1].falloff == Approx(0.5f));
  REQUIRE(host.edits[2].falloff == Approx(0.25f));
  REQUIRE(host.edits[0].sources == std::vector<InfluenceId>{0, 1, 3});
  REQUIRE(host.weights[12].at(2) == Approx(0.2f));
  // the lists are refreshed from the committed weights
  REQUIRE(host.weights_for_calls == reads + 1);
  REQUIRE_FALSE(editor.is_snapshot_stale());
}

TEST_CASE("pull negates the amount", "[orchestrator]")
{
  FakeHost host = make_host();
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));

  editor.increment_weights(0.1f, true);
  REQUIRE(host.edits.back().amount == Approx(-0.1f));
  editor.increment_weights(0.1f, false);
  REQUIRE(host.edits.back().amount == Approx(0.1f));
  editor.scale_weights(0.25f, true);
  REQUIRE(host.edits.back().amount == Approx(-0.25f));
  editor.apply_preset(WeightEditOrchestrator::PRESETS[4]);
  REQUIRE(host.edits.back().amount == Approx(0.75f));
  REQUIRE(host.committed.size() == 4);
}

TEST_CASE("a failing vertex aborts the whole batch", "[orchestrator]")
{
  FakeHost host = make_host();
  host.soft = {{10, 1.0f}, {11, 0.5f}, {12, 0.25f}};
  host.weights[11] = {{0, 1.0f}};
  host.weights[12] = {{1, 1.0f}};
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));

  host.throw_on_edit = 1;
  REQUIRE_THROWS_AS(editor.set_weights(0.5f), Error);
  REQUIRE(host.committed.empty());
  REQUIRE(host.weights[11].at(0) == Approx(1.0f));
}

TEST_CASE("a vertex without cached weights aborts the batch", "[orchestrator]")
{
  FakeHost host = make_host();
  host.soft = {{10, 1.0f}, {99, 1.0f}};
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));

  REQUIRE_THROWS_AS(editor.increment_weights(0.1f, false), Error);
  REQUIRE(host.committed.empty());
}

TEST_CASE("a rejected commit marks the snapshot stale", "[orchestrator]")
{
  FakeHost host = make_host();
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));

  WeightSnapshot before = editor.get_vertices();
  host.reject_commit = true;
  REQUIRE_THROWS_AS(editor.set_weights(1.0f), Error);
  REQUIRE(editor.is_snapshot_stale());
  REQUIRE(editor.get_vertices() == before);

  // the next edit reads the host again before computing
  host.reject_commit = false;
  host.weights[10] = {{0, 1.0f}};
  int reads = host.weights_for_calls;
  editor.set_weights(0.5f);
  REQUIRE(host.weights_for_calls == reads + 2);
  REQUIRE(host.committed.size() == 1);
  REQUIRE_FALSE(editor.is_snapshot_stale());
}

TEST_CASE("edits need an active influence and a weight selection", "[orchestrator]")
{
  SECTION("no selectable influence")
  {
    FakeHost host;
    host.influence_list.add(1, "Spine");
    host.influence_list.add(2, "L_Arm");
    host.soft = {{10, 1.0f}};
    host.weights[10] = {{1, 1.0f}};
    WeightEditOrchestrator editor(host, host);
    REQUIRE(editor.set_envelope(true));

    // row 0 is null so the initial selection has nowhere to go
    REQUIRE(editor.get_influence_filter().selected_rows().empty());
    REQUIRE_THROWS_AS(editor.set_weights(0.5f), NoActiveInfluenceError);
    REQUIRE(host.committed.empty());
  }

  SECTION("unbound lists are empty")
  {
    FakeHost host = make_host();
    WeightEditOrchestrator editor(host, host);
    REQUIRE_THROWS_AS(editor.active_influence(), NoActiveInfluenceError);
    REQUIRE_THROWS_AS(editor.source_influences(), NoSelectionError);
  }
}

TEST_CASE("host notifications refresh the weights", "[orchestrator]")
{
  FakeHost host = make_host();
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));

  host.soft = {{11, 1.0f}};
  host.weights[11] = {{3, 1.0f}};
  host.fire(0);
  REQUIRE(editor.get_soft_selection().count(11) == 1);
  REQUIRE(editor.get_weight_model().item(3, 1) == "1.0");

  host.weights[11] = {{2, 1.0f}};
  host.fire(1);
  REQUIRE(editor.get_weight_model().item(2, 1) == "1.0");

  host.weights[11] = {{1, 1.0f}};
  host.fire(2);
  REQUIRE(editor.get_weight_model().item(1, 1) == "1.0");
}

TEST_CASE("search narrows the influence list", "[orchestrator]")
{
  FakeHost host = make_host();
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));
  REQUIRE(editor.get_search() == "*");

  editor.search_changed("Arm");
  REQUIRE(editor.get_search() == "*Arm*");
  editor.search_pressed();
  REQUIRE(editor.get_influence_filter().get_visible() == std::set<int>{2, 3});
  // the selected row stays listed
  REQUIRE(editor.get_influence_filter().active_rows() == std::vector<int>{0, 2, 3});
}

TEST_CASE("weight list actions reach the host", "[orchestrator]")
{
  FakeHost host = make_host();
  WeightEditOrchestrator editor(host, host);
  REQUIRE(editor.set_envelope(true));

  SECTION("double click activates the influence")
  {
    editor.on_weight_double_clicked(3);
    REQUIRE(editor.active_influence() == 3);
    REQUIRE(host.selected_influence == 3);
  }

  SECTION("select affected vertices")
  {
    editor.select_affected_vertices();
    REQUIRE(host.queried_influences == std::vector<InfluenceId>{0});
    REQUIRE(host.host_selection == std::vector<VertexId>{7, 9});
  }

  SECTION("clipboard")
  {
    int reads = host.weights_for_calls;
    editor.copy_weights();
    REQUIRE(host.copies == 1);
    REQUIRE(host.weights_for_calls == reads);

    editor.paste_weights();
    editor.paste_average_weights();
    editor.blend_vertices();
    REQUIRE(host.pastes == 1);
    REQUIRE(host.averaged_pastes == 1);
    REQUIRE(host.blends == 1);
    REQUIRE(host.weights_for_calls == reads + 3);
  }
}
