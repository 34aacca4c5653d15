#pragma once
#include <array>
#include <string>
#include <vector>
#include "filter_engine.hpp"
#include "item_model.hpp"
#include "list_view.hpp"
#include "sync_controller.hpp"
#include "weight_source.hpp"

namespace vb
{
// owns the influence and weight lists and turns one edit action into a
// single falloff weighted batch on the weight source
class WeightEditOrchestrator
{
public:
  enum class State
  {
    Inactive,
    Bound
  };

  static constexpr std::array<float, 7> PRESETS = {0.0f, 0.1f, 0.25f, 0.5f, 0.75f, 0.9f, 1.0f};
  static constexpr int NAME_COLUMN = 0;
  static constexpr int WEIGHT_COLUMN = 1;

  WeightEditOrchestrator(WeightSource& source, HostCallbacks& host);
  ~WeightEditOrchestrator();
  WeightEditOrchestrator(const WeightEditOrchestrator&) = delete;
  WeightEditOrchestrator& operator=(const WeightEditOrchestrator&) = delete;

  // binds to the first object of the host selection, returns false and
  // stays inactive when that is not possible
  bool set_envelope(bool checked);
  State get_state() const { return state; }
  bool is_bound() const;

  void set_precision(bool precision);
  bool get_precision() const { return precision; }

  void search_changed(const std::string& text);
  const std::string& get_search() const { return search; }
  void search_pressed();

  InfluenceId active_influence() const;
  std::vector<InfluenceId> source_influences() const;

  void invalidate_influences();
  void invalidate_weights();
  void request_influence_change();

  void set_weights(float amount);
  void increment_weights(float amount, bool pull);
  void scale_weights(float percent, bool pull);
  void apply_preset(float amount);

  void copy_weights();
  void paste_weights();
  void paste_average_weights();
  void blend_vertices();
  void select_affected_vertices();

  void on_weight_double_clicked(int row);
  bool can_show_context_menu() const;

  const SoftSelection& get_soft_selection() const { return soft_selection; }
  const WeightSnapshot& get_vertices() const { return vertices; }
  const InfluenceWeights& get_vertex_weights() const { return vertex_weights; }
  bool is_snapshot_stale() const { return snapshot_stale; }

  ItemModel& get_influence_model() { return influence_model; }
  ItemModel& get_weight_model() { return weight_model; }
  ListView& get_influence_view() { return influence_view; }
  ListView& get_weight_view() { return weight_view; }
  FilterEngine& get_influence_filter() { return influence_filter; }
  FilterEngine& get_weight_filter() { return weight_filter; }
  const FilterEngine& get_influence_filter() const { return influence_filter; }
  const FilterEngine& get_weight_filter() const { return weight_filter; }

private:
  using EditFunction = InfluenceWeights (WeightSource::*)(const InfluenceWeights&, InfluenceId, const std::vector<InfluenceId>&, float, float) const;

  WeightSource& source;
  HostCallbacks& host;
  State state = State::Inactive;
  bool precision = false;
  std::string search = "*";

  ItemModel influence_model;
  ItemModel weight_model;
  ListView influence_view;
  ListView weight_view;
  FilterEngine influence_filter;
  FilterEngine weight_filter;
  SyncController sync;

  ConnectionId influence_connection = 0;
  ConnectionId weight_connection = 0;
  CallbackId selection_changed_id = -1;
  CallbackId undo_id = -1;
  CallbackId redo_id = -1;

  SoftSelection soft_selection;
  WeightSnapshot vertices;
  InfluenceWeights vertex_weights;
  bool snapshot_stale = false;

  void bind();
  void unbind();
  void apply_batch(EditFunction edit, float amount);
  void on_filter_event(FilterEvent event);
};
} // namespace vb
