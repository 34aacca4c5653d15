#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "rig.hpp"
#include "weight_source.hpp"

namespace vb
{
// in-process host: a skinned point mesh with a component selection,
// a linear soft selection and a weight clipboard
class MeshWeightSource : public WeightSource, public HostCallbacks
{
public:
  // weights below this are removed after every edit
  static constexpr float WEIGHT_EPSILON = 1e-5f;
  static constexpr uint32_t MAX_INFLUENCES = 4;

  explicit MeshWeightSource(Rig rig);

  const Rig& get_rig() const { return rig; }
  const InfluenceWeights& get_weights(VertexId vertex) const;
  const std::vector<VertexId>& get_selection() const { return selection; }
  InfluenceId get_selected_influence() const { return selected_influence; }

  // host selection of the mesh object itself
  bool is_object_selected() const { return object_selected; }
  void set_object_selected(bool selected) { object_selected = selected; }

  float get_soft_radius() const { return soft_radius; }
  void set_soft_radius(float radius);

  // fires the undo/redo notifications of the host
  void notify_undo();
  void notify_redo();

  std::vector<std::string> active_selection() const override;
  bool try_set_object(const std::string& name) override;
  void reset_object() override;
  bool is_valid() const override { return valid; }
  std::string object_name() const override { return valid ? rig.name : std::string(); }

  InfluenceList influences() const override;
  SoftSelection current_soft_selection() const override;
  WeightSnapshot weights_for(const std::vector<VertexId>& vertices) const override;
  InfluenceWeights average_weights(const WeightSnapshot& snapshot) const override;

  InfluenceWeights set_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float amount, float falloff) const override;
  InfluenceWeights increment_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float amount, float falloff) const override;
  InfluenceWeights scale_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float percent, float falloff) const override;
  void apply_weights(const WeightSnapshot& updates) override;

  void select_influence(InfluenceId id) override;
  std::vector<VertexId> vertices_by_influence(const std::vector<InfluenceId>& ids) const override;
  void set_selection(const std::vector<VertexId>& vertices) override;
  void copy_weights() override;
  void paste_weights() override;
  void paste_averaged_weights() override;
  void blend_vertices() override;

  CallbackId add_selection_changed_callback(Callback callback) override;
  CallbackId add_undo_callback(Callback callback) override;
  CallbackId add_redo_callback(Callback callback) override;
  void remove_callback(CallbackId id) override;

private:
  enum class CallbackKind
  {
    SelectionChanged,
    Undo,
    Redo
  };

  Rig rig;
  std::vector<InfluenceWeights> weights;
  std::vector<VertexId> selection;
  InfluenceId selected_influence = -1;
  bool object_selected = true;
  bool valid = false;
  float soft_radius = 0.0f;
  std::vector<InfluenceWeights> clipboard;
  std::map<CallbackId, std::pair<CallbackKind, Callback>> callbacks;
  CallbackId next_callback = 1;

  // moves weight between the active influence and the sources so that
  // active ends up at target and the vertex still sums to one
  InfluenceWeights redistribute(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float target) const;
  void bind_weights();
  void validate_vertex(VertexId vertex, const char* caller) const;
  CallbackId add_callback(CallbackKind kind, Callback callback);
  void notify(CallbackKind kind);
};
} // namespace vb
