#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace vb
{
using VertexId = int;
using InfluenceId = int;
using CallbackId = int;

using InfluenceWeights = std::map<InfluenceId, float>;
using SoftSelection = std::map<VertexId, float>;
using WeightSnapshot = std::map<VertexId, InfluenceWeights>;

// influence id -> name, ids may be sparse
class InfluenceList
{
public:
  void add(InfluenceId id, std::string name) { names[id] = std::move(name); }
  bool contains(InfluenceId id) const { return names.count(id) > 0; }
  const std::map<InfluenceId, std::string>& get_names() const { return names; }
  size_t size() const { return names.size(); }
  bool empty() const { return names.empty(); }
  InfluenceId last_index() const { return names.empty() ? -1 : names.rbegin()->first; }

  std::vector<InfluenceId> ids() const
  {
    std::vector<InfluenceId> result;
    for (const auto& [id, name] : names) result.push_back(id);
    return result;
  }

private:
  std::map<InfluenceId, std::string> names;
};

// host side of the skin: reads weights, does the per-vertex maths and
// commits whole batches; every method may throw vb::Error
class WeightSource
{
public:
  virtual ~WeightSource() = default;

  // binding
  virtual std::vector<std::string> active_selection() const = 0;
  virtual bool try_set_object(const std::string& name) = 0;
  virtual void reset_object() = 0;
  virtual bool is_valid() const = 0;
  virtual std::string object_name() const = 0;

  virtual InfluenceList influences() const = 0;
  virtual SoftSelection current_soft_selection() const = 0;
  virtual WeightSnapshot weights_for(const std::vector<VertexId>& vertices) const = 0;
  virtual InfluenceWeights average_weights(const WeightSnapshot& snapshot) const = 0;

  // per vertex redistribution, existing is left untouched
  virtual InfluenceWeights set_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float amount, float falloff) const = 0;
  virtual InfluenceWeights increment_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float amount, float falloff) const = 0;
  virtual InfluenceWeights scale_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float percent, float falloff) const = 0;

  // all or nothing
  virtual void apply_weights(const WeightSnapshot& weights) = 0;

  virtual void select_influence(InfluenceId id) = 0;
  virtual std::vector<VertexId> vertices_by_influence(const std::vector<InfluenceId>& ids) const = 0;
  virtual void set_selection(const std::vector<VertexId>& vertices) = 0;
  virtual void copy_weights() = 0;
  virtual void paste_weights() = 0;
  virtual void paste_averaged_weights() = 0;
  virtual void blend_vertices() = 0;
};

// notifications of the host application
class HostCallbacks
{
public:
  using Callback = std::function<void()>;

  virtual ~HostCallbacks() = default;

  virtual CallbackId add_selection_changed_callback(Callback callback) = 0;
  virtual CallbackId add_undo_callback(Callback callback) = 0;
  virtual CallbackId add_redo_callback(Callback callback) = 0;
  virtual void remove_callback(CallbackId id) = 0;
};
} // namespace vb
