#include "mesh_weight_source.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include "glm/geometric.hpp"
#include "errors.hpp"
#include "util/vb_log.hpp"

namespace vb
{
namespace
{
void remove_small_weights(InfluenceWeights& weights)
{
    for (auto it = weights.begin(); it != weights.end(); )
    {
        if (it->second < MeshWeightSource::WEIGHT_EPSILON) it = weights.erase(it);
        else ++it;
    }
}

void normalize(InfluenceWeights& weights)
{
    float total = 0.0f;
    for (const auto& [id, weight] : weights) total += weight;
    if (total <= 0.0f) return;
    for (auto& [id, weight] : weights) weight /= total;
}

float weight_of(const InfluenceWeights& weights, InfluenceId id)
{
    auto found = weights.find(id);
    return found != weights.end() ? found->second : 0.0f;
}
} // namespace

MeshWeightSource::MeshWeightSource(Rig rig) : rig(std::move(rig))
{
    bind_weights();
}

void MeshWeightSource::bind_weights()
{
    // inverse square distance to the closest joints
    weights.assign(rig.vertices.size(), InfluenceWeights{});
    for (size_t v = 0; v < rig.vertices.size(); ++v)
    {
        std::vector<std::pair<float, InfluenceId>> closest;
        for (const Joint& joint : rig.joints)
        {
            float d = glm::distance(rig.vertices[v], joint.position);
            closest.emplace_back(1.0f / (d * d + 1e-4f), joint.id);
        }
        std::sort(closest.begin(), closest.end(), [](const auto& a, const auto& b) { return a.first > b.first; });
        if (closest.size() > MAX_INFLUENCES) closest.resize(MAX_INFLUENCES);

        for (const auto& [strength, id] : closest) weights[v][id] = strength;
        normalize(weights[v]);
        remove_small_weights(weights[v]);
        normalize(weights[v]);
    }
}

const InfluenceWeights& MeshWeightSource::get_weights(VertexId vertex) const
{
    validate_vertex(vertex, "get_weights");
    return weights[vertex];
}

void MeshWeightSource::set_soft_radius(float radius)
{
    soft_radius = std::max(radius, 0.0f);
    notify(CallbackKind::SelectionChanged);
}

void MeshWeightSource::notify_undo()
{
    notify(CallbackKind::Undo);
}

void MeshWeightSource::notify_redo()
{
    notify(CallbackKind::Redo);
}

std::vector<std::string> MeshWeightSource::active_selection() const
{
    if (!object_selected) return {};
    return {rig.name};
}

bool MeshWeightSource::try_set_object(const std::string& name)
{
    valid = name == rig.name;
    if (!valid) std::cerr << VB_C_RED << "No skinned object named " << name << VB_C_WHITE << std::endl;
    return valid;
}

void MeshWeightSource::reset_object()
{
    valid = false;
    selected_influence = -1;
}

InfluenceList MeshWeightSource::influences() const
{
    InfluenceList list;
    for (const Joint& joint : rig.joints) list.add(joint.id, joint.name);
    return list;
}

SoftSelection MeshWeightSource::current_soft_selection() const
{
    SoftSelection soft;
    for (VertexId vertex : selection) soft[vertex] = 1.0f;
    if (soft_radius <= 0.0f || selection.empty()) return soft;

    // linear falloff on the distance to the closest selected vertex
    for (size_t v = 0; v < rig.vertices.size(); ++v)
    {
        if (soft.count(VertexId(v))) continue;
        float closest = std::numeric_limits<float>::max();
        for (VertexId vertex : selection)
        {
            closest = std::min(closest, glm::distance(rig.vertices[v], rig.vertices[vertex]));
        }
        if (closest < soft_radius) soft[VertexId(v)] = 1.0f - closest / soft_radius;
    }
    return soft;
}

WeightSnapshot MeshWeightSource::weights_for(const std::vector<VertexId>& vertices) const
{
    WeightSnapshot snapshot;
    for (VertexId vertex : vertices)
    {
        validate_vertex(vertex, "weights_for");
        snapshot[vertex] = weights[vertex];
    }
    return snapshot;
}

InfluenceWeights MeshWeightSource::average_weights(const WeightSnapshot& snapshot) const
{
    InfluenceWeights average;
    if (snapshot.empty()) return average;
    for (const auto& [vertex, vertex_weights] : snapshot)
    {
        for (const auto& [id, weight] : vertex_weights) average[id] += weight / float(snapshot.size());
    }
    normalize(average);
    remove_small_weights(average);
    return average;
}

InfluenceWeights MeshWeightSource::redistribute(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float target) const
{
    InfluenceWeights result = existing;
    std::vector<InfluenceId> others;
    for (InfluenceId id : sources)
    {
        if (id != active && std::find(others.begin(), others.end(), id) == others.end()) others.push_back(id);
    }

    float current = weight_of(result, active);
    float available = 0.0f;
    for (InfluenceId id : others) available += weight_of(result, id);

    // the active influence can only take what the sources hold
    target = std::clamp(target, 0.0f, 1.0f);
    target = std::min(target, current + available);
    if (others.empty()) target = current;
    float delta = target - current;

    if (delta > 0.0f)
    {
        for (InfluenceId id : others) result[id] -= delta * weight_of(result, id) / available;
    } else if (delta < 0.0f)
    {
        for (InfluenceId id : others)
        {
            float share = available > 0.0f ? weight_of(result, id) / available : 1.0f / float(others.size());
            result[id] -= delta * share;
        }
    }
    result[active] = target;
    remove_small_weights(result);
    return result;
}

InfluenceWeights MeshWeightSource::set_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float amount, float falloff) const
{
    float current = weight_of(existing, active);
    return redistribute(existing, active, sources, current + (amount - current) * falloff);
}

InfluenceWeights MeshWeightSource::increment_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float amount, float falloff) const
{
    float current = weight_of(existing, active);
    return redistribute(existing, active, sources, current + amount * falloff);
}

InfluenceWeights MeshWeightSource::scale_weights(const InfluenceWeights& existing, InfluenceId active, const std::vector<InfluenceId>& sources, float percent, float falloff) const
{
    float current = weight_of(existing, active);
    return redistribute(existing, active, sources, current + current * percent * falloff);
}

void MeshWeightSource::apply_weights(const WeightSnapshot& updates)
{
    VB_ASSERT(valid, Error, "apply_weights() expects a bound object!");
    for (const auto& [vertex, vertex_weights] : updates) validate_vertex(vertex, "apply_weights");
    for (const auto& [vertex, vertex_weights] : updates) weights[vertex] = vertex_weights;
    VB_DEBUG("Applied weights to " << updates.size() << " vertices");
}

void MeshWeightSource::select_influence(InfluenceId id)
{
    selected_influence = id;
}

std::vector<VertexId> MeshWeightSource::vertices_by_influence(const std::vector<InfluenceId>& ids) const
{
    std::vector<VertexId> affected;
    for (size_t v = 0; v < weights.size(); ++v)
    {
        for (InfluenceId id : ids)
        {
            if (weight_of(weights[v], id) > 0.0f)
            {
                affected.push_back(VertexId(v));
                break;
            }
        }
    }
    return affected;
}

void MeshWeightSource::set_selection(const std::vector<VertexId>& vertices)
{
    for (VertexId vertex : vertices) validate_vertex(vertex, "set_selection");
    selection = vertices;
    std::sort(selection.begin(), selection.end());
    selection.erase(std::unique(selection.begin(), selection.end()), selection.end());
    notify(CallbackKind::SelectionChanged);
}

void MeshWeightSource::copy_weights()
{
    VB_ASSERT(!selection.empty(), NoSelectionError, "copy_weights() expects a vertex selection!");
    clipboard.clear();
    for (VertexId vertex : selection) clipboard.push_back(weights[vertex]);
    std::cout << "Copied weights of " << clipboard.size() << " vertices" << std::endl;
}

void MeshWeightSource::paste_weights()
{
    VB_ASSERT(!clipboard.empty(), Error, "paste_weights() expects copied weights!");
    // pairwise when the counts agree, otherwise the first copied vertex
    for (size_t i = 0; i < selection.size(); ++i)
    {
        weights[selection[i]] = clipboard.size() == selection.size() ? clipboard[i] : clipboard.front();
    }
}

void MeshWeightSource::paste_averaged_weights()
{
    VB_ASSERT(!clipboard.empty(), Error, "paste_averaged_weights() expects copied weights!");
    WeightSnapshot copied;
    for (size_t i = 0; i < clipboard.size(); ++i) copied[VertexId(i)] = clipboard[i];
    InfluenceWeights average = average_weights(copied);
    for (VertexId vertex : selection) weights[vertex] = average;
}

void MeshWeightSource::blend_vertices()
{
    VB_ASSERT(selection.size() > 1, NoSelectionError, "blend_vertices() expects at least two selected vertices!");
    InfluenceWeights average = average_weights(weights_for(selection));
    for (VertexId vertex : selection) weights[vertex] = average;
}

CallbackId MeshWeightSource::add_selection_changed_callback(Callback callback)
{
    return add_callback(CallbackKind::SelectionChanged, std::move(callback));
}

CallbackId MeshWeightSource::add_undo_callback(Callback callback)
{
    return add_callback(CallbackKind::Undo, std::move(callback));
}

CallbackId MeshWeightSource::add_redo_callback(Callback callback)
{
    return add_callback(CallbackKind::Redo, std::move(callback));
}

void MeshWeightSource::remove_callback(CallbackId id)
{
    callbacks.erase(id);
}

CallbackId MeshWeightSource::add_callback(CallbackKind kind, Callback callback)
{
    CallbackId id = next_callback++;
    callbacks[id] = {kind, std::move(callback)};
    return id;
}

void MeshWeightSource::notify(CallbackKind kind)
{
    auto current = callbacks;
    for (const auto& [id, entry] : current)
    {
        if (entry.first == kind && entry.second) entry.second();
    }
}

void MeshWeightSource::validate_vertex(VertexId vertex, const char* caller) const
{
    VB_ASSERT(vertex >= 0 && size_t(vertex) < rig.vertices.size(), ValidationError, caller << "() expects vertex ids in [0, " << rig.vertices.size() << ") (" << vertex << " given)!");
}
} // namespace vb
