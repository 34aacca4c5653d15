#include "weight_edit_orchestrator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <iostream>

#include "errors.hpp"
#include "util/vb_log.hpp"

namespace vb
{
namespace
{
// rounds to 3 decimals and drops trailing zeros, keeping one decimal
std::string format_weight(float weight)
{
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3f", std::round(weight * 1000.0f) / 1000.0f);
    std::string text(buffer);
    while (text.size() > 1 && text.back() == '0' && text[text.size() - 2] != '.') text.pop_back();
    return text == "-0.0" ? "0.0" : text;
}
} // namespace

WeightEditOrchestrator::WeightEditOrchestrator(WeightSource& source, HostCallbacks& host)
    : source(source), host(host), influence_model(1, {"Name"}), weight_model(2, {"Name", "Weight"}),
      influence_view("Influences", SelectionMode::Single), weight_view("Weights", SelectionMode::Single),
      influence_filter(influence_model, influence_view), weight_filter(weight_model, weight_view)
{
    sync.pair(influence_filter, weight_filter);
    influence_connection = influence_filter.subscribe([this](FilterEngine&, FilterEvent event) { on_filter_event(event); });
    weight_connection = weight_filter.subscribe([this](FilterEngine&, FilterEvent event) { on_filter_event(event); });
}

WeightEditOrchestrator::~WeightEditOrchestrator()
{
    unbind();
    influence_filter.unsubscribe(influence_connection);
    weight_filter.unsubscribe(weight_connection);
}

bool WeightEditOrchestrator::set_envelope(bool checked)
{
    influence_model.set_row_count(0);
    weight_model.set_row_count(0);
    unbind();
    if (!checked) return false;

    try
    {
        bind();
    }
    catch (const BindingFailure& e)
    {
        // already reported by VB_THROW, the envelope just stays off
        VB_DEBUG("set_envelope() failed: " << e.what());
        return false;
    }
    catch (const Error& e)
    {
        // the host failed while the lists were populated
        VB_WARN("Unable to edit weights of " << source.object_name() << ": " << e.what());
        unbind();
        influence_model.set_row_count(0);
        weight_model.set_row_count(0);
        return false;
    }
    return true;
}

bool WeightEditOrchestrator::is_bound() const
{
    return state == State::Bound && source.is_valid();
}

void WeightEditOrchestrator::bind()
{
    std::vector<std::string> selection = source.active_selection();
    VB_ASSERT(!selection.empty(), BindingFailure, "set_envelope() expects a selected object!");

    bool success = source.try_set_object(selection.front());
    VB_ASSERT(success, BindingFailure, "Unable to edit weights on " << selection.front() << "!");

    state = State::Bound;
    selection_changed_id = host.add_selection_changed_callback([this]() { invalidate_weights(); });
    undo_id = host.add_undo_callback([this]() { invalidate_weights(); });
    redo_id = host.add_redo_callback([this]() { invalidate_weights(); });
    std::cout << VB_C_GREEN << "Editing weights of " << source.object_name() << VB_C_WHITE << std::endl;

    invalidate_influences();
    invalidate_weights();
}

void WeightEditOrchestrator::unbind()
{
    if (state == State::Inactive) return;

    for (CallbackId id : {selection_changed_id, undo_id, redo_id})
    {
        if (id >= 0) host.remove_callback(id);
    }
    selection_changed_id = undo_id = redo_id = -1;
    if (source.is_valid()) source.reset_object();

    state = State::Inactive;
    soft_selection.clear();
    vertices.clear();
    vertex_weights.clear();
    snapshot_stale = false;
}

void WeightEditOrchestrator::set_precision(bool enabled)
{
    precision = enabled;
    weight_view.set_selection_mode(precision ? SelectionMode::Extended : SelectionMode::Single);
    influence_filter.set_auto_select(!precision);
    weight_filter.set_auto_select(!precision);
}

void WeightEditOrchestrator::search_changed(const std::string& text)
{
    search = "*" + text + "*";
}

void WeightEditOrchestrator::search_pressed()
{
    influence_filter.set_visible(influence_filter.filter_rows_by_pattern(search));
}

InfluenceId WeightEditOrchestrator::active_influence() const
{
    const std::vector<int>& selected = influence_filter.selected_rows();
    VB_ASSERT(!selected.empty(), NoActiveInfluenceError, "Unable to get active influence from current selection!");
    return selected.front();
}

std::vector<InfluenceId> WeightEditOrchestrator::source_influences() const
{
    const std::vector<int>& selected = weight_filter.selected_rows();
    VB_ASSERT(!selected.empty(), NoSelectionError, "source_influences() expects a valid selection!");

    std::vector<InfluenceId> sources;
    if (precision)
    {
        InfluenceId active = active_influence();
        for (int row : selected)
        {
            if (row != active) sources.push_back(row);
        }
    } else
    {
        for (int row : weight_filter.active_rows())
        {
            if (std::find(selected.begin(), selected.end(), row) == selected.end()) sources.push_back(row);
        }
    }
    VB_DEBUG("Source influences: " << sources.size());
    return sources;
}

void WeightEditOrchestrator::invalidate_influences()
{
    if (!is_bound()) return;

    InfluenceList influences = source.influences();
    int row_count = influences.last_index() + 1;
    influence_model.set_row_count(row_count);
    weight_model.set_row_count(row_count);

    for (int id = 0; id < row_count; ++id)
    {
        std::string name;
        if (influences.contains(id))
        {
            name = influences.get_names().at(id);
        } else
        {
            VB_DEBUG("No influence found at id " << id);
        }
        influence_model.set_item(id, NAME_COLUMN, name);
        weight_model.set_item(id, NAME_COLUMN, name);
        weight_model.set_item(id, WEIGHT_COLUMN, "0.0");
    }

    influence_filter.set_visible(influences.ids());
    if (row_count > 0) influence_filter.select_rows({0});
}

void WeightEditOrchestrator::invalidate_weights()
{
    if (!is_bound()) return;

    soft_selection = source.current_soft_selection();
    std::vector<VertexId> selection;
    for (const auto& [vertex, falloff] : soft_selection) selection.push_back(vertex);

    vertices = source.weights_for(selection);
    snapshot_stale = false;

    if (selection.empty())
    {
        vertex_weights.clear();
    } else if (selection.size() == 1)
    {
        auto found = vertices.find(selection.front());
        vertex_weights = found != vertices.end() ? found->second : InfluenceWeights{};
    } else
    {
        vertex_weights = source.average_weights(vertices);
    }

    if (vertex_weights.empty())
    {
        VB_DEBUG("No vertex weights supplied to invalidate filter model.");
        return;
    }

    for (int row = 0; row < weight_model.row_count(); ++row)
    {
        auto found = vertex_weights.find(row);
        weight_model.set_item(row, WEIGHT_COLUMN, format_weight(found != vertex_weights.end() ? found->second : 0.0f));
    }

    std::vector<int> influence_ids;
    for (const auto& [id, weight] : vertex_weights) influence_ids.push_back(id);
    weight_filter.set_visible(influence_ids);
}

void WeightEditOrchestrator::request_influence_change()
{
    if (!is_bound() || influence_filter.selected_rows().empty()) return;
    source.select_influence(active_influence());
}

void WeightEditOrchestrator::on_filter_event(FilterEvent event)
{
    if (event == FilterEvent::SelectionChanged) request_influence_change();
}

void WeightEditOrchestrator::apply_batch(EditFunction edit, float amount)
{
    if (!is_bound()) return;
    if (snapshot_stale) invalidate_weights();

    InfluenceId active = active_influence();
    std::vector<InfluenceId> sources = source_influences();

    WeightSnapshot updates;
    for (const auto& [vertex, falloff] : soft_selection)
    {
        auto found = vertices.find(vertex);
        VB_ASSERT(found != vertices.end(), Error, "No weights cached for vertex " << vertex << "!");
        updates[vertex] = (source.*edit)(found->second, active, sources, amount, falloff);
    }

    try
    {
        source.apply_weights(updates);
    }
    catch (const std::exception&)
    {
        snapshot_stale = true;
        throw;
    }
    invalidate_weights();
}

void WeightEditOrchestrator::set_weights(float amount)
{
    apply_batch(&WeightSource::set_weights, amount);
}

void WeightEditOrchestrator::increment_weights(float amount, bool pull)
{
    apply_batch(&WeightSource::increment_weights, pull ? -amount : amount);
}

void WeightEditOrchestrator::scale_weights(float percent, bool pull)
{
    apply_batch(&WeightSource::scale_weights, pull ? -percent : percent);
}

void WeightEditOrchestrator::apply_preset(float amount)
{
    apply_batch(&WeightSource::set_weights, amount);
}

void WeightEditOrchestrator::copy_weights()
{
    if (!is_bound()) return;
    source.copy_weights();
}

void WeightEditOrchestrator::paste_weights()
{
    if (!is_bound()) return;
    source.paste_weights();
    invalidate_weights();
}

void WeightEditOrchestrator::paste_average_weights()
{
    if (!is_bound()) return;
    source.paste_averaged_weights();
    invalidate_weights();
}

void WeightEditOrchestrator::blend_vertices()
{
    if (!is_bound()) return;
    source.blend_vertices();
    invalidate_weights();
}

void WeightEditOrchestrator::select_affected_vertices()
{
    if (!is_bound()) return;
    std::vector<VertexId> affected = source.vertices_by_influence(weight_filter.get_selected_rows());
    source.set_selection(affected);
}

void WeightEditOrchestrator::on_weight_double_clicked(int row)
{
    VB_DEBUG("User has double clicked " << weight_model.item(row, NAME_COLUMN) << " influence.");
    influence_filter.select_rows({row});
}

bool WeightEditOrchestrator::can_show_context_menu() const
{
    return is_bound() && weight_model.row_count() > 1 && weight_view.selection_model().has_selection();
}
} // namespace vb
