#include "ui.hpp"
#include "imgui.h"
#include "backends/imgui_impl_vulkan.h"
#include "backends/imgui_impl_sdl3.h"
#include <implot.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace vb {

UI::UI(const VulkanMainContext& vmc) : vmc(vmc)
{}

void UI::construct(vk::RenderPass render_pass, uint32_t min_image_count, uint32_t image_count)
{
    std::vector<vk::DescriptorPoolSize> pool_sizes =
    {
        { vk::DescriptorType::eCombinedImageSampler, 16 }
    };

    vk::DescriptorPoolCreateInfo dpci{};
    dpci.sType = vk::StructureType::eDescriptorPoolCreateInfo;
    dpci.flags = vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet;
    dpci.maxSets = 16;
    dpci.poolSizeCount = pool_sizes.size();
    dpci.pPoolSizes = pool_sizes.data();

    imgui_pool = vmc.device.createDescriptorPool(dpci);

    ImGui::CreateContext();
    ImPlot::CreateContext();
    ImGui::GetIO().IniFilename = "settings/imgui.ini";
    ImGui_ImplSDL3_InitForVulkan(vmc.window->get());
    ImGui_ImplVulkan_InitInfo init_info{};
    init_info.Instance = vmc.instance;
    init_info.PhysicalDevice = vmc.physical_device;
    init_info.Device = vmc.device;
    init_info.QueueFamily = vmc.get_queue_family();
    init_info.Queue = vmc.get_graphics_queue();
    init_info.DescriptorPool = imgui_pool;
    init_info.RenderPass = render_pass;
    init_info.Subpass = 0;
    init_info.MinImageCount = min_image_count;
    init_info.ImageCount = image_count;
    init_info.MSAASamples = VK_SAMPLE_COUNT_1_BIT;

    ImGui_ImplVulkan_Init(&init_info);
    ImGui::StyleColorsDark();
}

void UI::destruct()
{
    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImPlot::DestroyContext();
    ImGui::DestroyContext();
    vmc.device.destroyDescriptorPool(imgui_pool);
}

void UI::set_orchestrator(WeightEditOrchestrator* orchestrator)
{
    this->orchestrator = orchestrator;
}

void UI::set_mesh(MeshWeightSource* mesh)
{
    this->mesh = mesh;
}

void UI::set_action_runner(const ActionRunner& runner)
{
    run_action = runner;
}

void UI::run(const char* name, const std::function<void()>& action)
{
    if (run_action) run_action(name, action);
    else action();
}

void UI::draw(vk::CommandBuffer& cb, EditorState& state)
{
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();

    // the editor fills the whole window
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::Begin("vblend", nullptr, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings);

    if (orchestrator)
    {
        draw_controls(state);
        ImGui::Separator();

        float list_height = std::max(120.0f, ImGui::GetContentRegionAvail().y * 0.3f);
        if (ImGui::CollapsingHeader("Influences", ImGuiTreeNodeFlags_DefaultOpen))
        {
            draw_list("influence_table", orchestrator->get_influence_model(), orchestrator->get_influence_view(), orchestrator->get_influence_filter(), false, list_height);
        }
        if (ImGui::CollapsingHeader("Weights", ImGuiTreeNodeFlags_DefaultOpen))
        {
            draw_list("weight_table", orchestrator->get_weight_model(), orchestrator->get_weight_view(), orchestrator->get_weight_filter(), true, list_height);
        }
        if (state.show_weight_plot && ImGui::CollapsingHeader("Weight Plot"))
        {
            draw_weight_plot();
        }
    }
    if (mesh && ImGui::CollapsingHeader("Mesh"))
    {
        draw_mesh_panel(state);
    }

    ImGui::Separator();
    if (!state.status.empty()) ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s", state.status.c_str());
    ImGui::Text("%.3f ms; FPS: %.1f", state.time_diff * 1000.0f, 1.0f / state.time_diff);
    ImGui::Text("'F2': Show/Hide UI");
    ImGui::End();

    ImGui::Render();
    ImGui_ImplVulkan_RenderDrawData(ImGui::GetDrawData(), cb);
}

void UI::draw_controls(EditorState& state)
{
    if (ImGui::Checkbox("Edit Envelope", &state.envelope))
    {
        bool checked = state.envelope;
        state.envelope = false;
        run("edit envelope", [&]() { state.envelope = orchestrator->set_envelope(checked); });
    }
    ImGui::SameLine();
    if (ImGui::Checkbox("Precision", &state.precision))
    {
        run("precision", [&]() { orchestrator->set_precision(state.precision); });
    }
    ImGui::SameLine();
    ImGui::TextDisabled("%s", orchestrator->is_bound() && mesh ? mesh->object_name().c_str() : "no object");

    // search filters the influence list by "*text*"
    bool search_entered = ImGui::InputTextWithHint("##search", "Search...", search_buffer, IM_ARRAYSIZE(search_buffer), ImGuiInputTextFlags_EnterReturnsTrue);
    if (ImGui::IsItemEdited() || search_entered)
    {
        state.search = search_buffer;
        orchestrator->search_changed(state.search);
    }
    ImGui::SameLine();
    if (ImGui::Button("Search") || search_entered)
    {
        run("search", [&]() { orchestrator->search_pressed(); });
    }

    ImGui::Separator();
    ImGui::BeginDisabled(!orchestrator->is_bound());

    for (size_t i = 0; i < WeightEditOrchestrator::PRESETS.size(); ++i)
    {
        float preset = WeightEditOrchestrator::PRESETS[i];
        char label[16];
        std::snprintf(label, sizeof(label), "%g", preset);
        if (i > 0) ImGui::SameLine();
        if (ImGui::Button(label, ImVec2(40.0f, 0.0f)))
        {
            run("apply preset", [&]() { orchestrator->apply_preset(preset); });
        }
    }

    ImGui::PushItemWidth(80.0f);
    ImGui::DragFloat("##set", &state.set_amount, 0.01f, 0.0f, 1.0f, "%.3f");
    ImGui::SameLine();
    if (ImGui::Button("Set"))
    {
        run("set weights", [&]() { orchestrator->set_weights(state.set_amount); });
    }

    ImGui::DragFloat("##increment", &state.increment_amount, 0.01f, 0.0f, 1.0f, "%.3f");
    ImGui::SameLine();
    if (ImGui::Button("+##increment"))
    {
        run("increment weights", [&]() { orchestrator->increment_weights(state.increment_amount, false); });
    }
    ImGui::SameLine();
    if (ImGui::Button("-##increment"))
    {
        run("decrement weights", [&]() { orchestrator->increment_weights(state.increment_amount, true); });
    }
    ImGui::SameLine();
    ImGui::Text("Increment");

    ImGui::DragFloat("##scale", &state.scale_amount, 0.01f, 0.0f, 1.0f, "%.3f");
    ImGui::SameLine();
    if (ImGui::Button("+##scale"))
    {
        run("scale weights", [&]() { orchestrator->scale_weights(state.scale_amount, false); });
    }
    ImGui::SameLine();
    if (ImGui::Button("-##scale"))
    {
        run("scale weights", [&]() { orchestrator->scale_weights(state.scale_amount, true); });
    }
    ImGui::SameLine();
    ImGui::Text("Scale");
    ImGui::PopItemWidth();
    state.clamp_amounts();

    if (ImGui::Button("Copy")) run("copy weights", [&]() { orchestrator->copy_weights(); });
    ImGui::SameLine();
    if (ImGui::Button("Paste")) run("paste weights", [&]() { orchestrator->paste_weights(); });
    ImGui::SameLine();
    if (ImGui::Button("Paste Average")) run("paste average weights", [&]() { orchestrator->paste_average_weights(); });
    ImGui::SameLine();
    if (ImGui::Button("Blend")) run("blend vertices", [&]() { orchestrator->blend_vertices(); });

    ImGui::EndDisabled();
}

void UI::draw_list(const char* id, ItemModel& model, ListView& view, FilterEngine& filter, bool weights, float height)
{
    // rows are copied, a click re-filters and changes active_rows()
    std::vector<int> rows = filter.active_rows();
    ScrollRequest scroll = view.take_scroll_request();
    int scroll_index = -1;
    if (scroll.kind == ScrollRequest::Row)
    {
        auto found = std::find(rows.begin(), rows.end(), scroll.row);
        if (found != rows.end()) scroll_index = int(found - rows.begin());
    }

    int clicked = -1;
    bool double_clicked = false;
    bool select_affected = false;
    const ImGuiIO& io = ImGui::GetIO();

    ImGuiTableFlags flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV | ImGuiTableFlags_BordersOuter | ImGuiTableFlags_ScrollY;
    if (ImGui::BeginTable(id, model.column_count(), flags, ImVec2(0.0f, height)))
    {
        ImGui::TableSetupScrollFreeze(0, 1);
        for (int column = 0; column < model.column_count(); ++column)
        {
            ImGui::TableSetupColumn(model.header(column).c_str(), column == 0 ? ImGuiTableColumnFlags_WidthStretch : ImGuiTableColumnFlags_WidthFixed, column == 0 ? 0.0f : 60.0f);
        }
        ImGui::TableHeadersRow();
        if (scroll.kind == ScrollRequest::Top) ImGui::SetScrollY(0.0f);

        ImGuiListClipper clipper;
        clipper.Begin(int(rows.size()));
        if (scroll_index >= 0) clipper.IncludeItemByIndex(scroll_index);
        while (clipper.Step())
        {
            for (int i = clipper.DisplayStart; i < clipper.DisplayEnd; ++i)
            {
                int row = rows[i];
                ImGui::TableNextRow();
                ImGui::TableSetColumnIndex(0);
                ImGui::PushID(row);
                bool selected = view.selection_model().is_selected(row);
                if (ImGui::Selectable(model.item(row).c_str(), selected, ImGuiSelectableFlags_SpanAllColumns | ImGuiSelectableFlags_AllowDoubleClick))
                {
                    clicked = row;
                    double_clicked = weights && ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left);
                }
                if (i == scroll_index) ImGui::SetScrollHereY(0.0f);
                if (weights && ImGui::BeginPopupContextItem("weight_menu"))
                {
                    if (ImGui::MenuItem("Select Affected Vertices", nullptr, false, orchestrator->can_show_context_menu())) select_affected = true;
                    ImGui::EndPopup();
                }
                for (int column = 1; column < model.column_count(); ++column)
                {
                    ImGui::TableSetColumnIndex(column);
                    ImGui::TextUnformatted(model.item(row, column).c_str());
                }
                ImGui::PopID();
            }
        }
        ImGui::EndTable();
    }

    if (double_clicked)
    {
        run("double click", [&]() { orchestrator->on_weight_double_clicked(clicked); });
    }
    else if (clicked >= 0)
    {
        run("select", [&]() { view.click(clicked, io.KeyCtrl, io.KeyShift, rows); });
    }
    if (select_affected)
    {
        run("select affected vertices", [&]() { orchestrator->select_affected_vertices(); });
    }
}

void UI::draw_weight_plot()
{
    const InfluenceWeights& weights = orchestrator->get_vertex_weights();
    if (weights.empty())
    {
        ImGui::TextDisabled("No vertex selected");
        return;
    }

    std::vector<double> positions;
    std::vector<double> values;
    std::vector<std::string> names;
    for (const auto& [id, weight] : weights)
    {
        positions.push_back(double(positions.size()));
        values.push_back(weight);
        const ItemModel& model = orchestrator->get_influence_model();
        names.push_back(model.is_valid_row(id) ? model.item(id) : std::to_string(id));
    }
    std::vector<const char*> labels;
    for (const auto& name : names) labels.push_back(name.c_str());

    if (ImPlot::BeginPlot("##weights", ImVec2(-1, 180)))
    {
        ImPlot::SetupAxes(nullptr, "weight", ImPlotAxisFlags_None, ImPlotAxisFlags_None);
        ImPlot::SetupAxisTicks(ImAxis_X1, positions.data(), int(positions.size()), labels.data());
        ImPlot::SetupAxisLimits(ImAxis_X1, -0.5, double(positions.size()) - 0.5, ImPlotCond_Always);
        ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, 1.0, ImPlotCond_Always);
        ImPlot::PlotBars("weight", values.data(), int(values.size()), 0.6);
        ImPlot::EndPlot();
    }
}

void UI::draw_mesh_panel(EditorState& state)
{
    bool object_selected = mesh->is_object_selected();
    if (ImGui::Checkbox("Object Selected", &object_selected)) mesh->set_object_selected(object_selected);

    if (ImGui::SliderFloat("Soft Radius", &state.soft_radius, 0.0f, 2.0f, "%.2f"))
    {
        run("soft selection", [&]() { mesh->set_soft_radius(state.soft_radius); });
    }

    const Rig& rig = mesh->get_rig();
    if (ImGui::Button("Select All"))
    {
        std::vector<VertexId> all(rig.vertices.size());
        for (size_t v = 0; v < all.size(); ++v) all[v] = VertexId(v);
        run("select all", [&]() { mesh->set_selection(all); });
    }
    ImGui::SameLine();
    if (ImGui::Button("Clear Selection")) run("clear selection", [&]() { mesh->set_selection({}); });

    // component selection of the host: click, ctrl toggles, shift extends
    const std::vector<VertexId>& selection = mesh->get_selection();
    int clicked = -1;
    if (ImGui::BeginTable("vertex_table", 3, ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersOuter | ImGuiTableFlags_ScrollY, ImVec2(0.0f, 160.0f)))
    {
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("Vertex", ImGuiTableColumnFlags_WidthFixed, 60.0f);
        ImGui::TableSetupColumn("Position", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("Influences", ImGuiTableColumnFlags_WidthFixed, 70.0f);
        ImGui::TableHeadersRow();

        ImGuiListClipper clipper;
        clipper.Begin(int(rig.vertices.size()));
        while (clipper.Step())
        {
            for (int v = clipper.DisplayStart; v < clipper.DisplayEnd; ++v)
            {
                ImGui::TableNextRow();
                ImGui::TableSetColumnIndex(0);
                ImGui::PushID(v);
                bool selected = std::binary_search(selection.begin(), selection.end(), v);
                char label[16];
                std::snprintf(label, sizeof(label), "vtx[%d]", v);
                if (ImGui::Selectable(label, selected, ImGuiSelectableFlags_SpanAllColumns)) clicked = v;
                ImGui::TableSetColumnIndex(1);
                ImGui::Text("%.2f %.2f %.2f", rig.vertices[v].x, rig.vertices[v].y, rig.vertices[v].z);
                ImGui::TableSetColumnIndex(2);
                ImGui::Text("%zu", mesh->get_weights(v).size());
                ImGui::PopID();
            }
        }
        ImGui::EndTable();
    }
    if (clicked < 0) return;

    const ImGuiIO& io = ImGui::GetIO();
    std::vector<VertexId> next;
    if (io.KeyCtrl)
    {
        next = selection;
        auto found = std::find(next.begin(), next.end(), clicked);
        if (found != next.end()) next.erase(found);
        else next.push_back(clicked);
    }
    else if (io.KeyShift && vertex_anchor >= 0)
    {
        for (int v = std::min(vertex_anchor, clicked); v <= std::max(vertex_anchor, clicked); ++v) next.push_back(v);
    }
    else
    {
        next.push_back(clicked);
    }
    if (!io.KeyShift) vertex_anchor = clicked;
    run("select vertices", [&]() { mesh->set_selection(next); });
}
} // namespace vb
