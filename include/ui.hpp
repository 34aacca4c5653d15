#pragma once

#include <functional>
#include <string>
#include <vector>
#include "imgui.h"
#include "editor_state.hpp"
#include "mesh_weight_source.hpp"
#include "vk/vulkan_main_context.hpp"
#include "weight_edit_orchestrator.hpp"

namespace vb
{
class UI
{
public:
  // runs one user action, the editor catches and reports its errors
  using ActionRunner = std::function<void(const char* name, const std::function<void()>& action)>;

  explicit UI(const VulkanMainContext& vmc);

  void construct(vk::RenderPass render_pass, uint32_t min_image_count, uint32_t image_count);
  void destruct();
  void draw(vk::CommandBuffer& cb, EditorState& state);

  void set_orchestrator(WeightEditOrchestrator* orchestrator);
  void set_mesh(MeshWeightSource* mesh);
  void set_action_runner(const ActionRunner& runner);

private:
  const VulkanMainContext& vmc;
  vk::DescriptorPool imgui_pool;
  WeightEditOrchestrator* orchestrator = nullptr;
  MeshWeightSource* mesh = nullptr;
  ActionRunner run_action;
  char search_buffer[128] = "";
  int vertex_anchor = -1;

  void run(const char* name, const std::function<void()>& action);
  void draw_controls(EditorState& state);
  void draw_list(const char* id, ItemModel& model, ListView& view, FilterEngine& filter, bool weights, float height);
  void draw_weight_plot();
  void draw_mesh_panel(EditorState& state);
};
} // namespace vb
