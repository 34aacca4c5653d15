#pragma once

#include <vector>
#include "editor_state.hpp"
#include "ui.hpp"
#include "vk/renderer.hpp"
#include "vk/swapchain.hpp"
#include "vk/synchronization.hpp"
#include "vk/vulkan_main_context.hpp"

namespace vb
{
constexpr uint32_t frames_in_flight = 2;

class WorkContext
{
public:
  explicit WorkContext(const VulkanMainContext& vmc);
  void construct(EditorState& state);
  void destruct();
  void draw_frame(EditorState& state);
  vk::Extent2D recreate_swapchain(bool vsync);
  UI& get_ui() { return ui; }

private:
  const VulkanMainContext& vmc;
  Swapchain swapchain;
  Renderer renderer;
  UI ui;
  vk::CommandPool command_pool;
  std::vector<vk::CommandBuffer> graphics_cbs;
  std::vector<Synchronization> syncs;
  uint32_t frame_idx = 0;

  void render(uint32_t image_idx, EditorState& state);
};
} // namespace vb
