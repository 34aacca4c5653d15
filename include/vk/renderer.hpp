#pragma once

#include "vulkan/vulkan.hpp"

namespace vb
{
// clears the swapchain image, the ui draws on top within the same pass
class Renderer
{
public:
  void begin(vk::CommandBuffer& cb, const vk::Framebuffer& framebuffer, const vk::RenderPass& render_pass, vk::Extent2D extent) const;

  vk::ClearColorValue clear_color = vk::ClearColorValue(0.1f, 0.1f, 0.12f, 1.0f);
};
} // namespace vb
