#pragma once

#include <vector>
#include "vk/vulkan_main_context.hpp"

namespace vb
{
class Swapchain
{
public:
  explicit Swapchain(const VulkanMainContext& vmc);
  void construct(bool vsync);
  void destruct();
  void recreate(bool vsync);
  const vk::SwapchainKHR& get() const { return swapchain; }
  vk::Extent2D get_extent() const { return extent; }
  vk::RenderPass get_render_pass() const { return render_pass; }
  vk::Framebuffer get_framebuffer(uint32_t idx) const { return framebuffers[idx]; }
  uint32_t get_image_count() const { return uint32_t(images.size()); }
  uint32_t get_min_image_count() const { return min_image_count; }

private:
  const VulkanMainContext& vmc;
  vk::SwapchainKHR swapchain;
  vk::SurfaceFormatKHR surface_format;
  vk::Extent2D extent;
  vk::RenderPass render_pass;
  uint32_t min_image_count = 2;
  std::vector<vk::Image> images;
  std::vector<vk::ImageView> image_views;
  std::vector<vk::Framebuffer> framebuffers;

  void create_swapchain(bool vsync);
  void create_render_pass();
  void create_framebuffers();
  void destroy_framebuffers();
  vk::SurfaceFormatKHR choose_surface_format() const;
  vk::PresentModeKHR choose_present_mode(bool vsync) const;
};
} // namespace vb
