#pragma once

#include <memory>
#include <vector>
#include "vulkan/vulkan.hpp"
#include "window.hpp"

namespace vb
{
// instance, surface, device and the single graphics/present queue
class VulkanMainContext
{
public:
  void construct(uint32_t width, uint32_t height, int32_t x, int32_t y);
  void destruct();
  std::vector<vk::SurfaceFormatKHR> get_surface_formats() const;
  std::vector<vk::PresentModeKHR> get_surface_present_modes() const;
  vk::SurfaceCapabilitiesKHR get_surface_capabilities() const;
  const vk::Queue& get_graphics_queue() const;
  uint32_t get_queue_family() const;

  std::unique_ptr<Window> window;
  vk::Instance instance;
  vk::PhysicalDevice physical_device;
  vk::Device device;
  vk::SurfaceKHR surface;

private:
  vk::Queue graphics_queue;
  uint32_t queue_family = 0;
  bool validation = false;
  vk::DebugUtilsMessengerEXT debug_messenger;

  void create_instance();
  void pick_physical_device();
  void create_device();
  void setup_debug_messenger();
};
} // namespace vb
