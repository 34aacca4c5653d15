#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "vulkan/vulkan.hpp"

struct SDL_Window;

namespace vb
{
class Window
{
public:
  // x and y < 0 center the window
  Window(uint32_t width, uint32_t height, int32_t x, int32_t y);
  void destruct();
  SDL_Window* get() const;
  PFN_vkGetInstanceProcAddr get_instance_proc_addr() const;
  std::vector<const char*> get_required_extensions() const;
  vk::SurfaceKHR create_surface(const vk::Instance& instance);
  vk::Extent2D get_pixel_extent() const;
  std::pair<int, int> get_size() const;
  std::pair<int, int> get_position() const;
  bool is_minimized() const;

private:
  SDL_Window* window = nullptr;
};
} // namespace vb
