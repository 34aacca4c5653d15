#include "window.hpp"

#include "errors.hpp"
#include "util/vb_log.hpp"
#include <SDL3/SDL.h>
#include <SDL3/SDL_vulkan.h>

namespace vb
{
Window::Window(const uint32_t width, const uint32_t height, const int32_t x, const int32_t y)
{
  VB_ASSERT(SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS), Error, "Failed to initialize SDL: " << SDL_GetError());
  window = SDL_CreateWindow("vblend", int(width), int(height), SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY);
  VB_ASSERT(window, Error, "Failed to create window: " << SDL_GetError());
  if (x >= 0 && y >= 0) SDL_SetWindowPosition(window, x, y);
  else SDL_SetWindowPosition(window, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);
}

void Window::destruct()
{
  SDL_DestroyWindow(window);
  window = nullptr;
  SDL_Quit();
}

SDL_Window* Window::get() const
{
  return window;
}

PFN_vkGetInstanceProcAddr Window::get_instance_proc_addr() const
{
  auto proc_addr = reinterpret_cast<PFN_vkGetInstanceProcAddr>(SDL_Vulkan_GetVkGetInstanceProcAddr());
  VB_ASSERT(proc_addr, Error, "Failed to load vkGetInstanceProcAddr: " << SDL_GetError());
  return proc_addr;
}

std::vector<const char*> Window::get_required_extensions() const
{
  uint32_t extension_count = 0;
  const char* const* extensions = SDL_Vulkan_GetInstanceExtensions(&extension_count);
  VB_ASSERT(extensions, Error, "Failed to load required extensions for window!");
  return std::vector<const char*>(extensions, extensions + extension_count);
}

vk::SurfaceKHR Window::create_surface(const vk::Instance& instance)
{
  VkSurfaceKHR surface;
  VB_ASSERT(SDL_Vulkan_CreateSurface(window, instance, nullptr, &surface), Error, "Failed to create surface: " << SDL_GetError());
  return vk::SurfaceKHR(surface);
}

vk::Extent2D Window::get_pixel_extent() const
{
  int width = 0;
  int height = 0;
  SDL_GetWindowSizeInPixels(window, &width, &height);
  return vk::Extent2D(uint32_t(width), uint32_t(height));
}

std::pair<int, int> Window::get_size() const
{
  std::pair<int, int> size;
  SDL_GetWindowSize(window, &size.first, &size.second);
  return size;
}

std::pair<int, int> Window::get_position() const
{
  std::pair<int, int> position;
  SDL_GetWindowPosition(window, &position.first, &position.second);
  return position;
}

bool Window::is_minimized() const
{
  return (SDL_GetWindowFlags(window) & SDL_WINDOW_MINIMIZED) != 0;
}
} // namespace vb
