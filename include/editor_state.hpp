#pragma once
#include <algorithm>
#include <cstdint>
#include <string>
#include "vulkan/vulkan.hpp"

namespace vb
{
struct EditorState
{
public:
  uint32_t total_frames = 0;
  bool vsync = true;
  bool show_ui = true;
  float time_diff = 0.000001f;

  // spin box values of the edit controls
  float set_amount = 0.05f;
  float increment_amount = 0.05f;
  float scale_amount = 0.1f;

  bool envelope = false;
  bool precision = false;
  std::string search;

  // radius of the linear soft selection of the mesh host
  float soft_radius = 0.0f;

  bool show_weight_plot = true;

  // message of the last failed user action
  std::string status;

  void clamp_amounts()
  {
    set_amount = std::clamp(set_amount, 0.0f, 1.0f);
    increment_amount = std::clamp(increment_amount, 0.0f, 1.0f);
    scale_amount = std::clamp(scale_amount, 0.0f, 1.0f);
  }

  vk::Extent2D get_window_extent() const { return window_extent; }
  void set_window_extent(vk::Extent2D extent) { window_extent = extent; }

  int32_t window_x = -1;
  int32_t window_y = -1;

private:
  vk::Extent2D window_extent = vk::Extent2D(480, 720);
};
} // namespace vb
