#pragma once

#include <array>
#include <iostream>
#include "vulkan/vulkan.hpp"

namespace vb
{
// semaphores and fences of one frame in flight
class Synchronization
{
public:
  enum Semaphores
  {
    S_IMAGE_AVAILABLE = 0,
    S_RENDER_FINISHED,
    S_COUNT
  };

  enum Fences
  {
    F_RENDER_FINISHED = 0,
    F_COUNT
  };

  explicit Synchronization(const vk::Device& device) : device(device)
  {
    for (auto& semaphore : semaphores) semaphore = device.createSemaphore(vk::SemaphoreCreateInfo());
    for (auto& fence : fences) fence = device.createFence(vk::FenceCreateInfo(vk::FenceCreateFlagBits::eSignaled));
  }

  void destruct()
  {
    for (auto& semaphore : semaphores) device.destroySemaphore(semaphore);
    for (auto& fence : fences) device.destroyFence(fence);
  }

  const vk::Semaphore& get_semaphore(Semaphores idx) const { return semaphores[idx]; }
  const vk::Fence& get_fence(Fences idx) const { return fences[idx]; }

  void wait_for_fence(Fences idx) const
  {
    vk::Result result = device.waitForFences(fences[idx], VK_TRUE, uint64_t(-1));
    if (result != vk::Result::eSuccess) std::cerr << "Failed to wait for fence!" << std::endl;
  }

  void reset_fence(Fences idx) const { device.resetFences(fences[idx]); }

private:
  vk::Device device;
  std::array<vk::Semaphore, S_COUNT> semaphores;
  std::array<vk::Fence, F_COUNT> fences;
};
} // namespace vb
