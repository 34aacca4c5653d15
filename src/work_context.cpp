#include "work_context.hpp"

#include <iostream>
#include "errors.hpp"
#include "util/timer.hpp"
#include "util/vb_log.hpp"

namespace vb
{
WorkContext::WorkContext(const VulkanMainContext& vmc) : vmc(vmc), swapchain(vmc), ui(vmc)
{}

void WorkContext::construct(EditorState& state)
{
  Timer<float> timer;
  vk::CommandPoolCreateInfo cpci(vk::CommandPoolCreateFlagBits::eResetCommandBuffer, vmc.get_queue_family());
  command_pool = vmc.device.createCommandPool(cpci);
  vk::CommandBufferAllocateInfo cbai(command_pool, vk::CommandBufferLevel::ePrimary, frames_in_flight);
  graphics_cbs = vmc.device.allocateCommandBuffers(cbai);

  swapchain.construct(state.vsync);
  state.set_window_extent(swapchain.get_extent());
  for (uint32_t i = 0; i < frames_in_flight; ++i)
  {
    syncs.emplace_back(vmc.device);
  }
  ui.construct(swapchain.get_render_pass(), swapchain.get_min_image_count(), swapchain.get_image_count());
  std::cout << VB_C_GREEN << "[TIMING] work context construct: " << timer.restart<ms>() << " ms" << VB_C_WHITE << std::endl;
}

void WorkContext::destruct()
{
  vmc.device.waitIdle();
  for (auto& sync : syncs) sync.destruct();
  syncs.clear();
  ui.destruct();
  swapchain.destruct();
  vmc.device.freeCommandBuffers(command_pool, graphics_cbs);
  vmc.device.destroyCommandPool(command_pool);
}

void WorkContext::draw_frame(EditorState& state)
{
  Synchronization& sync = syncs[frame_idx];
  sync.wait_for_fence(Synchronization::F_RENDER_FINISHED);

  vk::ResultValue<uint32_t> image_idx = vmc.device.acquireNextImageKHR(swapchain.get(), uint64_t(-1), sync.get_semaphore(Synchronization::S_IMAGE_AVAILABLE));
  VB_ASSERT(image_idx.result == vk::Result::eSuccess || image_idx.result == vk::Result::eSuboptimalKHR, Error, "Failed to acquire next image!");
  sync.reset_fence(Synchronization::F_RENDER_FINISHED);

  render(image_idx.value, state);
  frame_idx = (frame_idx + 1) % frames_in_flight;
  state.total_frames++;
}

vk::Extent2D WorkContext::recreate_swapchain(bool vsync)
{
  vmc.device.waitIdle();
  swapchain.recreate(vsync);
  return swapchain.get_extent();
}

void WorkContext::render(uint32_t image_idx, EditorState& state)
{
  Synchronization& sync = syncs[frame_idx];
  vk::CommandBuffer& cb = graphics_cbs[frame_idx];
  cb.reset();
  cb.begin(vk::CommandBufferBeginInfo(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));

  renderer.begin(cb, swapchain.get_framebuffer(image_idx), swapchain.get_render_pass(), swapchain.get_extent());
  if (state.show_ui) ui.draw(cb, state);
  cb.endRenderPass();
  cb.end();

  vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eColorAttachmentOutput;
  vk::SubmitInfo render_si(1, &sync.get_semaphore(Synchronization::S_IMAGE_AVAILABLE), &wait_stage, 1, &cb, 1, &sync.get_semaphore(Synchronization::S_RENDER_FINISHED));
  vmc.get_graphics_queue().submit(render_si, sync.get_fence(Synchronization::F_RENDER_FINISHED));

  vk::PresentInfoKHR present_info(1, &sync.get_semaphore(Synchronization::S_RENDER_FINISHED), 1, &swapchain.get(), &image_idx);
  vk::Result result = vmc.get_graphics_queue().presentKHR(present_info);
  VB_ASSERT(result == vk::Result::eSuccess || result == vk::Result::eSuboptimalKHR, Error, "Failed to present image!");
}
} // namespace vb
