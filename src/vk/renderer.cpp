#include "vk/renderer.hpp"

namespace vb
{
void Renderer::begin(vk::CommandBuffer& cb, const vk::Framebuffer& framebuffer, const vk::RenderPass& render_pass, vk::Extent2D extent) const
{
  vk::RenderPassBeginInfo rpbi{};
  rpbi.sType = vk::StructureType::eRenderPassBeginInfo;
  rpbi.renderPass = render_pass;
  rpbi.framebuffer = framebuffer;
  rpbi.renderArea.offset = vk::Offset2D(0, 0);
  rpbi.renderArea.extent = extent;
  vk::ClearValue clear_value;
  clear_value.color = clear_color;
  rpbi.clearValueCount = 1;
  rpbi.pClearValues = &clear_value;
  cb.beginRenderPass(rpbi, vk::SubpassContents::eInline);

  vk::Viewport viewport{};
  viewport.x = 0.0f;
  viewport.y = 0.0f;
  viewport.width = float(extent.width);
  viewport.height = float(extent.height);
  viewport.minDepth = 0.0f;
  viewport.maxDepth = 1.0f;
  cb.setViewport(0, viewport);
  vk::Rect2D scissor{};
  scissor.offset = vk::Offset2D(0, 0);
  scissor.extent = extent;
  cb.setScissor(0, scissor);
}
} // namespace vb
