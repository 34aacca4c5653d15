#include "vk/swapchain.hpp"

#include <algorithm>
#include <iostream>

namespace vb
{
Swapchain::Swapchain(const VulkanMainContext& vmc) : vmc(vmc)
{}

void Swapchain::construct(bool vsync)
{
  surface_format = choose_surface_format();
  create_swapchain(vsync);
  create_render_pass();
  create_framebuffers();
  std::cout << "Swapchain: " << images.size() << " images, " << extent.width << "x" << extent.height << std::endl;
}

void Swapchain::destruct()
{
  destroy_framebuffers();
  vmc.device.destroyRenderPass(render_pass);
  vmc.device.destroySwapchainKHR(swapchain);
}

void Swapchain::recreate(bool vsync)
{
  // the surface format and with it the render pass stay the same
  destroy_framebuffers();
  vk::SwapchainKHR old_swapchain = swapchain;
  create_swapchain(vsync);
  vmc.device.destroySwapchainKHR(old_swapchain);
  create_framebuffers();
}

void Swapchain::create_swapchain(bool vsync)
{
  vk::SurfaceCapabilitiesKHR capabilities = vmc.get_surface_capabilities();
  if (capabilities.currentExtent.width != uint32_t(-1))
  {
    extent = capabilities.currentExtent;
  }
  else
  {
    vk::Extent2D pixels = vmc.window->get_pixel_extent();
    extent.width = std::clamp(pixels.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width);
    extent.height = std::clamp(pixels.height, capabilities.minImageExtent.height, capabilities.maxImageExtent.height);
  }

  min_image_count = capabilities.minImageCount + 1;
  if (capabilities.maxImageCount > 0) min_image_count = std::min(min_image_count, capabilities.maxImageCount);

  vk::SwapchainCreateInfoKHR sci{};
  sci.sType = vk::StructureType::eSwapchainCreateInfoKHR;
  sci.surface = vmc.surface;
  sci.minImageCount = min_image_count;
  sci.imageFormat = surface_format.format;
  sci.imageColorSpace = surface_format.colorSpace;
  sci.imageExtent = extent;
  sci.imageArrayLayers = 1;
  sci.imageUsage = vk::ImageUsageFlagBits::eColorAttachment;
  sci.imageSharingMode = vk::SharingMode::eExclusive;
  sci.preTransform = capabilities.currentTransform;
  sci.compositeAlpha = vk::CompositeAlphaFlagBitsKHR::eOpaque;
  sci.presentMode = choose_present_mode(vsync);
  sci.clipped = VK_TRUE;
  sci.oldSwapchain = swapchain;
  swapchain = vmc.device.createSwapchainKHR(sci);

  images = vmc.device.getSwapchainImagesKHR(swapchain);
  for (const auto& image : images)
  {
    vk::ImageViewCreateInfo ivci{};
    ivci.sType = vk::StructureType::eImageViewCreateInfo;
    ivci.image = image;
    ivci.viewType = vk::ImageViewType::e2D;
    ivci.format = surface_format.format;
    ivci.subresourceRange = vk::ImageSubresourceRange(vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1);
    image_views.push_back(vmc.device.createImageView(ivci));
  }
}

void Swapchain::create_render_pass()
{
  vk::AttachmentDescription color_attachment{};
  color_attachment.format = surface_format.format;
  color_attachment.samples = vk::SampleCountFlagBits::e1;
  color_attachment.loadOp = vk::AttachmentLoadOp::eClear;
  color_attachment.storeOp = vk::AttachmentStoreOp::eStore;
  color_attachment.stencilLoadOp = vk::AttachmentLoadOp::eDontCare;
  color_attachment.stencilStoreOp = vk::AttachmentStoreOp::eDontCare;
  color_attachment.initialLayout = vk::ImageLayout::eUndefined;
  color_attachment.finalLayout = vk::ImageLayout::ePresentSrcKHR;

  vk::AttachmentReference color_reference(0, vk::ImageLayout::eColorAttachmentOptimal);
  vk::SubpassDescription subpass{};
  subpass.pipelineBindPoint = vk::PipelineBindPoint::eGraphics;
  subpass.colorAttachmentCount = 1;
  subpass.pColorAttachments = &color_reference;

  vk::SubpassDependency dependency{};
  dependency.srcSubpass = VK_SUBPASS_EXTERNAL;
  dependency.dstSubpass = 0;
  dependency.srcStageMask = vk::PipelineStageFlagBits::eColorAttachmentOutput;
  dependency.dstStageMask = vk::PipelineStageFlagBits::eColorAttachmentOutput;
  dependency.dstAccessMask = vk::AccessFlagBits::eColorAttachmentWrite;

  vk::RenderPassCreateInfo rpci{};
  rpci.sType = vk::StructureType::eRenderPassCreateInfo;
  rpci.attachmentCount = 1;
  rpci.pAttachments = &color_attachment;
  rpci.subpassCount = 1;
  rpci.pSubpasses = &subpass;
  rpci.dependencyCount = 1;
  rpci.pDependencies = &dependency;
  render_pass = vmc.device.createRenderPass(rpci);
}

void Swapchain::create_framebuffers()
{
  for (const auto& image_view : image_views)
  {
    vk::FramebufferCreateInfo fbci{};
    fbci.sType = vk::StructureType::eFramebufferCreateInfo;
    fbci.renderPass = render_pass;
    fbci.attachmentCount = 1;
    fbci.pAttachments = &image_view;
    fbci.width = extent.width;
    fbci.height = extent.height;
    fbci.layers = 1;
    framebuffers.push_back(vmc.device.createFramebuffer(fbci));
  }
}

void Swapchain::destroy_framebuffers()
{
  for (auto& framebuffer : framebuffers) vmc.device.destroyFramebuffer(framebuffer);
  for (auto& image_view : image_views) vmc.device.destroyImageView(image_view);
  framebuffers.clear();
  image_views.clear();
}

vk::SurfaceFormatKHR Swapchain::choose_surface_format() const
{
  std::vector<vk::SurfaceFormatKHR> formats = vmc.get_surface_formats();
  for (const auto& format : formats)
  {
    if (format.format == vk::Format::eB8G8R8A8Unorm && format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear) return format;
  }
  return formats.front();
}

vk::PresentModeKHR Swapchain::choose_present_mode(bool vsync) const
{
  if (vsync) return vk::PresentModeKHR::eFifo;
  std::vector<vk::PresentModeKHR> modes = vmc.get_surface_present_modes();
  if (std::find(modes.begin(), modes.end(), vk::PresentModeKHR::eMailbox) != modes.end()) return vk::PresentModeKHR::eMailbox;
  if (std::find(modes.begin(), modes.end(), vk::PresentModeKHR::eImmediate) != modes.end()) return vk::PresentModeKHR::eImmediate;
  return vk::PresentModeKHR::eFifo;
}
} // namespace vb
