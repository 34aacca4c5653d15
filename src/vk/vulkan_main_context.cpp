#include "vk/vulkan_main_context.hpp"

#include <cstring>
#include <iostream>
#include "errors.hpp"
#include "util/vb_log.hpp"

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

static VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(VkDebugUtilsMessageSeverityFlagBitsEXT message_severity, VkDebugUtilsMessageTypeFlagsEXT message_type, const VkDebugUtilsMessengerCallbackDataEXT* callback_data, void* user_data)
{
  switch (message_severity)
  {
    case VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT:
      std::cerr << VB_C_YELLOW << "validation warning: ";
      break;
    case VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT:
      std::cerr << VB_C_RED << "validation error: ";
      break;
    default:
      std::cerr << VB_C_LBLUE << "validation info: ";
      break;
  }
  std::cerr << callback_data->pMessage << VB_C_WHITE << std::endl;
  return VK_FALSE;
}

namespace vb
{
namespace
{
const char* validation_layer = "VK_LAYER_KHRONOS_validation";
}

void VulkanMainContext::construct(const uint32_t width, const uint32_t height, const int32_t x, const int32_t y)
{
  window = std::make_unique<Window>(width, height, x, y);
  VULKAN_HPP_DEFAULT_DISPATCHER.init(window->get_instance_proc_addr());
  create_instance();
  surface = window->create_surface(instance);
  pick_physical_device();
  create_device();
  if (validation) setup_debug_messenger();
}

void VulkanMainContext::destruct()
{
  if (validation) instance.destroyDebugUtilsMessengerEXT(debug_messenger);
  device.destroy();
  instance.destroySurfaceKHR(surface);
  instance.destroy();
  if (window) window->destruct();
}

std::vector<vk::SurfaceFormatKHR> VulkanMainContext::get_surface_formats() const
{
  return physical_device.getSurfaceFormatsKHR(surface);
}

std::vector<vk::PresentModeKHR> VulkanMainContext::get_surface_present_modes() const
{
  return physical_device.getSurfacePresentModesKHR(surface);
}

vk::SurfaceCapabilitiesKHR VulkanMainContext::get_surface_capabilities() const
{
  return physical_device.getSurfaceCapabilitiesKHR(surface);
}

const vk::Queue& VulkanMainContext::get_graphics_queue() const
{
  return graphics_queue;
}

uint32_t VulkanMainContext::get_queue_family() const
{
  return queue_family;
}

void VulkanMainContext::create_instance()
{
  std::vector<const char*> extensions = window->get_required_extensions();
  std::vector<const char*> layers;
  for (const auto& layer : vk::enumerateInstanceLayerProperties())
  {
    if (std::strcmp(layer.layerName, validation_layer) == 0) validation = true;
  }
#if defined(NDEBUG)
  validation = false;
#endif
  if (validation)
  {
    layers.push_back(validation_layer);
    extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
  }

  vk::ApplicationInfo ai("vblend", VK_MAKE_VERSION(1, 0, 0), "vblend", VK_MAKE_VERSION(1, 0, 0), VK_API_VERSION_1_2);
  vk::InstanceCreateInfo ici{};
  ici.sType = vk::StructureType::eInstanceCreateInfo;
  ici.pApplicationInfo = &ai;
  ici.enabledLayerCount = layers.size();
  ici.ppEnabledLayerNames = layers.data();
  ici.enabledExtensionCount = extensions.size();
  ici.ppEnabledExtensionNames = extensions.data();
  instance = vk::createInstance(ici);
  VULKAN_HPP_DEFAULT_DISPATCHER.init(instance);
}

void VulkanMainContext::pick_physical_device()
{
  // first device with a graphics queue that can present and a swapchain,
  // discrete gpus win
  bool found = false;
  for (const auto& p_device : instance.enumeratePhysicalDevices())
  {
    bool has_swapchain = false;
    for (const auto& extension : p_device.enumerateDeviceExtensionProperties())
    {
      if (std::strcmp(extension.extensionName, VK_KHR_SWAPCHAIN_EXTENSION_NAME) == 0) has_swapchain = true;
    }
    if (!has_swapchain) continue;

    std::vector<vk::QueueFamilyProperties> families = p_device.getQueueFamilyProperties();
    for (uint32_t i = 0; i < families.size(); ++i)
    {
      if (!(families[i].queueFlags & vk::QueueFlagBits::eGraphics) || !p_device.getSurfaceSupportKHR(i, surface)) continue;
      bool discrete = p_device.getProperties().deviceType == vk::PhysicalDeviceType::eDiscreteGpu;
      if (!found || discrete)
      {
        physical_device = p_device;
        queue_family = i;
        found = true;
      }
      break;
    }
  }
  VB_ASSERT(found, Error, "Failed to find a suitable physical device!");
  std::cout << "Using device " << physical_device.getProperties().deviceName.data() << std::endl;
}

void VulkanMainContext::create_device()
{
  float priority = 1.0f;
  vk::DeviceQueueCreateInfo dqci({}, queue_family, 1, &priority);
  std::vector<const char*> extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

  vk::DeviceCreateInfo dci{};
  dci.sType = vk::StructureType::eDeviceCreateInfo;
  dci.queueCreateInfoCount = 1;
  dci.pQueueCreateInfos = &dqci;
  dci.enabledExtensionCount = extensions.size();
  dci.ppEnabledExtensionNames = extensions.data();
  device = physical_device.createDevice(dci);
  VULKAN_HPP_DEFAULT_DISPATCHER.init(device);
  graphics_queue = device.getQueue(queue_family, 0);
}

void VulkanMainContext::setup_debug_messenger()
{
  vk::DebugUtilsMessengerCreateInfoEXT dumci;
  dumci.sType = vk::StructureType::eDebugUtilsMessengerCreateInfoEXT;
  dumci.messageSeverity = vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning | vk::DebugUtilsMessageSeverityFlagBitsEXT::eError;
  dumci.messageType = vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral | vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation | vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance;
  dumci.pfnUserCallback = debug_callback;
  debug_messenger = instance.createDebugUtilsMessengerEXT(dumci);
}
} // namespace vb
