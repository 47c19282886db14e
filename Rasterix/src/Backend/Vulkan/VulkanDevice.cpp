#include "VulkanTypes.h"

namespace Rasterix {

// A dedicated compute family scores above one shared with graphics.
static i32 pick_compute_family(VkPhysicalDevice physical) {
    u32 count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(physical, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(physical, &count, families.data());

    i32 best = -1;
    int best_score = 0;
    for (u32 i = 0; i < count; ++i) {
        const VkQueueFlags flags = families[i].queueFlags;
        if (!(flags & VK_QUEUE_COMPUTE_BIT) || families[i].queueCount == 0) continue;
        int score = (flags & VK_QUEUE_GRAPHICS_BIT) ? 1 : 2;
        if (score > best_score) {
            best = static_cast<i32>(i);
            best_score = score;
        }
    }
    return best;
}

static std::string check_limits(const VkPhysicalDeviceLimits& limits) {
    if (limits.maxComputeWorkGroupSize[0] < WORKGROUP_SIZE_X ||
        limits.maxComputeWorkGroupSize[1] < WORKGROUP_SIZE_Y) {
        return "workgroup size below 8x8";
    }
    if (limits.maxComputeWorkGroupInvocations < WORKGROUP_SIZE_X * WORKGROUP_SIZE_Y) {
        return "fewer than 64 invocations per workgroup";
    }
    return {};
}

std::vector<VulkanDeviceCandidate> vulkan_enumerate_devices(VkInstance instance) {
    u32 count = 0;
    VK_CHECK(vkEnumeratePhysicalDevices(instance, &count, nullptr));
    std::vector<VkPhysicalDevice> physicals(count);
    if (count > 0) VK_CHECK(vkEnumeratePhysicalDevices(instance, &count, physicals.data()));

    std::vector<VulkanDeviceCandidate> candidates;
    candidates.reserve(count);
    for (VkPhysicalDevice physical : physicals) {
        VulkanDeviceCandidate candidate;
        candidate.physical = physical;
        vkGetPhysicalDeviceProperties(physical, &candidate.properties);
        candidate.compute_family = pick_compute_family(physical);
        if (candidate.compute_family < 0) {
            candidate.reject_reason = "no compute queue";
        } else {
            candidate.reject_reason = check_limits(candidate.properties.limits);
        }
        LOG_DEBUG("Found device {}: {}", candidate.properties.deviceName,
                  candidate.usable() ? "usable" : candidate.reject_reason);
        candidates.push_back(candidate);
    }
    return candidates;
}

void vulkan_create_device(VkInstance instance, u32 device_index, VulkanDevice& device) {
    const auto candidates = vulkan_enumerate_devices(instance);
    if (device_index >= candidates.size()) {
        throw std::runtime_error("Vulkan device index " + std::to_string(device_index) +
                                 " out of range (" + std::to_string(candidates.size()) + " devices)");
    }
    const VulkanDeviceCandidate& chosen = candidates[device_index];
    if (!chosen.usable()) {
        throw std::runtime_error(std::string("Vulkan device ") + chosen.properties.deviceName +
                                 " cannot run programs: " + chosen.reject_reason);
    }

    device.physical = chosen.physical;
    device.properties = chosen.properties;
    device.compute_family = static_cast<u32>(chosen.compute_family);

    const float priority = 1.0f;
    VkDeviceQueueCreateInfo queue_info = {VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO};
    queue_info.queueFamilyIndex = device.compute_family;
    queue_info.queueCount = 1;
    queue_info.pQueuePriorities = &priority;

    std::vector<const char*> extensions;
#ifdef RX_PLATFORM_APPLE
    extensions.push_back("VK_KHR_portability_subset");
#endif

    VkDeviceCreateInfo create_info = {VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO};
    create_info.queueCreateInfoCount = 1;
    create_info.pQueueCreateInfos = &queue_info;
    create_info.enabledExtensionCount = static_cast<u32>(extensions.size());
    create_info.ppEnabledExtensionNames = extensions.data();

    VK_CHECK(vkCreateDevice(device.physical, &create_info, nullptr, &device.logical));
    vkGetDeviceQueue(device.logical, device.compute_family, 0, &device.compute_queue);

    LOG_INFO("Using {} (Vulkan {}, queue family {})", device.properties.deviceName,
             format_api_version(device.properties.apiVersion), device.compute_family);
}

void vulkan_destroy_device(VulkanDevice& device) {
    if (device.logical != VK_NULL_HANDLE) vkDestroyDevice(device.logical, nullptr);
    device = {};
}

}
