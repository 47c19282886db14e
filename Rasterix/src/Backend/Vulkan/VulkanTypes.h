#pragma once

#include <vulkan/vulkan.h>
#include <vulkan/vk_enum_string_helper.h>
#include <vk_mem_alloc.h>
#include <Common/Types.h>
#include <Common/Logger.h>
#include <deque>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Rasterix {

// Generated programs use 8x8 workgroups.
constexpr u32 WORKGROUP_SIZE_X = 8;
constexpr u32 WORKGROUP_SIZE_Y = 8;

#define VK_CHECK(x) \
    do { \
        VkResult vk_result__ = (x); \
        if (vk_result__ != VK_SUCCESS) { \
            LOG_ERROR("{} returned {} ({}:{})", #x, string_VkResult(vk_result__), __FILE__, __LINE__); \
            throw std::runtime_error(std::string(#x " returned ") + string_VkResult(vk_result__)); \
        } \
    } while (0)

// Destroys Vulkan objects in reverse creation order.
struct DeletionQueue {
    std::deque<std::function<void()>> deletors;

    void push(std::function<void()>&& fn) { deletors.push_back(std::move(fn)); }
    void flush() {
        while (!deletors.empty()) {
            deletors.back()();
            deletors.pop_back();
        }
    }
};

inline std::string format_api_version(u32 version) {
    return std::to_string(VK_API_VERSION_MAJOR(version)) + "." +
           std::to_string(VK_API_VERSION_MINOR(version)) + "." +
           std::to_string(VK_API_VERSION_PATCH(version));
}

struct VulkanDevice {
    VkPhysicalDevice physical = VK_NULL_HANDLE;
    VkDevice logical = VK_NULL_HANDLE;

    u32 compute_family = 0;
    VkQueue compute_queue = VK_NULL_HANDLE;

    VkPhysicalDeviceProperties properties = {};

    // Largest matrix texture a single storage binding can address.
    u64 max_texture_bytes() const { return properties.limits.maxStorageBufferRange; }
};

struct VulkanInstance {
    u32 api_version = VK_API_VERSION_1_0;
    bool validation_enabled = false;

    VkInstance instance = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debug_messenger = VK_NULL_HANDLE;
    VmaAllocator allocator = VK_NULL_HANDLE;

    VulkanDevice device;
};

struct VulkanDeviceCandidate {
    VkPhysicalDevice physical = VK_NULL_HANDLE;
    VkPhysicalDeviceProperties properties = {};
    i32 compute_family = -1;
    // Empty when the device can run generated programs.
    std::string reject_reason;

    bool usable() const { return reject_reason.empty(); }
};

std::vector<VulkanDeviceCandidate> vulkan_enumerate_devices(VkInstance instance);

// Throws std::runtime_error when the index is out of range or the device is
// not usable.
void vulkan_create_device(VkInstance instance, u32 device_index, VulkanDevice& device);
void vulkan_destroy_device(VulkanDevice& device);

}
