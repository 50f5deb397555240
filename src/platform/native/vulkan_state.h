#pragma once

#include "imgui.h"
#include "imgui_impl_vulkan.h"

#include <string>

// Thin wrapper around the Dear ImGui SDL3+Vulkan example backend code.
//
// Keeps the verbose Vulkan setup/swapchain/render/present/cleanup plumbing out of
// the host adapter. Unlike the example, failures are reported to the caller
// (bool + err) instead of aborting: a lost surface or device ends the session
// through the frame driver.
struct VulkanState
{
    //#define APP_USE_UNLIMITED_FRAME_RATE
#ifdef _DEBUG
#define APP_USE_VULKAN_DEBUG_REPORT
    VkDebugReportCallbackEXT debug_report = VK_NULL_HANDLE;
#endif

    // Vulkan core
    VkAllocationCallbacks* allocator = nullptr;
    VkInstance             instance = VK_NULL_HANDLE;
    VkPhysicalDevice       physical_device = VK_NULL_HANDLE;
    VkDevice               device = VK_NULL_HANDLE;
    uint32_t               queue_family = (uint32_t)-1;
    VkQueue                queue = VK_NULL_HANDLE;
    VkPipelineCache        pipeline_cache = VK_NULL_HANDLE;
    VkDescriptorPool       descriptor_pool = VK_NULL_HANDLE;

    // ImGui helper window data
    ImGui_ImplVulkanH_Window main_window{};
    uint32_t                 min_image_count = 2;
    bool                     swapchain_rebuild = false;

    bool SetupVulkan(ImVector<const char*> instance_extensions, std::string& err);
    bool SetupVulkanWindow(VkSurfaceKHR surface, int width, int height, std::string& err);
    void ResizeMainWindow(int width, int height);

    // Both return false when the frame cannot be shown anymore (surface or device
    // lost). An out-of-date swapchain is not a failure: it is flagged for rebuild.
    bool FrameRender(ImDrawData* draw_data, const float clear_color[4], std::string& err);
    bool FramePresent(std::string& err);

    void CleanupVulkanWindow();
    void CleanupVulkan();
};

// ImGui_ImplVulkan_InitInfo::CheckVkResultFn; logs failures.
void CheckVkResult(VkResult err);
