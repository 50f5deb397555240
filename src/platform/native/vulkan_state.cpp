#include "platform/native/vulkan_state.h"

#include <cstdio>
#include <cstring>

void CheckVkResult(VkResult err)
{
    if (err == VK_SUCCESS)
        return;
    std::fprintf(stderr, "[vulkan] Error: VkResult = %d\n", err);
}

static bool VkFailed(VkResult r, const char* what, std::string& err)
{
    if (r == VK_SUCCESS)
        return false;
    err = std::string(what) + " failed: VkResult = " + std::to_string((int)r);
    return true;
}

// Results after which nothing can be presented again.
static bool IsSurfaceGone(VkResult r)
{
    return r == VK_ERROR_SURFACE_LOST_KHR || r == VK_ERROR_DEVICE_LOST;
}

#ifdef APP_USE_VULKAN_DEBUG_REPORT
static VKAPI_ATTR VkBool32 VKAPI_CALL DebugReport(
    VkDebugReportFlagsEXT flags,
    VkDebugReportObjectTypeEXT objectType,
    uint64_t object,
    size_t location,
    int32_t messageCode,
    const char* pLayerPrefix,
    const char* pMessage,
    void* pUserData)
{
    (void)flags; (void)object; (void)location; (void)messageCode;
    (void)pUserData; (void)pLayerPrefix;
    std::fprintf(stderr, "[vulkan] Debug report from ObjectType: %i\nMessage: %s\n\n", objectType, pMessage);
    return VK_FALSE;
}
#endif // APP_USE_VULKAN_DEBUG_REPORT

static bool IsExtensionAvailable(const ImVector<VkExtensionProperties>& properties, const char* extension)
{
    for (const VkExtensionProperties& p : properties)
        if (std::strcmp(p.extensionName, extension) == 0)
            return true;
    return false;
}

bool VulkanState::SetupVulkan(ImVector<const char*> instance_extensions, std::string& err)
{
    err.clear();

    // Create Vulkan Instance
    {
        VkInstanceCreateInfo create_info = {};
        create_info.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;

        uint32_t properties_count = 0;
        ImVector<VkExtensionProperties> properties;
        vkEnumerateInstanceExtensionProperties(nullptr, &properties_count, nullptr);
        properties.resize(properties_count);
        if (VkFailed(vkEnumerateInstanceExtensionProperties(nullptr, &properties_count, properties.Data),
                     "vkEnumerateInstanceExtensionProperties", err))
            return false;

        if (IsExtensionAvailable(properties, VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME))
            instance_extensions.push_back(VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME);
#ifdef VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME
        if (IsExtensionAvailable(properties, VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME))
        {
            instance_extensions.push_back(VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME);
            create_info.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
        }
#endif

#ifdef APP_USE_VULKAN_DEBUG_REPORT
        const char* layers[] = { "VK_LAYER_KHRONOS_validation" };
        create_info.enabledLayerCount = 1;
        create_info.ppEnabledLayerNames = layers;
        instance_extensions.push_back("VK_EXT_debug_report");
#endif

        create_info.enabledExtensionCount = (uint32_t)instance_extensions.Size;
        create_info.ppEnabledExtensionNames = instance_extensions.Data;
        if (VkFailed(vkCreateInstance(&create_info, allocator, &instance), "vkCreateInstance", err))
            return false;

#ifdef APP_USE_VULKAN_DEBUG_REPORT
        auto f_vkCreateDebugReportCallbackEXT =
            (PFN_vkCreateDebugReportCallbackEXT)vkGetInstanceProcAddr(instance, "vkCreateDebugReportCallbackEXT");
        if (f_vkCreateDebugReportCallbackEXT)
        {
            VkDebugReportCallbackCreateInfoEXT debug_report_ci = {};
            debug_report_ci.sType = VK_STRUCTURE_TYPE_DEBUG_REPORT_CALLBACK_CREATE_INFO_EXT;
            debug_report_ci.flags = VK_DEBUG_REPORT_ERROR_BIT_EXT |
                                    VK_DEBUG_REPORT_WARNING_BIT_EXT |
                                    VK_DEBUG_REPORT_PERFORMANCE_WARNING_BIT_EXT;
            debug_report_ci.pfnCallback = DebugReport;
            debug_report_ci.pUserData = nullptr;
            CheckVkResult(f_vkCreateDebugReportCallbackEXT(instance, &debug_report_ci, allocator, &debug_report));
        }
#endif
    }

    // Select Physical Device (GPU)
    physical_device = ImGui_ImplVulkanH_SelectPhysicalDevice(instance);
    if (physical_device == VK_NULL_HANDLE)
    {
        err = "No Vulkan physical device available.";
        return false;
    }

    // Select graphics queue family
    queue_family = ImGui_ImplVulkanH_SelectQueueFamilyIndex(physical_device);
    if (queue_family == (uint32_t)-1)
    {
        err = "No Vulkan graphics queue family available.";
        return false;
    }

    // Create Logical Device (with 1 queue)
    {
        ImVector<const char*> device_extensions;
        device_extensions.push_back("VK_KHR_swapchain");

        uint32_t properties_count = 0;
        ImVector<VkExtensionProperties> properties;
        vkEnumerateDeviceExtensionProperties(physical_device, nullptr, &properties_count, nullptr);
        properties.resize(properties_count);
        vkEnumerateDeviceExtensionProperties(physical_device, nullptr, &properties_count, properties.Data);
#ifdef VK_KHR_PORTABILITY_SUBSET_EXTENSION_NAME
        if (IsExtensionAvailable(properties, VK_KHR_PORTABILITY_SUBSET_EXTENSION_NAME))
            device_extensions.push_back(VK_KHR_PORTABILITY_SUBSET_EXTENSION_NAME);
#endif

        const float queue_priority[] = { 1.0f };
        VkDeviceQueueCreateInfo queue_info[1] = {};
        queue_info[0].sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queue_info[0].queueFamilyIndex = queue_family;
        queue_info[0].queueCount = 1;
        queue_info[0].pQueuePriorities = queue_priority;

        VkDeviceCreateInfo create_info = {};
        create_info.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        create_info.queueCreateInfoCount = 1;
        create_info.pQueueCreateInfos = queue_info;
        create_info.enabledExtensionCount = (uint32_t)device_extensions.Size;
        create_info.ppEnabledExtensionNames = device_extensions.Data;

        if (VkFailed(vkCreateDevice(physical_device, &create_info, allocator, &device), "vkCreateDevice", err))
            return false;
        vkGetDeviceQueue(device, queue_family, 0, &queue);
    }

    // Create Descriptor Pool
    {
        VkDescriptorPoolSize pool_sizes[] =
        {
            { VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, IMGUI_IMPL_VULKAN_MINIMUM_IMAGE_SAMPLER_POOL_SIZE },
        };
        VkDescriptorPoolCreateInfo pool_info = {};
        pool_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        pool_info.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
        pool_info.maxSets = 0;
        for (VkDescriptorPoolSize& pool_size : pool_sizes)
            pool_info.maxSets += pool_size.descriptorCount;
        pool_info.poolSizeCount = (uint32_t)IM_ARRAYSIZE(pool_sizes);
        pool_info.pPoolSizes = pool_sizes;

        if (VkFailed(vkCreateDescriptorPool(device, &pool_info, allocator, &descriptor_pool),
                     "vkCreateDescriptorPool", err))
            return false;
    }
    return true;
}

bool VulkanState::SetupVulkanWindow(VkSurfaceKHR surface, int width, int height, std::string& err)
{
    ImGui_ImplVulkanH_Window* wd = &main_window;
    wd->Surface = surface;

    // Check for WSI support
    VkBool32 res = VK_FALSE;
    vkGetPhysicalDeviceSurfaceSupportKHR(physical_device, queue_family, wd->Surface, &res);
    if (res != VK_TRUE)
    {
        err = "No WSI support on the selected physical device.";
        return false;
    }

    const VkFormat requestSurfaceImageFormat[] =
    {
        VK_FORMAT_B8G8R8A8_UNORM,
        VK_FORMAT_R8G8B8A8_UNORM,
        VK_FORMAT_B8G8R8_UNORM,
        VK_FORMAT_R8G8B8_UNORM
    };
    const VkColorSpaceKHR requestSurfaceColorSpace = VK_COLORSPACE_SRGB_NONLINEAR_KHR;
    wd->SurfaceFormat = ImGui_ImplVulkanH_SelectSurfaceFormat(
        physical_device, wd->Surface,
        requestSurfaceImageFormat,
        (size_t)IM_ARRAYSIZE(requestSurfaceImageFormat),
        requestSurfaceColorSpace);

#ifdef APP_USE_UNLIMITED_FRAME_RATE
    VkPresentModeKHR present_modes[] =
    {
        VK_PRESENT_MODE_MAILBOX_KHR,
        VK_PRESENT_MODE_IMMEDIATE_KHR,
        VK_PRESENT_MODE_FIFO_KHR
    };
#else
    VkPresentModeKHR present_modes[] = { VK_PRESENT_MODE_FIFO_KHR };
#endif
    wd->PresentMode = ImGui_ImplVulkanH_SelectPresentMode(
        physical_device, wd->Surface, &present_modes[0], IM_ARRAYSIZE(present_modes));

    // Create SwapChain, RenderPass, Framebuffer, etc.
    ImGui_ImplVulkanH_CreateOrResizeWindow(
        instance, physical_device, device, wd, queue_family, allocator,
        width, height, min_image_count, 0);
    return true;
}

void VulkanState::ResizeMainWindow(int width, int height)
{
    ImGui_ImplVulkan_SetMinImageCount(min_image_count);
    ImGui_ImplVulkanH_CreateOrResizeWindow(
        instance, physical_device, device, &main_window, queue_family, allocator,
        width, height, min_image_count, 0);
    main_window.FrameIndex = 0;
    swapchain_rebuild = false;
}

bool VulkanState::FrameRender(ImDrawData* draw_data, const float clear_color[4], std::string& err)
{
    ImGui_ImplVulkanH_Window* wd = &main_window;
    wd->ClearValue.color.float32[0] = clear_color[0] * clear_color[3];
    wd->ClearValue.color.float32[1] = clear_color[1] * clear_color[3];
    wd->ClearValue.color.float32[2] = clear_color[2] * clear_color[3];
    wd->ClearValue.color.float32[3] = clear_color[3];

    VkSemaphore image_acquired_semaphore  = wd->FrameSemaphores[wd->SemaphoreIndex].ImageAcquiredSemaphore;
    VkSemaphore render_complete_semaphore = wd->FrameSemaphores[wd->SemaphoreIndex].RenderCompleteSemaphore;
    VkResult r = vkAcquireNextImageKHR(
        device, wd->Swapchain, UINT64_MAX,
        image_acquired_semaphore, VK_NULL_HANDLE, &wd->FrameIndex);
    if (r == VK_ERROR_OUT_OF_DATE_KHR || r == VK_SUBOPTIMAL_KHR)
        swapchain_rebuild = true;
    if (r == VK_ERROR_OUT_OF_DATE_KHR)
        return true;
    if (IsSurfaceGone(r))
    {
        err = "vkAcquireNextImageKHR: surface lost (VkResult = " + std::to_string((int)r) + ")";
        return false;
    }
    if (r != VK_SUBOPTIMAL_KHR && VkFailed(r, "vkAcquireNextImageKHR", err))
        return false;

    ImGui_ImplVulkanH_Frame* fd = &wd->Frames[wd->FrameIndex];
    if (VkFailed(vkWaitForFences(device, 1, &fd->Fence, VK_TRUE, UINT64_MAX), "vkWaitForFences", err))
        return false;
    if (VkFailed(vkResetFences(device, 1, &fd->Fence), "vkResetFences", err))
        return false;

    if (VkFailed(vkResetCommandPool(device, fd->CommandPool, 0), "vkResetCommandPool", err))
        return false;
    {
        VkCommandBufferBeginInfo info = {};
        info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        info.flags |= VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        if (VkFailed(vkBeginCommandBuffer(fd->CommandBuffer, &info), "vkBeginCommandBuffer", err))
            return false;
    }
    {
        VkRenderPassBeginInfo info = {};
        info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
        info.renderPass = wd->RenderPass;
        info.framebuffer = fd->Framebuffer;
        info.renderArea.extent.width = wd->Width;
        info.renderArea.extent.height = wd->Height;
        info.clearValueCount = 1;
        info.pClearValues = &wd->ClearValue;
        vkCmdBeginRenderPass(fd->CommandBuffer, &info, VK_SUBPASS_CONTENTS_INLINE);
    }

    // Record dear imgui primitives into command buffer
    ImGui_ImplVulkan_RenderDrawData(draw_data, fd->CommandBuffer);

    vkCmdEndRenderPass(fd->CommandBuffer);
    {
        VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        VkSubmitInfo info = {};
        info.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        info.waitSemaphoreCount = 1;
        info.pWaitSemaphores = &image_acquired_semaphore;
        info.pWaitDstStageMask = &wait_stage;
        info.commandBufferCount = 1;
        info.pCommandBuffers = &fd->CommandBuffer;
        info.signalSemaphoreCount = 1;
        info.pSignalSemaphores = &render_complete_semaphore;

        if (VkFailed(vkEndCommandBuffer(fd->CommandBuffer), "vkEndCommandBuffer", err))
            return false;
        r = vkQueueSubmit(queue, 1, &info, fd->Fence);
        if (IsSurfaceGone(r))
        {
            err = "vkQueueSubmit: device lost";
            return false;
        }
        if (VkFailed(r, "vkQueueSubmit", err))
            return false;
    }
    return true;
}

bool VulkanState::FramePresent(std::string& err)
{
    if (swapchain_rebuild)
        return true;
    ImGui_ImplVulkanH_Window* wd = &main_window;
    VkSemaphore render_complete_semaphore = wd->FrameSemaphores[wd->SemaphoreIndex].RenderCompleteSemaphore;
    VkPresentInfoKHR info = {};
    info.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    info.waitSemaphoreCount = 1;
    info.pWaitSemaphores = &render_complete_semaphore;
    info.swapchainCount = 1;
    info.pSwapchains = &wd->Swapchain;
    info.pImageIndices = &wd->FrameIndex;
    VkResult r = vkQueuePresentKHR(queue, &info);
    if (r == VK_ERROR_OUT_OF_DATE_KHR || r == VK_SUBOPTIMAL_KHR)
        swapchain_rebuild = true;
    if (r == VK_ERROR_OUT_OF_DATE_KHR)
        return true;
    if (IsSurfaceGone(r))
    {
        err = "vkQueuePresentKHR: surface lost (VkResult = " + std::to_string((int)r) + ")";
        return false;
    }
    if (r != VK_SUBOPTIMAL_KHR && VkFailed(r, "vkQueuePresentKHR", err))
        return false;
    wd->SemaphoreIndex = (wd->SemaphoreIndex + 1) % wd->SemaphoreCount;
    return true;
}

void VulkanState::CleanupVulkanWindow()
{
    ImGui_ImplVulkanH_DestroyWindow(instance, device, &main_window, allocator);
}

void VulkanState::CleanupVulkan()
{
    if (device != VK_NULL_HANDLE)
        vkDestroyDescriptorPool(device, descriptor_pool, allocator);

#ifdef APP_USE_VULKAN_DEBUG_REPORT
    auto f_vkDestroyDebugReportCallbackEXT =
        (PFN_vkDestroyDebugReportCallbackEXT)vkGetInstanceProcAddr(instance, "vkDestroyDebugReportCallbackEXT");
    if (f_vkDestroyDebugReportCallbackEXT)
        f_vkDestroyDebugReportCallbackEXT(instance, debug_report, allocator);
#endif // APP_USE_VULKAN_DEBUG_REPORT

    if (device != VK_NULL_HANDLE)
        vkDestroyDevice(device, allocator);
    if (instance != VK_NULL_HANDLE)
        vkDestroyInstance(instance, allocator);
    device = VK_NULL_HANDLE;
    instance = VK_NULL_HANDLE;
}
