#include "platform/native/sdl_host_adapter.h"

#include <SDL3/SDL_vulkan.h>

#include <algorithm>
#include <cstdio>

#include "imgui.h"

namespace dscope
{
namespace
{
// Backing store for ImGui's text-field clipboard hook.
static std::string g_ImGuiClipboardText;

static const char* GetClipboardTextForImGui(ImGuiContext*)
{
    g_ImGuiClipboardText.clear();
    if (char* text = SDL_GetClipboardText())
    {
        g_ImGuiClipboardText = text;
        SDL_free(text);
    }
    return g_ImGuiClipboardText.c_str();
}

static void SetClipboardTextForImGui(ImGuiContext*, const char* text)
{
    (void)SDL_SetClipboardText(text ? text : "");
}

static Modifiers ModifiersFromSdl(SDL_Keymod m)
{
    Modifiers out;
    out.ctrl = (m & SDL_KMOD_CTRL) != 0;
    out.shift = (m & SDL_KMOD_SHIFT) != 0;
    out.alt = (m & SDL_KMOD_ALT) != 0;
    out.super = (m & SDL_KMOD_GUI) != 0;
    return out;
}

static double SdlTimestampSeconds(Uint64 ns)
{
    return (double)ns / 1e9;
}
} // namespace

SdlHostAdapter::SdlHostAdapter(EventQueue& queue)
    : HostAdapter(queue), translator_(&layout_, /*button_index_base=*/SDL_BUTTON_LEFT)
{
}

SdlHostAdapter::~SdlHostAdapter()
{
    Shutdown();
}

bool SdlHostAdapter::Initialize(const HostConfig& cfg, std::string& err)
{
    err.clear();

    if (ImGui::GetCurrentContext() == nullptr)
    {
        err = "ImGui context must exist before the host is initialized.";
        return false;
    }

    if (!SDL_Init(SDL_INIT_VIDEO))
    {
        err = std::string("SDL_Init(): ") + SDL_GetError();
        return false;
    }
    sdl_ready_ = true;

    content_scale_ = SDL_GetDisplayContentScale(SDL_GetPrimaryDisplay());
    if (content_scale_ <= 0.0f)
        content_scale_ = 1.0f;

    const SDL_WindowFlags window_flags =
        (SDL_WindowFlags)(SDL_WINDOW_VULKAN |
                          SDL_WINDOW_RESIZABLE |
                          SDL_WINDOW_HIDDEN |
                          SDL_WINDOW_HIGH_PIXEL_DENSITY);

    // Keep some sanity bounds so bad state can't create a 0px or enormous window.
    const int initial_w = std::clamp(cfg.window_w, 320, 16384);
    const int initial_h = std::clamp(cfg.window_h, 240, 16384);

    window_ = SDL_CreateWindow(cfg.title.c_str(), initial_w, initial_h, window_flags);
    if (window_ == nullptr)
    {
        err = std::string("SDL_CreateWindow(): ") + SDL_GetError();
        return false;
    }

    ImVector<const char*> extensions;
    {
        uint32_t sdl_extensions_count = 0;
        const char* const* sdl_extensions = SDL_Vulkan_GetInstanceExtensions(&sdl_extensions_count);
        for (uint32_t n = 0; n < sdl_extensions_count; n++)
            extensions.push_back(sdl_extensions[n]);
    }

    if (!vk_.SetupVulkan(extensions, err))
        return false;
    vk_ready_ = true;

    VkSurfaceKHR surface = VK_NULL_HANDLE;
    if (!SDL_Vulkan_CreateSurface(window_, vk_.instance, vk_.allocator, &surface))
    {
        err = std::string("Failed to create Vulkan surface: ") + SDL_GetError();
        return false;
    }

    int pw = 0, ph = 0;
    SDL_GetWindowSizeInPixels(window_, &pw, &ph);
    if (!vk_.SetupVulkanWindow(surface, pw, ph, err))
        return false;

    if (cfg.window_pos_valid)
        SDL_SetWindowPosition(window_, cfg.window_x, cfg.window_y);
    else
        SDL_SetWindowPosition(window_, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);

    // Best-effort; may be denied by the WM.
    if (cfg.window_maximized)
        SDL_MaximizeWindow(window_);

    SDL_ShowWindow(window_);
    SDL_StartTextInput(window_);

    ImGuiIO& io = ImGui::GetIO();
    io.BackendPlatformName = "dirscope_sdl3";

    ImGuiPlatformIO& pio = ImGui::GetPlatformIO();
    pio.Platform_GetClipboardTextFn = GetClipboardTextForImGui;
    pio.Platform_SetClipboardTextFn = SetClipboardTextForImGui;

    ImGui_ImplVulkanH_Window* wd = &vk_.main_window;
    ImGui_ImplVulkan_InitInfo init_info = {};
    init_info.Instance = vk_.instance;
    init_info.PhysicalDevice = vk_.physical_device;
    init_info.Device = vk_.device;
    init_info.QueueFamily = vk_.queue_family;
    init_info.Queue = vk_.queue;
    init_info.PipelineCache = vk_.pipeline_cache;
    init_info.DescriptorPool = vk_.descriptor_pool;
    init_info.MinImageCount = vk_.min_image_count;
    init_info.ImageCount = wd->ImageCount;
    init_info.Allocator = vk_.allocator;
    init_info.PipelineInfoMain.RenderPass = wd->RenderPass;
    init_info.PipelineInfoMain.Subpass = 0;
    init_info.PipelineInfoMain.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.CheckVkResultFn = CheckVkResult;
    if (!ImGui_ImplVulkan_Init(&init_info))
    {
        err = "ImGui_ImplVulkan_Init() failed.";
        return false;
    }
    imgui_backend_ready_ = true;

    SyncScale();

    caps_.host_name = "sdl3-vulkan";
    caps_.clipboard = true;
    caps_.clipboard_binary = true;
    caps_.clipboard_async = false;
    caps_.accessibility = cfg.accessibility_enabled;
    caps_.resize_events = true;
    caps_.quit_menu = true;
    caps_.filesystem_home = true;

    std::fprintf(stderr, "[host] %s\n", DescribeCapabilities(caps_).c_str());
    return true;
}

void SdlHostAdapter::Shutdown()
{
    if (vk_ready_)
    {
        // During a Ctrl+C shutdown the device might already be in a bad state;
        // a failed wait is reported and teardown continues.
        const VkResult r = vkDeviceWaitIdle(vk_.device);
        if (r != VK_SUCCESS)
            std::fprintf(stderr, "[vulkan] vkDeviceWaitIdle during shutdown: VkResult = %d (ignored)\n", r);
    }
    if (imgui_backend_ready_)
    {
        ImGui_ImplVulkan_Shutdown();
        imgui_backend_ready_ = false;
    }
    if (vk_ready_)
    {
        vk_.CleanupVulkanWindow();
        vk_.CleanupVulkan();
        vk_ready_ = false;
    }
    if (window_)
    {
        SDL_StopTextInput(window_);
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    if (sdl_ready_)
    {
        SDL_Quit();
        sdl_ready_ = false;
    }
}

void SdlHostAdapter::SyncScale()
{
    float density = window_ ? SDL_GetWindowPixelDensity(window_) : 1.0f;
    if (density <= 0.0f)
        density = 1.0f;
    translator_.SetScale(density);
}

void SdlHostAdapter::Push(const RawInput& raw)
{
    InputEvent ev;
    if (translator_.Translate(raw, ev))
        (void)queue_.Push(std::move(ev));
}

void SdlHostAdapter::HandleEvent(const SDL_Event& event)
{
    RawInput raw;
    raw.timestamp_s = SdlTimestampSeconds(event.common.timestamp);
    raw.space = CoordSpace::Logical; // SDL3 reports window coordinates

    switch (event.type)
    {
    case SDL_EVENT_QUIT:
        close_requested_ = true;
        return;
    case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
        if (event.window.windowID == SDL_GetWindowID(window_))
            close_requested_ = true;
        return;

    case SDL_EVENT_MOUSE_MOTION:
        raw.kind = RawInput::Kind::PointerMove;
        raw.x = event.motion.x;
        raw.y = event.motion.y;
        Push(raw);
        return;

    case SDL_EVENT_MOUSE_BUTTON_DOWN:
    case SDL_EVENT_MOUSE_BUTTON_UP:
        raw.kind = RawInput::Kind::PointerButton;
        raw.code = event.button.button;
        raw.pressed = event.button.down;
        raw.x = event.button.x;
        raw.y = event.button.y;
        Push(raw);
        return;

    case SDL_EVENT_MOUSE_WHEEL:
    {
        const float flip = (event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED) ? -1.0f : 1.0f;
        raw.kind = RawInput::Kind::Wheel;
        raw.wheel_dx = -event.wheel.x * flip;
        raw.wheel_dy = event.wheel.y * flip;
        Push(raw);
        return;
    }

    case SDL_EVENT_KEY_DOWN:
    case SDL_EVENT_KEY_UP:
        raw.kind = RawInput::Kind::Key;
        raw.code = (std::uint32_t)event.key.scancode;
        raw.pressed = event.key.down;
        raw.repeat = event.key.repeat;
        raw.mods = ModifiersFromSdl(event.key.mod);
        Push(raw);
        return;

    case SDL_EVENT_TEXT_INPUT:
        raw.kind = RawInput::Kind::Text;
        raw.text = event.text.text ? event.text.text : "";
        Push(raw);
        return;

    case SDL_EVENT_WINDOW_RESIZED:
    case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
    case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED:
    {
        SyncScale();
        int w = 0, h = 0;
        SDL_GetWindowSize(window_, &w, &h);
        raw.kind = RawInput::Kind::Resize;
        raw.x = (float)w;
        raw.y = (float)h;
        Push(raw);
        return;
    }

    case SDL_EVENT_WINDOW_FOCUS_GAINED:
    case SDL_EVENT_WINDOW_FOCUS_LOST:
        raw.kind = RawInput::Kind::Focus;
        raw.focused = event.type == SDL_EVENT_WINDOW_FOCUS_GAINED;
        Push(raw);
        return;

    default:
        return;
    }
}

void SdlHostAdapter::PumpEvents()
{
    SDL_Event event;
    while (SDL_PollEvent(&event))
        HandleEvent(event);
}

void SdlHostAdapter::BeginFrame()
{
    if (!vk_ready_)
        return;

    // Resize swap chain?
    int fb_width = 0, fb_height = 0;
    SDL_GetWindowSizeInPixels(window_, &fb_width, &fb_height);
    ImGui_ImplVulkanH_Window* wd = &vk_.main_window;
    if (fb_width > 0 && fb_height > 0 &&
        (vk_.swapchain_rebuild || wd->Width != fb_width || wd->Height != fb_height))
    {
        vk_.ResizeMainWindow(fb_width, fb_height);
    }

    ImGui_ImplVulkan_NewFrame();
}

bool SdlHostAdapter::PresentFrame(const DrawCommands& draw, std::string& err)
{
    err.clear();
    if (close_requested_)
    {
        err = "window closed";
        return false;
    }
    if (!vk_ready_)
    {
        err = "no Vulkan device";
        return false;
    }

    ImDrawData* draw_data = static_cast<ImDrawData*>(draw.draw_data);
    if (!draw_data)
        return true;

    // Minimized: nothing to show, the surface is still there.
    const bool is_minimized = (draw_data->DisplaySize.x <= 0.0f || draw_data->DisplaySize.y <= 0.0f);
    if (is_minimized || (SDL_GetWindowFlags(window_) & SDL_WINDOW_MINIMIZED))
        return true;

    if (!vk_.FrameRender(draw_data, draw.clear_color, err))
        return false;
    return vk_.FramePresent(err);
}

double SdlHostAdapter::NowSeconds() const
{
    return SdlTimestampSeconds(SDL_GetTicksNS());
}

Viewport SdlHostAdapter::CurrentViewport() const
{
    Viewport vp;
    if (!window_)
        return vp;
    int w = 0, h = 0;
    SDL_GetWindowSize(window_, &w, &h);
    vp.width = (float)w;
    vp.height = (float)h;
    vp.scale = translator_.Scale();
    return vp;
}

Modifiers SdlHostAdapter::CurrentModifiers() const
{
    return ModifiersFromSdl(SDL_GetModState());
}
} // namespace dscope
