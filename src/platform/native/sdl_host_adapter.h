#pragma once

#include <SDL3/SDL.h>

#include "core/host_adapter.h"
#include "core/input_translator.h"
#include "platform/native/sdl_clipboard_backend.h"
#include "platform/native/sdl_key_layout.h"
#include "platform/native/speech_backend.h"
#include "platform/native/vulkan_state.h"

namespace dscope
{
// Desktop host: SDL3 window + event polling, Vulkan presentation through
// imgui_impl_vulkan, SDL clipboard, speech-dispatcher announcements.
//
// Expects a current ImGui context before Initialize() (the renderer backend
// attaches to it).
class SdlHostAdapter final : public HostAdapter
{
public:
    explicit SdlHostAdapter(EventQueue& queue);
    ~SdlHostAdapter() override;

    bool Initialize(const HostConfig& cfg, std::string& err) override;
    void Shutdown() override;

    void BeginFrame() override;
    bool PresentFrame(const DrawCommands& draw, std::string& err) override;

    double    NowSeconds() const override;
    Viewport  CurrentViewport() const override;
    Modifiers CurrentModifiers() const override;
    float     UiScale() const override { return content_scale_; }
    bool      CloseRequested() const override { return close_requested_; }

    ClipboardBackend*     Clipboard() override { return &clipboard_; }
    AccessibilityBackend* Accessibility() override { return &speech_; }

    SDL_Window* Window() const { return window_; }

    const TranslatorStats& InputStats() const { return translator_.Stats(); }

protected:
    void PumpEvents() override;

private:
    void HandleEvent(const SDL_Event& event);
    void Push(const RawInput& raw);
    void SyncScale();

    SDL_Window* window_ = nullptr;
    VulkanState vk_;
    bool        vk_ready_ = false;
    bool        imgui_backend_ready_ = false;
    bool        sdl_ready_ = false;

    SdlKeyLayout        layout_;
    InputTranslator     translator_;
    SdlClipboardBackend clipboard_;
    SpeechBackend       speech_;

    float content_scale_ = 1.0f;
    bool  close_requested_ = false;
};
} // namespace dscope
