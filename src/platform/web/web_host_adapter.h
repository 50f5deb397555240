#pragma once

#include <emscripten/html5.h>

#include <string>

#include "core/host_adapter.h"
#include "core/input_translator.h"
#include "platform/web/dom_key_layout.h"
#include "platform/web/live_region_backend.h"

#if defined(DSCOPE_WEB_CLIPBOARD)
#include "platform/web/web_clipboard_backend.h"
#endif

namespace dscope
{
// Browser host: a <canvas> with a WebGL2 context rendered through
// imgui_impl_opengl3, input from Emscripten html5 callbacks.
//
// DOM callbacks run whenever the browser dispatches them, between animation
// frames. Each one translates and pushes straight into the EventQueue, so
// PumpEvents() has nothing left to do.
//
// A lost WebGL context is fatal (PresentFrame fails). A hidden tab is not: the
// browser simply stops calling the animation frame until it is visible again.
class WebHostAdapter final : public HostAdapter
{
public:
    explicit WebHostAdapter(EventQueue& queue, std::string canvas_selector = "#canvas");
    ~WebHostAdapter() override;

    bool Initialize(const HostConfig& cfg, std::string& err) override;
    void Shutdown() override;

    void BeginFrame() override;
    bool PresentFrame(const DrawCommands& draw, std::string& err) override;

    double    NowSeconds() const override;
    Viewport  CurrentViewport() const override;
    Modifiers CurrentModifiers() const override { return mods_; }

    ClipboardBackend*     Clipboard() override;
    AccessibilityBackend* Accessibility() override { return &live_region_; }

    const TranslatorStats& InputStats() const { return translator_.Stats(); }

protected:
    void PumpEvents() override {}

private:
    static EM_BOOL OnMouse(int type, const EmscriptenMouseEvent* e, void* user);
    static EM_BOOL OnWheel(int type, const EmscriptenWheelEvent* e, void* user);
    static EM_BOOL OnKey(int type, const EmscriptenKeyboardEvent* e, void* user);
    static EM_BOOL OnResize(int type, const EmscriptenUiEvent* e, void* user);
    static EM_BOOL OnFocus(int type, const EmscriptenFocusEvent* e, void* user);
    static EM_BOOL OnVisibility(int type, const EmscriptenVisibilityChangeEvent* e, void* user);
    static EM_BOOL OnContextLost(int type, const void* reserved, void* user);

    void Push(const RawInput& raw);
    void SyncCanvasSize();
    void RegisterCallbacks(bool enable);

    std::string canvas_;
    EMSCRIPTEN_WEBGL_CONTEXT_HANDLE gl_ = 0;
    bool imgui_backend_ready_ = false;

    DomKeyLayout      layout_;
    InputTranslator   translator_;
    LiveRegionBackend live_region_;
#if defined(DSCOPE_WEB_CLIPBOARD)
    WebClipboardBackend clipboard_;
#endif

    Modifiers mods_;
    double    css_w_ = 0.0;
    double    css_h_ = 0.0;
    bool      hidden_ = false;
    bool      context_lost_ = false;
};
} // namespace dscope
