#include "platform/web/web_host_adapter.h"

#include <emscripten/emscripten.h>
#include <GLES3/gl3.h>

#include <cmath>
#include <cstdio>
#include <cstring>

#include "imgui.h"
#include "imgui_impl_opengl3.h"

// Canvas position in client coordinates; mouse events registered on the window
// report client coordinates.
// clang-format off
EM_JS(void, dscope_canvas_client_offset, (const char* selector, double* out_x, double* out_y), {
    var el = document.querySelector(UTF8ToString(selector));
    var r = el ? el.getBoundingClientRect() : {left: 0, top: 0};
    setValue(out_x, r.left, 'double');
    setValue(out_y, r.top, 'double');
});
// clang-format on

namespace dscope
{
namespace
{
static Modifiers ModifiersFromMouse(const EmscriptenMouseEvent& e)
{
    Modifiers m;
    m.ctrl = e.ctrlKey;
    m.shift = e.shiftKey;
    m.alt = e.altKey;
    m.super = e.metaKey;
    return m;
}

// True if `s` holds exactly one UTF-8 code point (a printable key, not "Enter").
static bool IsSingleCodePoint(const char* s)
{
    if (!s || !*s)
        return false;
    int count = 0;
    for (const unsigned char* p = (const unsigned char*)s; *p; ++p)
        if ((*p & 0xC0) != 0x80)
            ++count;
    return count == 1;
}

static float WheelToLines(double delta, unsigned long mode)
{
    switch (mode)
    {
        case DOM_DELTA_LINE: return (float)delta;
        case DOM_DELTA_PAGE: return (float)(delta * 10.0);
        default: return (float)(delta / 100.0); // DOM_DELTA_PIXEL
    }
}
} // namespace

WebHostAdapter::WebHostAdapter(EventQueue& queue, std::string canvas_selector)
    : HostAdapter(queue), canvas_(std::move(canvas_selector)), translator_(&layout_, /*button_index_base=*/0)
{
}

WebHostAdapter::~WebHostAdapter()
{
    Shutdown();
}

ClipboardBackend* WebHostAdapter::Clipboard()
{
#if defined(DSCOPE_WEB_CLIPBOARD)
    return caps_.clipboard ? &clipboard_ : nullptr;
#else
    return nullptr;
#endif
}

bool WebHostAdapter::Initialize(const HostConfig& cfg, std::string& err)
{
    err.clear();

    if (ImGui::GetCurrentContext() == nullptr)
    {
        err = "ImGui context must exist before the host is initialized.";
        return false;
    }

    EmscriptenWebGLContextAttributes attrs;
    emscripten_webgl_init_context_attributes(&attrs);
    attrs.alpha = false;
    attrs.depth = false;
    attrs.antialias = false;
    attrs.majorVersion = 2;
    attrs.minorVersion = 0;

    gl_ = emscripten_webgl_create_context(canvas_.c_str(), &attrs);
    if (gl_ <= 0)
    {
        err = "Could not create a WebGL2 context on " + canvas_ + " (error " + std::to_string((int)gl_) + ")";
        gl_ = 0;
        return false;
    }
    if (emscripten_webgl_make_context_current(gl_) != EMSCRIPTEN_RESULT_SUCCESS)
    {
        err = "Could not make the WebGL2 context current.";
        return false;
    }

    ImGuiIO& io = ImGui::GetIO();
    io.BackendPlatformName = "dirscope_emscripten";

    if (!ImGui_ImplOpenGL3_Init("#version 300 es"))
    {
        err = "ImGui_ImplOpenGL3_Init() failed.";
        return false;
    }
    imgui_backend_ready_ = true;

    SyncCanvasSize();
    RegisterCallbacks(true);

    EmscriptenVisibilityChangeEvent vis;
    if (emscripten_get_visibility_status(&vis) == EMSCRIPTEN_RESULT_SUCCESS)
        hidden_ = vis.hidden;

    caps_.host_name = "emscripten-webgl2";
#if defined(DSCOPE_WEB_CLIPBOARD)
    caps_.clipboard = WebClipboardBackend::ApiAvailable();
    caps_.clipboard_binary = caps_.clipboard && WebClipboardBackend::BinaryAvailable();
    caps_.clipboard_async = caps_.clipboard;
#else
    caps_.clipboard = false;
    caps_.clipboard_binary = false;
    caps_.clipboard_async = false;
#endif
    caps_.accessibility = cfg.accessibility_enabled;
    caps_.resize_events = true;
    caps_.quit_menu = false; // no File->Quit on web pages
    caps_.filesystem_home = false;

    std::fprintf(stderr, "[host] %s\n", DescribeCapabilities(caps_).c_str());
    return true;
}

void WebHostAdapter::RegisterCallbacks(bool enable)
{
    const char* canvas = canvas_.c_str();
    const char* window = EMSCRIPTEN_EVENT_TARGET_WINDOW;
    void* self = enable ? this : nullptr;

    // Presses start on the canvas; moves and releases are tracked on the window so
    // a drag that leaves the canvas still ends.
    emscripten_set_mousedown_callback(canvas, self, false, enable ? &WebHostAdapter::OnMouse : nullptr);
    emscripten_set_mouseup_callback(window, self, false, enable ? &WebHostAdapter::OnMouse : nullptr);
    emscripten_set_mousemove_callback(window, self, false, enable ? &WebHostAdapter::OnMouse : nullptr);
    emscripten_set_wheel_callback(canvas, self, false, enable ? &WebHostAdapter::OnWheel : nullptr);

    emscripten_set_keydown_callback(window, self, false, enable ? &WebHostAdapter::OnKey : nullptr);
    emscripten_set_keyup_callback(window, self, false, enable ? &WebHostAdapter::OnKey : nullptr);

    emscripten_set_resize_callback(window, self, false, enable ? &WebHostAdapter::OnResize : nullptr);
    emscripten_set_focus_callback(window, self, false, enable ? &WebHostAdapter::OnFocus : nullptr);
    emscripten_set_blur_callback(window, self, false, enable ? &WebHostAdapter::OnFocus : nullptr);
    emscripten_set_visibilitychange_callback(self, false, enable ? &WebHostAdapter::OnVisibility : nullptr);
    emscripten_set_webglcontextlost_callback(canvas, self, false, enable ? &WebHostAdapter::OnContextLost : nullptr);
}

void WebHostAdapter::Shutdown()
{
    if (gl_ == 0 && !imgui_backend_ready_)
        return;

    RegisterCallbacks(false);
    if (imgui_backend_ready_)
    {
        ImGui_ImplOpenGL3_Shutdown();
        imgui_backend_ready_ = false;
    }
    if (gl_ > 0)
    {
        emscripten_webgl_destroy_context(gl_);
        gl_ = 0;
    }
}

void WebHostAdapter::SyncCanvasSize()
{
    double w = 0.0, h = 0.0;
    emscripten_get_element_css_size(canvas_.c_str(), &w, &h);
    const double dpr = emscripten_get_device_pixel_ratio();
    css_w_ = w;
    css_h_ = h;
    translator_.SetScale((float)dpr);

    const int pw = (int)std::floor(w * dpr);
    const int ph = (int)std::floor(h * dpr);
    int cur_w = 0, cur_h = 0;
    emscripten_get_canvas_element_size(canvas_.c_str(), &cur_w, &cur_h);
    if (pw > 0 && ph > 0 && (cur_w != pw || cur_h != ph))
        emscripten_set_canvas_element_size(canvas_.c_str(), pw, ph);
}

void WebHostAdapter::Push(const RawInput& raw)
{
    InputEvent ev;
    if (translator_.Translate(raw, ev))
        (void)queue_.Push(std::move(ev));
}

EM_BOOL WebHostAdapter::OnMouse(int type, const EmscriptenMouseEvent* e, void* user)
{
    WebHostAdapter* self = static_cast<WebHostAdapter*>(user);
    if (!self || !e)
        return EM_FALSE;

    double off_x = 0.0, off_y = 0.0;
    dscope_canvas_client_offset(self->canvas_.c_str(), &off_x, &off_y);

    RawInput raw;
    raw.timestamp_s = self->NowSeconds();
    raw.space = CoordSpace::Logical; // CSS pixels
    raw.x = (float)((double)e->clientX - off_x);
    raw.y = (float)((double)e->clientY - off_y);
    raw.mods = ModifiersFromMouse(*e);
    self->mods_ = raw.mods;

    if (type == EMSCRIPTEN_EVENT_MOUSEMOVE)
    {
        raw.kind = RawInput::Kind::PointerMove;
        self->Push(raw);
        return EM_FALSE;
    }

    raw.kind = RawInput::Kind::PointerButton;
    raw.code = (std::uint32_t)e->button;
    raw.pressed = (type == EMSCRIPTEN_EVENT_MOUSEDOWN);
    self->Push(raw);
    return raw.pressed ? EM_TRUE : EM_FALSE;
}

EM_BOOL WebHostAdapter::OnWheel(int, const EmscriptenWheelEvent* e, void* user)
{
    WebHostAdapter* self = static_cast<WebHostAdapter*>(user);
    if (!self || !e)
        return EM_FALSE;

    RawInput raw;
    raw.kind = RawInput::Kind::Wheel;
    raw.timestamp_s = self->NowSeconds();
    // DOM: +deltaY scrolls down, +deltaX scrolls right.
    raw.wheel_dx = -WheelToLines(e->deltaX, e->deltaMode);
    raw.wheel_dy = -WheelToLines(e->deltaY, e->deltaMode);
    self->Push(raw);
    return EM_TRUE;
}

EM_BOOL WebHostAdapter::OnKey(int type, const EmscriptenKeyboardEvent* e, void* user)
{
    WebHostAdapter* self = static_cast<WebHostAdapter*>(user);
    if (!self || !e)
        return EM_FALSE;

    Modifiers m;
    m.ctrl = e->ctrlKey;
    m.shift = e->shiftKey;
    m.alt = e->altKey;
    m.super = e->metaKey;
    self->mods_ = m;

    const bool down = (type == EMSCRIPTEN_EVENT_KEYDOWN);

    RawInput raw;
    raw.kind = RawInput::Kind::Key;
    raw.timestamp_s = self->NowSeconds();
    raw.code = DomKeyLayout::CodeFromDom(e->code);
    raw.pressed = down;
    raw.repeat = e->repeat;
    raw.mods = m;
    self->Push(raw);

    bool text = false;
    if (down && !m.ctrl && !m.super && IsSingleCodePoint(e->key))
    {
        RawInput t;
        t.kind = RawInput::Kind::Text;
        t.timestamp_s = raw.timestamp_s;
        t.text = e->key;
        self->Push(t);
        text = true;
    }

    // Browser shortcuts (Ctrl/Cmd combos) keep their default action.
    if (m.ctrl || m.super)
        return EM_FALSE;
    return (text || raw.code != 0) ? EM_TRUE : EM_FALSE;
}

EM_BOOL WebHostAdapter::OnResize(int, const EmscriptenUiEvent*, void* user)
{
    WebHostAdapter* self = static_cast<WebHostAdapter*>(user);
    if (!self)
        return EM_FALSE;

    self->SyncCanvasSize();
    RawInput raw;
    raw.kind = RawInput::Kind::Resize;
    raw.timestamp_s = self->NowSeconds();
    raw.space = CoordSpace::Logical;
    raw.x = (float)self->css_w_;
    raw.y = (float)self->css_h_;
    self->Push(raw);
    return EM_FALSE;
}

EM_BOOL WebHostAdapter::OnFocus(int type, const EmscriptenFocusEvent*, void* user)
{
    WebHostAdapter* self = static_cast<WebHostAdapter*>(user);
    if (!self)
        return EM_FALSE;

    RawInput raw;
    raw.kind = RawInput::Kind::Focus;
    raw.timestamp_s = self->NowSeconds();
    raw.focused = (type == EMSCRIPTEN_EVENT_FOCUS);
    if (!raw.focused)
        self->mods_ = Modifiers{};
    self->Push(raw);
    return EM_FALSE;
}

EM_BOOL WebHostAdapter::OnVisibility(int, const EmscriptenVisibilityChangeEvent* e, void* user)
{
    WebHostAdapter* self = static_cast<WebHostAdapter*>(user);
    if (!self || !e)
        return EM_FALSE;
    self->hidden_ = e->hidden;
    std::fprintf(stderr, "[host] page %s\n", e->hidden ? "hidden" : "visible");
    return EM_FALSE;
}

EM_BOOL WebHostAdapter::OnContextLost(int, const void*, void* user)
{
    WebHostAdapter* self = static_cast<WebHostAdapter*>(user);
    if (self)
        self->context_lost_ = true;
    return EM_TRUE;
}

void WebHostAdapter::BeginFrame()
{
    if (!imgui_backend_ready_ || context_lost_)
        return;
    SyncCanvasSize();
    ImGui_ImplOpenGL3_NewFrame();
}

bool WebHostAdapter::PresentFrame(const DrawCommands& draw, std::string& err)
{
    err.clear();
    if (context_lost_)
    {
        err = "WebGL context lost";
        return false;
    }
    if (gl_ == 0)
    {
        err = "no WebGL context";
        return false;
    }

    // A hidden page keeps ticking (throttled by the browser) but draws nothing.
    ImDrawData* draw_data = static_cast<ImDrawData*>(draw.draw_data);
    if (!draw_data || hidden_)
        return true;

    int fb_w = 0, fb_h = 0;
    emscripten_get_canvas_element_size(canvas_.c_str(), &fb_w, &fb_h);
    glViewport(0, 0, fb_w, fb_h);
    glClearColor(draw.clear_color[0] * draw.clear_color[3],
                 draw.clear_color[1] * draw.clear_color[3],
                 draw.clear_color[2] * draw.clear_color[3],
                 draw.clear_color[3]);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(draw_data);

    // The browser composites the canvas after the animation frame returns.
    return true;
}

double WebHostAdapter::NowSeconds() const
{
    return emscripten_get_now() / 1000.0;
}

Viewport WebHostAdapter::CurrentViewport() const
{
    Viewport vp;
    vp.width = (float)css_w_;
    vp.height = (float)css_h_;
    vp.scale = translator_.Scale();
    return vp;
}
} // namespace dscope
