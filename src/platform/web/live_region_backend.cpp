#include "platform/web/live_region_backend.h"

#include <emscripten/emscripten.h>

// Returns 0 when there is no document to attach to (worker, headless).
// clang-format off
EM_JS(int, dscope_live_region_announce, (int assertive, const char* text), {
    if (typeof document === 'undefined' || !document.body)
        return 0;
    var id = assertive ? 'dscope-live-assertive' : 'dscope-live-polite';
    var el = document.getElementById(id);
    if (!el) {
        el = document.createElement('div');
        el.id = id;
        el.setAttribute('aria-live', assertive ? 'assertive' : 'polite');
        el.setAttribute('aria-atomic', 'true');
        el.setAttribute('role', assertive ? 'alert' : 'status');
        el.style.cssText = 'position:absolute;width:1px;height:1px;margin:-1px;padding:0;' +
                           'overflow:hidden;clip:rect(0,0,0,0);white-space:nowrap;border:0;';
        document.body.appendChild(el);
    }
    // Clear first so an identical message is read again.
    el.textContent = '';
    var s = UTF8ToString(text);
    setTimeout(function() { el.textContent = s; }, 50);
    return 1;
});
// clang-format on

namespace dscope
{
bool LiveRegionBackend::Speak(const Announcement& a, std::string& err)
{
    err.clear();
    if (!dscope_live_region_announce(a.priority == AnnouncePriority::Assertive ? 1 : 0, a.text.c_str()))
    {
        err = "no document body for the aria-live region";
        return false;
    }
    return true;
}
} // namespace dscope
