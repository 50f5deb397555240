#include "platform/web/web_clipboard_backend.h"

#include <emscripten/emscripten.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace dscope
{
namespace
{
// Outcome codes shared with the JS glue below.
enum : int
{
    kJsOk = 0,
    kJsDenied = 1,
    kJsUnavailable = 2,
};

// Payload kinds shared with the JS glue below.
enum : int
{
    kJsNoPayload = 0,
    kJsText = 1,
    kJsBytes = 2,
};

// The module is single-threaded; the only live backend receives every completion.
static WebClipboardBackend* g_WebClipboard = nullptr;

static ClipboardOutcome OutcomeFromJs(int code)
{
    switch (code)
    {
        case kJsOk: return ClipboardOutcome::Ok;
        case kJsDenied: return ClipboardOutcome::PermissionDenied;
        default: return ClipboardOutcome::Unavailable;
    }
}
} // namespace
} // namespace dscope

// JS -> C++. Takes ownership of `data`, `mime` and `detail` (malloc'd by the glue).
extern "C" EMSCRIPTEN_KEEPALIVE void dscope_clipboard_done(int id,
                                                           int outcome,
                                                           int kind,
                                                           std::uint8_t* data,
                                                           int len,
                                                           char* mime,
                                                           char* detail)
{
    using namespace dscope;

    std::optional<ClipboardPayload> payload;
    if (kind == kJsText)
    {
        ClipboardText t;
        if (data && len > 0)
            t.utf8.assign(reinterpret_cast<const char*>(data), (size_t)len);
        payload = ClipboardPayload{std::move(t)};
    }
    else if (kind == kJsBytes)
    {
        ClipboardBytes b;
        if (mime)
            b.mime_type = mime;
        if (data && len > 0)
            b.data.assign(data, data + len);
        payload = ClipboardPayload{std::move(b)};
    }
    std::string detail_text = detail ? detail : "";

    std::free(data);
    std::free(mime);
    std::free(detail);

    if (g_WebClipboard)
        g_WebClipboard->Complete(id, OutcomeFromJs(outcome), std::move(payload), std::move(detail_text));
}

// clang-format off
EM_JS(int, dscope_clipboard_api_available, (), {
    return (typeof navigator !== 'undefined' && navigator.clipboard) ? 1 : 0;
});

EM_JS(int, dscope_clipboard_binary_available, (), {
    return (typeof ClipboardItem !== 'undefined' && navigator.clipboard && navigator.clipboard.write) ? 1 : 0;
});

EM_JS(void, dscope_clipboard_write_text_js, (int id, const char* text), {
    var done = function(outcome, detail) {
        Module._dscope_clipboard_done(id, outcome, 0, 0, 0, 0, detail ? stringToNewUTF8(detail) : 0);
    };
    var failure = function(e) {
        var name = (e && e.name) ? e.name : 'Error';
        done(name === 'NotAllowedError' ? 1 : 2, name + ': ' + ((e && e.message) ? e.message : String(e)));
    };
    if (typeof navigator === 'undefined' || !navigator.clipboard || !navigator.clipboard.writeText) {
        done(2, 'navigator.clipboard.writeText is not available');
        return;
    }
    var s = UTF8ToString(text);
    navigator.clipboard.writeText(s).then(function() { done(0, null); }, failure);
});

EM_JS(void, dscope_clipboard_read_text_js, (int id), {
    var failure = function(e) {
        var name = (e && e.name) ? e.name : 'Error';
        var detail = name + ': ' + ((e && e.message) ? e.message : String(e));
        Module._dscope_clipboard_done(id, name === 'NotAllowedError' ? 1 : 2, 0, 0, 0, 0, stringToNewUTF8(detail));
    };
    if (typeof navigator === 'undefined' || !navigator.clipboard || !navigator.clipboard.readText) {
        failure({name: 'NotSupportedError', message: 'navigator.clipboard.readText is not available'});
        return;
    }
    navigator.clipboard.readText().then(function(s) {
        var len = lengthBytesUTF8(s);
        var ptr = _malloc(len + 1);
        stringToUTF8(s, ptr, len + 1);
        Module._dscope_clipboard_done(id, 0, 1, ptr, len, 0, 0);
    }, failure);
});

EM_JS(void, dscope_clipboard_write_bytes_js, (int id, const char* mime, const unsigned char* data, int len), {
    var failure = function(e) {
        var name = (e && e.name) ? e.name : 'Error';
        var detail = name + ': ' + ((e && e.message) ? e.message : String(e));
        Module._dscope_clipboard_done(id, name === 'NotAllowedError' ? 1 : 2, 0, 0, 0, 0, stringToNewUTF8(detail));
    };
    if (typeof ClipboardItem === 'undefined' || !navigator.clipboard || !navigator.clipboard.write) {
        failure({name: 'NotSupportedError', message: 'ClipboardItem is not available'});
        return;
    }
    var type = UTF8ToString(mime);
    var blob = new Blob([HEAPU8.slice(data, data + len)], {type: type});
    var item = {};
    item[type] = blob;
    navigator.clipboard.write([new ClipboardItem(item)]).then(function() {
        Module._dscope_clipboard_done(id, 0, 0, 0, 0, 0, 0);
    }, failure);
});

EM_JS(void, dscope_clipboard_read_bytes_js, (int id, const char* mime), {
    var failure = function(e) {
        var name = (e && e.name) ? e.name : 'Error';
        var detail = name + ': ' + ((e && e.message) ? e.message : String(e));
        Module._dscope_clipboard_done(id, name === 'NotAllowedError' ? 1 : 2, 0, 0, 0, 0, stringToNewUTF8(detail));
    };
    if (!navigator.clipboard || !navigator.clipboard.read) {
        failure({name: 'NotSupportedError', message: 'navigator.clipboard.read is not available'});
        return;
    }
    var type = UTF8ToString(mime);
    navigator.clipboard.read().then(function(items) {
        for (var i = 0; i < items.length; ++i) {
            if (items[i].types.indexOf(type) >= 0) {
                return items[i].getType(type).then(function(blob) { return blob.arrayBuffer(); });
            }
        }
        throw {name: 'NotFoundError', message: 'no clipboard item of type ' + type};
    }).then(function(buf) {
        var bytes = new Uint8Array(buf);
        var ptr = _malloc(bytes.length > 0 ? bytes.length : 1);
        HEAPU8.set(bytes, ptr);
        Module._dscope_clipboard_done(id, 0, 2, ptr, bytes.length, stringToNewUTF8(type), 0);
    }).catch(failure);
});
// clang-format on

namespace dscope
{
WebClipboardBackend::WebClipboardBackend()
{
    g_WebClipboard = this;
}

WebClipboardBackend::~WebClipboardBackend()
{
    if (g_WebClipboard == this)
        g_WebClipboard = nullptr;
    // Promises that settle later find no backend and are dropped.
    pending_.clear();
}

bool WebClipboardBackend::ApiAvailable()
{
    return dscope_clipboard_api_available() != 0;
}

bool WebClipboardBackend::BinaryAvailable()
{
    return dscope_clipboard_binary_available() != 0;
}

int WebClipboardBackend::Track(Completion done)
{
    const int id = next_id_++;
    pending_.emplace(id, std::move(done));
    return id;
}

void WebClipboardBackend::Complete(int request_id,
                                   ClipboardOutcome outcome,
                                   std::optional<ClipboardPayload> payload,
                                   std::string detail)
{
    auto it = pending_.find(request_id);
    if (it == pending_.end())
        return;
    Completion done = std::move(it->second);
    pending_.erase(it);

    if (outcome != ClipboardOutcome::Ok)
        std::fprintf(stderr, "[clipboard] request %d: %s (%s)\n", request_id, ClipboardOutcomeName(outcome), detail.c_str());
    done(outcome, std::move(payload), std::move(detail));
}

void WebClipboardBackend::Read(const std::string& mime_type, Completion done)
{
    const int id = Track(std::move(done));
    if (mime_type.empty() || mime_type == "text/plain")
        dscope_clipboard_read_text_js(id);
    else
        dscope_clipboard_read_bytes_js(id, mime_type.c_str());
}

void WebClipboardBackend::Write(const ClipboardPayload& payload, Completion done)
{
    const int id = Track(std::move(done));
    if (const ClipboardText* t = std::get_if<ClipboardText>(&payload))
    {
        dscope_clipboard_write_text_js(id, t->utf8.c_str());
        return;
    }
    const ClipboardBytes& b = std::get<ClipboardBytes>(payload);
    dscope_clipboard_write_bytes_js(id, b.mime_type.c_str(), b.data.data(), (int)b.data.size());
}
} // namespace dscope
