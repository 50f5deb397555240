#include "platform/native/sdl_clipboard_backend.h"

#include <SDL3/SDL.h>

#include <cstring>

namespace dscope
{
namespace
{
static const void* SDLCALL ProvideClipboardData(void* userdata, const char* mime_type, size_t* size)
{
    const ClipboardBytes* offered = static_cast<const ClipboardBytes*>(userdata);
    if (!offered || !mime_type || offered->mime_type != mime_type)
    {
        *size = 0;
        return nullptr;
    }
    *size = offered->data.size();
    return offered->data.data();
}
} // namespace

SdlClipboardBackend::~SdlClipboardBackend()
{
    if (offering_)
        SDL_ClearClipboardData();
}

void SdlClipboardBackend::Read(const std::string& mime_type, Completion done)
{
    if (mime_type.empty() || mime_type == "text/plain" || mime_type == "text/plain;charset=utf-8")
    {
        if (!SDL_HasClipboardText())
        {
            done(ClipboardOutcome::Ok, ClipboardPayload{ClipboardText{}}, {});
            return;
        }
        char* text = SDL_GetClipboardText();
        if (!text)
        {
            done(ClipboardOutcome::Unavailable, std::nullopt, SDL_GetError());
            return;
        }
        ClipboardText t;
        t.utf8 = text;
        SDL_free(text);
        done(ClipboardOutcome::Ok, ClipboardPayload{std::move(t)}, {});
        return;
    }

    if (!SDL_HasClipboardData(mime_type.c_str()))
    {
        done(ClipboardOutcome::Unavailable, std::nullopt, "no clipboard data of type " + mime_type);
        return;
    }

    size_t size = 0;
    void* data = SDL_GetClipboardData(mime_type.c_str(), &size);
    if (!data)
    {
        done(ClipboardOutcome::Unavailable, std::nullopt, SDL_GetError());
        return;
    }
    ClipboardBytes b;
    b.mime_type = mime_type;
    b.data.resize(size);
    if (size > 0)
        std::memcpy(b.data.data(), data, size);
    SDL_free(data);
    done(ClipboardOutcome::Ok, ClipboardPayload{std::move(b)}, {});
}

void SdlClipboardBackend::Write(const ClipboardPayload& payload, Completion done)
{
    if (const ClipboardText* t = std::get_if<ClipboardText>(&payload))
    {
        if (!SDL_SetClipboardText(t->utf8.c_str()))
        {
            done(ClipboardOutcome::Unavailable, std::nullopt, SDL_GetError());
            return;
        }
        offering_ = false;
        done(ClipboardOutcome::Ok, std::nullopt, {});
        return;
    }

    const ClipboardBytes& b = std::get<ClipboardBytes>(payload);
    if (b.mime_type.empty())
    {
        done(ClipboardOutcome::Unavailable, std::nullopt, "binary clipboard payload without mime type");
        return;
    }

    // Withdraw the previous offer before its buffer is reused.
    if (offering_)
        SDL_ClearClipboardData();
    offering_ = false;
    offered_ = b;
    const char* mime_types[] = {offered_.mime_type.c_str()};
    if (!SDL_SetClipboardData(ProvideClipboardData, nullptr, &offered_, mime_types, 1))
    {
        done(ClipboardOutcome::Unavailable, std::nullopt, SDL_GetError());
        return;
    }
    offering_ = true;
    done(ClipboardOutcome::Ok, std::nullopt, {});
}
} // namespace dscope
