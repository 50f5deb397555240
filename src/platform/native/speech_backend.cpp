#include "platform/native/speech_backend.h"

#include <SDL3/SDL.h>

#include <cstddef>
#include <utility>

namespace dscope
{
// Utterances allowed to run at the same time.
static constexpr size_t kMaxRunning = 4;

SpeechBackend::SpeechBackend(std::string program) : program_(std::move(program))
{
}

SpeechBackend::~SpeechBackend()
{
    for (SDL_Process* p : running_)
        SDL_DestroyProcess(p);
    running_.clear();
}

bool SpeechBackend::Speak(const Announcement& a, std::string& err)
{
    err.clear();
    if (unavailable_)
    {
        err = unavailable_reason_;
        return false;
    }
    if (running_.size() >= kMaxRunning)
    {
        err = "speech queue full";
        return false;
    }

    // Assertive text interrupts whatever is being read (-C cancels queued messages first).
    const char* priority = (a.priority == AnnouncePriority::Assertive) ? "important" : "message";
    std::vector<const char*> args;
    args.push_back(program_.c_str());
    if (a.priority == AnnouncePriority::Assertive)
        args.push_back("-C");
    args.push_back("-P");
    args.push_back(priority);
    args.push_back("--");
    args.push_back(a.text.c_str());
    args.push_back(nullptr);

    SDL_Process* p = SDL_CreateProcess(args.data(), false);
    if (!p)
    {
        unavailable_ = true;
        unavailable_reason_ = std::string("cannot start ") + program_ + ": " + SDL_GetError();
        err = unavailable_reason_;
        return false;
    }
    running_.push_back(p);
    return true;
}

void SpeechBackend::Pump()
{
    for (size_t i = 0; i < running_.size();)
    {
        int exit_code = 0;
        if (!SDL_WaitProcess(running_[i], false, &exit_code))
        {
            ++i;
            continue;
        }

        if (exit_code != 0 && !unavailable_)
        {
            unavailable_ = true;
            unavailable_reason_ = program_ + " exited with code " + std::to_string(exit_code);
        }
        SDL_DestroyProcess(running_[i]);
        running_.erase(running_.begin() + (std::ptrdiff_t)i);
    }
}
} // namespace dscope
