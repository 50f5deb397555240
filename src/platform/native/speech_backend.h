#pragma once

#include <string>
#include <vector>

#include "core/accessibility_bridge.h"

struct SDL_Process;

namespace dscope
{
// Announcements through speech-dispatcher's command line client (`spd-say`),
// spawned with SDL3's process API. Speak() returns as soon as the process is
// started; Pump() reaps finished ones without blocking.
//
// If spd-say is missing or exits with an error the service is considered absent
// and later Speak() calls fail immediately.
class SpeechBackend final : public AccessibilityBackend
{
public:
    explicit SpeechBackend(std::string program = "spd-say");
    ~SpeechBackend() override;

    SpeechBackend(const SpeechBackend&) = delete;
    SpeechBackend& operator=(const SpeechBackend&) = delete;

    bool Speak(const Announcement& a, std::string& err) override;
    void Pump() override;

private:
    std::string program_;
    std::vector<SDL_Process*> running_;
    bool unavailable_ = false;
    std::string unavailable_reason_;
};
} // namespace dscope
