#pragma once

#include <chrono>

// One-shot timer bounding the length of a recording. Expiry is reported
// through the owning event loop, never from inside arm().
class RecordingTimer {
public:
    virtual ~RecordingTimer() = default;
    virtual bool arm(std::chrono::milliseconds timeout) = 0;
    virtual void disarm() = 0;
};
