#pragma once

#include <functional>

// Microphone input. Implementations write float mono frames into the
// RingBuffer they were constructed with.
class AudioCapture {
public:
    // Called on the capture thread, at most once per start(), when the ring
    // buffer can take no more samples. Must not block.
    using LimitCallback = std::function<void()>;

    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;

    // Rate the device delivers at, in Hz. Valid once start() succeeded.
    virtual double sample_rate() const = 0;

    // Mean absolute amplitude of the most recent frame.
    virtual float level() const = 0;
};
