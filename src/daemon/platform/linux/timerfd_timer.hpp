#pragma once

#include "platform/recording_timer.hpp"

// RecordingTimer on a timerfd. The event loop polls fd() and calls
// acknowledge() before acting on an expiry.
class TimerFdTimer : public RecordingTimer {
public:
    TimerFdTimer();
    ~TimerFdTimer() override;

    TimerFdTimer(const TimerFdTimer&) = delete;
    TimerFdTimer& operator=(const TimerFdTimer&) = delete;

    bool arm(std::chrono::milliseconds timeout) override;
    void disarm() override;

    int fd() const { return fd_; }

    // Drains the expiration count; false on a spurious wakeup.
    bool acknowledge();

private:
    int fd_ = -1;
};
