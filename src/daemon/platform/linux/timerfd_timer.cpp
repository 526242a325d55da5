#include "platform/linux/timerfd_timer.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <print>
#include <sys/timerfd.h>
#include <unistd.h>

TimerFdTimer::TimerFdTimer() {
    fd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd_ < 0) {
        std::println(stderr, "timer: timerfd_create failed: {}", std::strerror(errno));
    }
}

TimerFdTimer::~TimerFdTimer() {
    if (fd_ >= 0) ::close(fd_);
}

bool TimerFdTimer::arm(std::chrono::milliseconds timeout) {
    if (fd_ < 0) return false;
    if (timeout.count() <= 0) timeout = std::chrono::milliseconds(1);

    itimerspec spec{};
    spec.it_value.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    spec.it_value.tv_nsec = static_cast<long>((timeout.count() % 1000) * 1'000'000);

    if (::timerfd_settime(fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timer: timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

void TimerFdTimer::disarm() {
    if (fd_ < 0) return;
    itimerspec spec{};
    if (::timerfd_settime(fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timer: disarm failed: {}", std::strerror(errno));
    }
    acknowledge();
}

bool TimerFdTimer::acknowledge() {
    uint64_t expirations = 0;
    ssize_t n = ::read(fd_, &expirations, sizeof(expirations));
    return n == static_cast<ssize_t>(sizeof(expirations)) && expirations > 0;
}
