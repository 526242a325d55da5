#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/timerfd_timer.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "ring_buffer.hpp"
#include "task_queue.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    static void notify_fd(int fd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Declared before everything that may signal them.
    int task_event_fd_ = -1;
    int limit_event_fd_ = -1;

    // Platform implementations (constructed before core_)
    RingBuffer ring_buf_;
    TaskQueue tasks_;
    PipeWireCapture audio_capture_;
    TimerFdTimer timer_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
