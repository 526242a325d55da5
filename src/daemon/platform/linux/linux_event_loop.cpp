#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/linux/wayland_paste_output.hpp"
#include "platform/platform_paths.hpp"
#include "whisper/model_locator.hpp"
#include "whisper/whisper_model.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      task_event_fd_(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)),
      limit_event_fd_(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)),
      ring_buf_(config_.audio.max_samples),
      tasks_([this]() { notify_fd(task_event_fd_); }),
      // Runs on the PipeWire realtime thread: an eventfd write is all it does.
      audio_capture_(ring_buf_, [this]() { notify_fd(limit_event_fd_); }),
      core_(config_, verbose_, ring_buf_, audio_capture_, timer_, ipc_server_, tasks_,
            // Model loader
            [language = config_.model.language](const std::string& path) {
                return WhisperModel::load(path, language);
            },
            // OutputFactory
            [](const std::string& method) -> std::unique_ptr<OutputMethod> {
                if (method == "paste") return std::make_unique<WaylandPasteOutput>();
                if (method == "clipboard") return std::make_unique<WaylandClipboardOutput>();
                if (method != "none") {
                    std::println(stderr, "output: unknown method '{}', not delivering", method);
                }
                return nullptr;
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (task_event_fd_ >= 0) ::close(task_event_fd_);
    if (limit_event_fd_ >= 0) ::close(limit_event_fd_);
}

bool LinuxEventLoop::init() {
    if (task_event_fd_ < 0 || limit_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }
    if (timer_.fd() < 0) return false;

    // A paste helper that dies early must not take the daemon with it.
    ::signal(SIGPIPE, SIG_IGN);

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (settings db, history, model)
    auto data = platform::data_dir();
    if (data.empty()) data = "/tmp/quickscribe";

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    auto model_dirs = models::search_dirs(config_.model.dir, data, platform::executable_dir(),
                                          ec ? std::string() : cwd.string());

    if (!core_.init(data + "/settings.db", std::move(model_dirs))) return false;

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(task_event_fd_, EPOLLIN) ||
        !add_fd(limit_event_fd_, EPOLLIN) ||
        !add_fd(timer_.fd(), EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
                    log(std::string("Received ") + strsignal(static_cast<int>(info.ssi_signo)) +
                        ", shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        std::println(stderr, "ipc: epoll_ctl failed: {}", std::strerror(errno));
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == task_event_fd_) {
                uint64_t val;
                if (::read(task_event_fd_, &val, sizeof(val)) > 0) {
                    tasks_.run_pending();
                }
                continue;
            }

            if (fd == limit_event_fd_) {
                uint64_t val;
                if (::read(limit_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_capture_limit();
                }
                continue;
            }

            if (fd == timer_.fd()) {
                if (timer_.acknowledge()) {
                    core_.on_timer_expired();
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool open = ipc_server_.read_commands(fd, cmds);

    for (auto& cmd : cmds) {
        auto response = core_.handle_command(cmd);

        if (response.value("status", "") == "transcribing") {
            core_.add_waiting_client(fd);
        } else {
            ipc_server_.send_response(fd, response);
        }
    }

    if (!open) {
        drop_client(fd);
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
    core_.remove_waiting_client(fd);
}

void LinuxEventLoop::notify_fd(int fd) {
    uint64_t val = 1;
    // Only fails with EAGAIN, when a wakeup is already pending.
    (void)::write(fd, &val, sizeof(val));
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[quickscribe] {}", msg);
    }
}
