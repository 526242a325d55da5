#include "platform/linux/wayland_clipboard_output.hpp"

#include "platform/linux/spawn.hpp"

std::expected<void, std::string> WaylandClipboardOutput::deliver(const std::string& text) {
    return platform::run_command({"wl-copy"}, text);
}
