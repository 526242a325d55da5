#include "platform/linux/wayland_paste_output.hpp"

#include "platform/linux/spawn.hpp"
#include "platform/linux/wayland_clipboard_output.hpp"

#include <unistd.h>

std::expected<void, std::string> WaylandPasteOutput::deliver(const std::string& text) {
    WaylandClipboardOutput clip;
    auto res = clip.deliver(text);
    if (!res) return res;

    // Let the compositor publish the new selection before pasting it.
    ::usleep(10000);

    return platform::run_command({"wtype", "-M", "ctrl", "-k", "v"});
}
