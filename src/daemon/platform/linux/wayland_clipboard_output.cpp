#include "platform/linux/wayland_clipboard_output.hpp"

#include "platform/linux/child_process.hpp"

std::expected<void, std::string> WaylandClipboardOutput::deliver(const std::string& text) {
    return platform::run_child({"wl-copy"}, text);
}
