#include "platform/linux/wayland_type_output.hpp"

#include "platform/linux/child_process.hpp"
#include "platform/linux/wayland_clipboard_output.hpp"

#include <unistd.h>

std::expected<void, std::string> WaylandTypeOutput::deliver(const std::string& text) {
    WaylandClipboardOutput clip;
    auto res = clip.deliver(text);
    if (!res) return res;

    // Give the compositor a moment to take the new selection.
    ::usleep(10000);

    auto paste = platform::run_child({"wtype", "-M", "ctrl", "-k", "v"});
    if (!paste) {
        return std::unexpected("paste failed: " + paste.error());
    }
    return {};
}
