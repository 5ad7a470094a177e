#pragma once

#include "output/output.hpp"

// Puts the text on the clipboard, then pastes it into the focused window.
class WaylandTypeOutput : public OutputMethod {
public:
    std::expected<void, std::string> deliver(const std::string& text) override;
};
