#pragma once

#include "output/output.hpp"

// Copies to the clipboard, then sends Ctrl+V to the focused window.
class WaylandPasteOutput : public OutputMethod {
public:
    std::expected<void, std::string> deliver(const std::string& text) override;
};
