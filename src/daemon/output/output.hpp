#pragma once

#include <expected>
#include <string>

// Where finished transcriptions go (config output.method), and the clipboard
// target for history-copy. Failure placeholders are never delivered.
class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
};
