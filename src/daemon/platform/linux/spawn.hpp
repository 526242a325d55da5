#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace platform {

// Runs argv[0] from PATH and waits for it. When `input` is non-empty it is
// written to the child's stdin. Fails on a non-zero exit status.
std::expected<void, std::string> run_command(const std::vector<std::string>& argv,
                                             std::string_view input = {});

} // namespace platform
