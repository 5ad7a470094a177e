#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace platform {

// Runs argv[0] from PATH, feeding stdin_text on its standard input, and waits
// for it. Fails when it cannot be spawned or exits non-zero.
std::expected<void, std::string> run_child(const std::vector<std::string>& argv,
                                           std::string_view stdin_text = {});

} // namespace platform
