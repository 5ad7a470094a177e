#pragma once

#include <string>

namespace platform {

// Detaches from the controlling terminal; only the grandchild returns.
// stdin and stdout go to /dev/null. stderr is appended to log_path, or
// dropped as well when log_path is empty or cannot be opened.
void daemonize(const std::string& log_path);

} // namespace platform
