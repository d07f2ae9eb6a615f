#pragma once

#include <string>

namespace platform {

// Per-user directories for callscribe, following the XDG base directory
// layout. Empty string when no home directory can be determined.
std::string config_dir();
std::string data_dir();

} // namespace platform
