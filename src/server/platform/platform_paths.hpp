#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/whisperwriter-api or ~/.config/whisperwriter-api. Empty if unknown.
std::string config_dir();

} // namespace platform
