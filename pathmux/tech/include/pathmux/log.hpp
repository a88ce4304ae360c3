#pragma once

// Logging abstraction: pathmux::log forwards to spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace pathmux {

namespace log = spdlog;

}  // namespace pathmux
