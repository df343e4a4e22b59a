#pragma once

// Logging facade: all vermouth code logs through spdlog with the `log::` prefix,
// so call sites read `log::info("listening on port {}", port)`.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace vermouth {

namespace log = spdlog;

}  // namespace vermouth
