#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace rangeserve {

// All rangeserve logging goes through spdlog's default logger.
namespace log = spdlog;

}  // namespace rangeserve
