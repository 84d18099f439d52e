#pragma once

// Logging goes through spdlog. Callers write log::debug(...), log::warn(...) etc. so that the backend stays an
// implementation detail of this header.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace conduit {

namespace log = spdlog;

}  // namespace conduit
