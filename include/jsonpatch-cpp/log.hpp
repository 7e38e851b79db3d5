/// @file log.hpp
/// @brief Library logger (spdlog).

#pragma once

#include <spdlog/spdlog.h>

namespace jsonpatch_cpp {

/// The library-wide logger, named "jsonpatch".
///
/// Created on first use with level `warn`, so the library is silent unless
/// the caller lowers the level.
auto logger() -> spdlog::logger&;

/// Set the level of the library logger.
/// @code
/// jsonpatch_cpp::set_log_level(spdlog::level::debug);
/// @endcode
void set_log_level(spdlog::level::level_enum level);

}  // namespace jsonpatch_cpp
