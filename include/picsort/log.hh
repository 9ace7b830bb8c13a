#pragma once

#include <syncstream>

namespace picsort {

inline namespace detail_v1 {

enum class log_level_t { debug, info, warn, err };

void set_log_level(log_level_t level) noexcept;
log_level_t log_level() noexcept;

inline bool log_enabled(log_level_t level) noexcept {
  return level >= log_level();
}

/**
 * @brief start one log line on std::cerr, prefixed with the level tag.
 * the line is emitted as a whole when the returned stream is destroyed, so
 * lines from pool workers never interleave. below the current level the
 * stream has no target and ignores everything written to it.
 *
 * usage: log(log_level_t::info) << "file count: " << n << '\n';
 */
std::osyncstream log(log_level_t level);

}  // namespace detail_v1

}  // namespace picsort
