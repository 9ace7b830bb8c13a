#include "picsort/log.hh"

#include <array>
#include <atomic>
#include <iostream>
#include <string_view>

namespace picsort {

inline namespace detail_v1 {

namespace {

std::atomic<log_level_t> g_level{log_level_t::info};

// indexed by log_level_t
constexpr std::array<std::string_view, 4> level_tags = {"[dbg] ", "[log] ",
                                                        "[warn] ", "[err] "};

}  // namespace

void set_log_level(const log_level_t level) noexcept {
  g_level.store(level, std::memory_order_relaxed);
}

log_level_t log_level() noexcept {
  return g_level.load(std::memory_order_relaxed);
}

std::osyncstream log(const log_level_t level) {
  if (!log_enabled(level)) {
    // no wrapped buffer: emit is a no-op, badbit skips formatting
    std::osyncstream muted(static_cast<std::streambuf *>(nullptr));
    muted.setstate(std::ios::badbit);
    return muted;
  }
  std::osyncstream line(std::cerr);
  line << level_tags[static_cast<std::size_t>(level)];
  return line;
}

}  // namespace detail_v1

}  // namespace picsort
