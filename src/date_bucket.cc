#include "picsort/date_bucket.hh"

#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "picsort/config.hh"
#include "picsort/log.hh"
#include "picsort/ordered_multimap.hh"

namespace picsort {

inline namespace detail_v1 {

namespace {

constexpr std::array<std::string_view, 12> month_abbr = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// indexed by weekday::c_encoding, Sunday first
constexpr std::array<std::string_view, 7> weekday_abbr = {
    "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};

}  // namespace

depth_t parse_depth(std::string_view str) {
  if (str == "none") {
    return depth_t::none;
  }
  if (str == "year") {
    return depth_t::year;
  }
  if (str == "month") {
    return depth_t::month;
  }
  if (str == "day") {
    return depth_t::day;
  }
  throw std::invalid_argument("invalid depth: " + std::string(str));
}

std::string format_date(const date_t &date, const depth_t depth) {
  if (depth == depth_t::none) {
    return {};
  }
  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << (int)date.year();
  if (depth == depth_t::year) {
    return out.str();
  }
  const auto month = (unsigned)date.month();
  out << '/' << std::setw(2) << month << " - " << month_abbr[month - 1];
  if (depth == depth_t::month) {
    return out.str();
  }
  const auto weekday = std::chrono::weekday(std::chrono::sys_days(date));
  out << '/' << std::setw(2) << (unsigned)date.day() << " - "
      << weekday_abbr[weekday.c_encoding()];
  return out.str();
}

std::vector<date_bucket_t> bucket_by_date(const file_entry_vec &files,
                                          const depth_t depth,
                                          const date_parser_t &parser) {
  std::vector<date_bucket_t> buckets;
  if (depth == depth_t::none) {
    if (!files.empty()) {
      buckets.push_back({std::string(), files});
    }
    return buckets;
  }

  ordered_multimap_t<std::string, file_entry_t> date_groups;
  for (const auto &file : files) {
    const auto date = parser(file.name());
    auto key = date ? format_date(*date, depth) : std::string(no_date_bucket);
    log(log_level_t::debug) << "bucket: " << key << " <- " << file.path()
                            << '\n';
    date_groups.insert(key, file);
  }

  buckets.reserve(date_groups.size());
  for (auto &[key, members] : std::move(date_groups).release()) {
    buckets.push_back({std::move(key), std::move(members)});
  }
  return buckets;
}

}  // namespace detail_v1

}  // namespace picsort
