#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace picsort {

inline namespace detail_v1 {

using date_t = std::chrono::year_month_day;

/**
 * @brief find a YYYYMMDD date in a string.
 * every overlapping window of 8 ascii digits is a candidate; anything but
 * exactly one candidate, or a candidate that is not a calendar date, gives
 * no date.
 *
 * @param str file name or any other string
 */
std::optional<date_t> parse_yyyymmdd(std::string_view str);

/**
 * @brief ordered chain of date parsing strategies, the first strategy
 * returning a date wins.
 */
class date_parser_t {
 public:
  using parse_fn = std::function<std::optional<date_t>(std::string_view)>;

 private:
  std::vector<std::pair<std::string, parse_fn>> _parsers;

 public:
  date_parser_t() = default;

  // append a strategy, tried after every strategy added before it
  date_parser_t &add(std::string name, parse_fn parser);

  inline std::size_t size() const noexcept { return _parsers.size(); }

  std::optional<date_t> operator()(std::string_view str) const;

  // chain used by parse_date
  static const date_parser_t &defaults();
};

std::optional<date_t> parse_date(std::string_view str);

}  // namespace detail_v1

}  // namespace picsort
