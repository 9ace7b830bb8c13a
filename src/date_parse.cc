#include "picsort/date_parse.hh"

#include "picsort/log.hh"

namespace picsort {

inline namespace detail_v1 {

namespace {

constexpr std::size_t date_len = 8;

inline bool is_digit(const char c) noexcept { return c >= '0' && c <= '9'; }

unsigned to_num(std::string_view digits) noexcept {
  unsigned num = 0;
  for (const auto c : digits) {
    num = num * 10 + (unsigned)(c - '0');
  }
  return num;
}

}  // namespace

std::optional<date_t> parse_yyyymmdd(std::string_view str) {
  // slide over digit runs: a run of n >= 8 digits holds n - 7 windows
  std::size_t candidates = 0;
  std::size_t last_start = 0;
  std::size_t run = 0;
  for (std::size_t i = 0; i < str.size(); ++i) {
    run = is_digit(str[i]) ? run + 1 : 0;
    if (run >= date_len) {
      ++candidates;
      last_start = i + 1 - date_len;
    }
  }
  if (candidates != 1) {
    log(log_level_t::debug) << "invalid number of dates (" << candidates
                            << ") in '" << str << "'\n";
    return std::nullopt;
  }

  const auto window = str.substr(last_start, date_len);
  const auto year = (int)to_num(window.substr(0, 4));
  const auto month = to_num(window.substr(4, 2));
  const auto day = to_num(window.substr(6, 2));
  const date_t date{std::chrono::year(year), std::chrono::month(month),
                    std::chrono::day(day)};
  // calendar years start at 1
  if (year < 1 || !date.ok()) {
    log(log_level_t::debug) << "the date " << year << '-' << month << '-' << day
                            << " is not valid\n";
    return std::nullopt;
  }
  return date;
}

date_parser_t &date_parser_t::add(std::string name, parse_fn parser) {
  _parsers.emplace_back(std::move(name), std::move(parser));
  return *this;
}

std::optional<date_t> date_parser_t::operator()(std::string_view str) const {
  log(log_level_t::debug) << "parsing '" << str << "'\n";
  for (const auto &[name, parser] : _parsers) {
    log(log_level_t::debug) << "parser: " << name << '\n';
    if (auto date = parser(str)) {
      log(log_level_t::debug) << "date found: " << (int)date->year() << '-'
                              << (unsigned)date->month() << '-'
                              << (unsigned)date->day() << '\n';
      return date;
    }
  }
  log(log_level_t::debug) << "no parser found a date in '" << str << "'\n";
  return std::nullopt;
}

const date_parser_t &date_parser_t::defaults() {
  static const date_parser_t parser =
      date_parser_t().add("yyyymmdd", parse_yyyymmdd);
  return parser;
}

std::optional<date_t> parse_date(std::string_view str) {
  return date_parser_t::defaults()(str);
}

}  // namespace detail_v1

}  // namespace picsort
