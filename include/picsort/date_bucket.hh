#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "date_parse.hh"
#include "file_entry.hh"

namespace picsort {

inline namespace detail_v1 {

// depth of date based folder nesting
enum class depth_t { none = 0, year = 1, month = 2, day = 3 };

/**
 * @brief parse none, year, month or day
 * @throws std::invalid_argument on any other string
 */
depth_t parse_depth(std::string_view str);

/**
 * @brief format a date as a relative folder for the given depth:
 * year "2023", month "2023/04 - Apr", day "2023/04 - Apr/15 - Sat",
 * none "".
 */
std::string format_date(const date_t &date, const depth_t depth);

// files sharing one formatted date, or the no-date sentinel
struct date_bucket_t {
  std::string key;
  file_entry_vec files;
};

/**
 * @brief assign every file to one bucket by the date in its name.
 * files without a date go to the no-date bucket. with depth none every
 * file lands in a single bucket with an empty key.
 *
 * @param files files to classify
 * @param depth folder depth of the bucket keys
 * @param parser date parsing chain, tried on the file name
 * @return buckets in first-seen order of their key
 */
std::vector<date_bucket_t> bucket_by_date(
    const file_entry_vec &files, const depth_t depth,
    const date_parser_t &parser = date_parser_t::defaults());

}  // namespace detail_v1

}  // namespace picsort
