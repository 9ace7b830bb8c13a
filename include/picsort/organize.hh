#pragma once

#include <cstdint>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

#include "config.hh"
#include "date_bucket.hh"
#include "file_entry.hh"
#include "planner.hh"

namespace picsort {

inline namespace detail_v1 {

struct options_t {
  std::vector<std::filesystem::path> input_dirs;
  std::filesystem::path output_dir;
  depth_t depth = depth_t::month;
  std::string rename_suffix = std::string(default_rename_suffix);
  std::string hash_algo = std::string(default_hash_algo);
  std::vector<std::regex> exclude_regex;
  uint32_t max_thread = default_max_thread;
  // plan only, copy nothing
  bool dry_run = false;
};

/**
 * @brief parse a worker count given on the command line
 *
 * @throws std::invalid_argument unless str is a decimal number in
 * [1, max_thread_limit]
 */
uint32_t parse_max_thread(const std::string &str);

/**
 * @brief copy the given media files into the output directory, one copy
 * per distinct content, sorted into date folders. every file is hashed and
 * every destination checked before the first copy.
 *
 * @param media_files files to organize, in first-seen order
 * @param opts run configuration, input_dirs is not used
 * @return planned copies, excluding destinations already holding the file
 * @throws unreadable_file_error if a media file cannot be read
 * @throws destination_conflict_error if a destination holds another file
 */
placement_vec organize_files(const file_entry_vec &media_files,
                             const options_t &opts);

/**
 * @brief copy the media files found under the input directories into the
 * output directory, one copy per distinct content, sorted into date folders.
 * nothing is copied unless every file was hashed and every destination
 * checked.
 *
 * @param opts run configuration
 * @return planned copies, excluding destinations already holding the file
 * @throws invalid_directory_error if an input is not a directory, or the
 * output exists and is not a directory
 * @throws unreadable_file_error if a media file cannot be read
 * @throws destination_conflict_error if a destination holds another file
 */
placement_vec organize(const options_t &opts);

}  // namespace detail_v1

}  // namespace picsort
