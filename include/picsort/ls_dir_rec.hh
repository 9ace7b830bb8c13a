#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <regex>
#include <vector>

#include "config.hh"
#include "file_entry.hh"

#include <boost/asio/thread_pool.hpp>

namespace picsort {

inline namespace detail_v1 {

// decides whether a regular file is kept by the listing
using file_filter_t = std::function<bool(const std::filesystem::path &)>;

inline bool is_excluded(const std::filesystem::path &path,
                        const std::vector<std::regex> &exclude_regex) {
  for (const auto &regex : exclude_regex) {
    if (std::regex_match(path.native(), regex)) {
      return true;
    }
  }
  return false;
}

// extension is one of media_exts, ignoring case
bool is_media(const std::filesystem::path &path);

/**
 * @brief list directory recursively
 *
 * @param dir directory path
 * @param[out] file_list file list, no order guarantee
 * @param mtx mutex for protecting file_list
 * @param pool thread pool for recursive calls
 * @param filter keeps a regular file when it returns true, empty keeps all
 * @param exclude_regex regular expression to exclude files or directories
 */
void ls_dir_rec(const std::filesystem::path dir, file_entry_vec &file_list,
                std::mutex &mtx, boost::asio::thread_pool &pool,
                const file_filter_t &filter,
                const std::vector<std::regex> &exclude_regex);

/**
 * @brief list regular files under every root.
 * files of one root are sorted by path, roots keep the given order.
 *
 * @param roots directories to search
 * @param filter keeps a regular file when it returns true, empty keeps all
 * @param exclude_regex regular expression to exclude files or directories
 * @param max_thread maximum number of threads to use
 */
file_entry_vec list_files(const std::vector<std::filesystem::path> &roots,
                          const file_filter_t &filter = {},
                          const std::vector<std::regex> &exclude_regex = {},
                          const uint32_t max_thread = default_max_thread);

}  // namespace detail_v1

}  // namespace picsort
