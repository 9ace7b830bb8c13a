#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "config.hh"
#include "date_bucket.hh"
#include "file_entry.hh"

namespace picsort {

inline namespace detail_v1 {

// where one source file goes
struct placement_t {
  file_entry_t src;
  std::filesystem::path dst;
};

using placement_vec = std::vector<placement_t>;

// digits needed to write size, counting from 1
std::size_t pad_width(std::size_t size) noexcept;

/**
 * @brief numbered names: stem + suffix + zero padded index + ext,
 * for index 1..size.
 *
 * @example generate_names("photo", ".jpg", 3) -> photo_#1.jpg .. photo_#3.jpg
 */
std::vector<std::string> generate_names(
    const std::string &stem, const std::string &ext, std::size_t size,
    const std::string &suffix = std::string(default_rename_suffix));

/**
 * @brief destinations for one batch of files placed in the same folder.
 * unique names are kept, same-name files are numbered in input order.
 * destinations are pairwise distinct. no I/O is done.
 *
 * @param files files of the batch
 * @param dst_root folder prepended to every destination name
 * @param suffix marker placed between stem and index of renamed files
 */
placement_vec plan(
    const file_entry_vec &files, const std::filesystem::path &dst_root = {},
    const std::string &suffix = std::string(default_rename_suffix));

/**
 * @brief bucket files by date, then plan every bucket under
 * out_dir / bucket key. with depth none one batch is planned under out_dir.
 */
placement_vec plan_by_date(
    const file_entry_vec &files, const std::filesystem::path &out_dir,
    const depth_t depth,
    const std::string &suffix = std::string(default_rename_suffix));

}  // namespace detail_v1

}  // namespace picsort
