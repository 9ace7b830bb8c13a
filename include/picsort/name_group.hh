#pragma once

#include <string>
#include <vector>

#include "file_entry.hh"

namespace picsort {

inline namespace detail_v1 {

// two or more files sharing one terminal name, in input order
struct name_group_t {
  std::string name;
  file_entry_vec files;
};

struct name_partition_t {
  file_entry_vec unique;
  std::vector<name_group_t> colliding;
};

/**
 * @brief split files by exact terminal name.
 * names seen once pass through as unique; names seen more than once come
 * back as a group. both keep first-seen order.
 */
name_partition_t resolve_names(const file_entry_vec &files);

}  // namespace detail_v1

}  // namespace picsort
