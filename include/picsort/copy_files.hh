#pragma once

#include <string>

#include "config.hh"
#include "planner.hh"

namespace picsort {

inline namespace detail_v1 {

/**
 * @brief check planned destinations against what is already on disk,
 * before anything is copied.
 * a destination holding the same content as its source is dropped from the
 * batch; one holding different content aborts.
 *
 * @param placements planned copies
 * @param hash_algo digest algorithm used to compare existing files
 * @return placements that still need copying
 * @throws destination_conflict_error for an existing, different destination
 */
placement_vec check_destinations(
    const placement_vec &placements,
    const std::string &hash_algo = std::string(default_hash_algo));

/**
 * @brief copy every source to its destination, creating folders on the way.
 * existing destinations are never overwritten.
 *
 * @throws std::filesystem::filesystem_error on the first failed copy
 */
void copy_files(const placement_vec &placements);

}  // namespace detail_v1

}  // namespace picsort
