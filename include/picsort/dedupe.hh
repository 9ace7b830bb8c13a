#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config.hh"
#include "file_entry.hh"
#include "hasher.hh"

namespace picsort {

inline namespace detail_v1 {

// files sharing one content digest, in input order
struct dupe_group_t {
  digest_t digest;
  file_entry_vec files;
};

/**
 * @brief group files by the digest of their full content.
 * every file is read once; groups and their members keep first-seen order.
 *
 * @param files files to hash
 * @param hash_algo digest algorithm name known to libcrypto
 * @param max_thread maximum number of threads hashing concurrently
 * @return every group, including groups of one
 * @throws unreadable_file_error for the lowest input index that failed to
 * read; once a read fails no further files are opened and no partial result
 * is returned
 */
std::vector<dupe_group_t> group_by_hash(
    const file_entry_vec &files,
    const std::string &hash_algo = std::string(default_hash_algo),
    const uint32_t max_thread = default_max_thread);

/**
 * @brief keep one file per distinct content, the first one seen.
 *
 * @return representatives, ordered by first appearance of their digest
 */
file_entry_vec dedupe(
    const file_entry_vec &files,
    const std::string &hash_algo = std::string(default_hash_algo),
    const uint32_t max_thread = default_max_thread);

}  // namespace detail_v1

}  // namespace picsort
