#include "picsort/copy_files.hh"

#include <filesystem>

#include "picsort/error.hh"
#include "picsort/hasher.hh"
#include "picsort/log.hh"

namespace picsort {

inline namespace detail_v1 {

placement_vec check_destinations(const placement_vec &placements,
                                 const std::string &hash_algo) {
  const EVP_MD *md = get_digest(hash_algo);
  placement_vec pending;
  pending.reserve(placements.size());
  for (const auto &placement : placements) {
    if (!std::filesystem::exists(placement.dst)) {
      pending.push_back(placement);
      continue;
    }
    if (!std::filesystem::is_regular_file(placement.dst) ||
        digest_file(placement.dst, md) !=
            digest_file(placement.src.path(), md)) {
      throw destination_conflict_error(placement.dst);
    }
    log(log_level_t::info) << "already present: " << placement.dst << '\n';
  }
  return pending;
}

void copy_files(const placement_vec &placements) {
  log(log_level_t::debug) << "copying " << placements.size() << " files\n";
  for (const auto &[src, dst] : placements) {
    log(log_level_t::debug) << "src: " << src.path() << " dst: " << dst << '\n';
    if (dst.has_parent_path()) {
      std::filesystem::create_directories(dst.parent_path());
    }
    std::filesystem::copy_file(src.path(), dst,
                               std::filesystem::copy_options::none);
  }
}

}  // namespace detail_v1

}  // namespace picsort
