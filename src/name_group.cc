#include "picsort/name_group.hh"

#include "picsort/log.hh"
#include "picsort/ordered_multimap.hh"

namespace picsort {

inline namespace detail_v1 {

name_partition_t resolve_names(const file_entry_vec &files) {
  ordered_multimap_t<std::string, file_entry_t> name_groups;
  for (const auto &file : files) {
    name_groups.insert(file.name(), file);
  }

  name_partition_t partition;
  for (auto &[name, members] : std::move(name_groups).release()) {
    if (members.size() == 1) {
      partition.unique.emplace_back(std::move(members.front()));
    } else {
      partition.colliding.push_back({std::move(name), std::move(members)});
    }
  }

  log(log_level_t::debug) << "from " << files.size() << " files, found "
                          << partition.unique.size() << " with unique name and "
                          << partition.colliding.size()
                          << " groups of same name\n";
  return partition;
}

}  // namespace detail_v1

}  // namespace picsort
