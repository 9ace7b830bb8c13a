#include "picsort/planner.hh"

#include <algorithm>
#include <set>

#include "picsort/log.hh"
#include "picsort/name_group.hh"

namespace picsort {

inline namespace detail_v1 {

std::size_t pad_width(std::size_t size) noexcept {
  std::size_t width = 1;
  while (size >= 10) {
    size /= 10;
    ++width;
  }
  return width;
}

std::vector<std::string> generate_names(const std::string &stem,
                                        const std::string &ext,
                                        std::size_t size,
                                        const std::string &suffix) {
  const auto width = pad_width(size);
  std::vector<std::string> names;
  names.reserve(size);
  for (std::size_t i = 1; i <= size; ++i) {
    auto idx = std::to_string(i);
    idx.insert(0, width - idx.size(), '0');
    names.emplace_back(stem + suffix + idx + ext);
  }
  return names;
}

placement_vec plan(const file_entry_vec &files,
                   const std::filesystem::path &dst_root,
                   const std::string &suffix) {
  log(log_level_t::debug) << "generating destination under '"
                          << dst_root.string() << "'\n";
  auto [unique, colliding] = resolve_names(files);

  placement_vec placements;
  placements.reserve(files.size());
  // names already kept in this batch
  std::set<std::string> taken;

  // unique files keep their names
  for (auto &file : unique) {
    auto name = file.name();
    auto dst = dst_root / name;
    log(log_level_t::debug) << "src: " << file.path() << " dst: " << dst
                            << '\n';
    taken.insert(std::move(name));
    placements.push_back({std::move(file), std::move(dst)});
  }

  // same-name files get numbered names; a numbered name that clashes with a
  // kept one repeats the suffix until the whole group is clean
  const std::string suffix_step =
      suffix.empty() ? std::string(default_rename_suffix) : suffix;
  for (auto &group : colliding) {
    const auto &first = group.files.front();
    const auto stem = first.stem();
    const auto ext = first.ext();
    auto group_suffix = suffix;
    auto names = generate_names(stem, ext, group.files.size(), group_suffix);
    while (std::any_of(names.begin(), names.end(), [&](const auto &name) {
      return taken.count(name) != 0;
    })) {
      group_suffix += suffix_step;
      names = generate_names(stem, ext, group.files.size(), group_suffix);
    }

    for (std::size_t i = 0; i < names.size(); ++i) {
      auto dst = dst_root / names[i];
      log(log_level_t::debug) << "src: " << group.files[i].path() << " dst: "
                              << dst << '\n';
      taken.insert(names[i]);
      placements.push_back({std::move(group.files[i]), std::move(dst)});
    }
  }
  return placements;
}

placement_vec plan_by_date(const file_entry_vec &files,
                           const std::filesystem::path &out_dir,
                           const depth_t depth, const std::string &suffix) {
  if (depth == depth_t::none) {
    log(log_level_t::debug) << "generating destination without date\n";
    return plan(files, out_dir, suffix);
  }

  log(log_level_t::debug) << "generating destination from date\n";
  placement_vec placements;
  placements.reserve(files.size());
  for (const auto &bucket : bucket_by_date(files, depth)) {
    auto batch = plan(bucket.files, out_dir / bucket.key, suffix);
    placements.insert(placements.end(), std::make_move_iterator(batch.begin()),
                      std::make_move_iterator(batch.end()));
  }
  return placements;
}

}  // namespace detail_v1

}  // namespace picsort
