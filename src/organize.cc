#include "picsort/organize.hh"

#include <chrono>
#include <numeric>
#include <stdexcept>

#include "picsort/copy_files.hh"
#include "picsort/dedupe.hh"
#include "picsort/error.hh"
#include "picsort/log.hh"
#include "picsort/ls_dir_rec.hh"

namespace picsort {

inline namespace detail_v1 {

namespace {

void check_dirs(const options_t &opts) {
  for (const auto &dir : opts.input_dirs) {
    if (!std::filesystem::is_directory(dir)) {
      throw invalid_directory_error(dir);
    }
  }
  if (std::filesystem::exists(opts.output_dir) &&
      !std::filesystem::is_directory(opts.output_dir)) {
    throw invalid_directory_error(opts.output_dir);
  }
}

}  // namespace

uint32_t parse_max_thread(const std::string &str) {
  unsigned long value = 0;
  std::size_t pos = 0;
  try {
    value = std::stoul(str, &pos);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("jobs out of range: " + str);
  }
  // stoul accepts a sign and wraps negative input
  if (pos != str.size() || str.find('-') != std::string::npos) {
    throw std::invalid_argument("invalid jobs: " + str);
  }
  if (value == 0 || value > max_thread_limit) {
    throw std::invalid_argument("jobs must be > 0 and <= " +
                                std::to_string(max_thread_limit));
  }
  return static_cast<uint32_t>(value);
}

placement_vec organize_files(const file_entry_vec &media_files,
                             const options_t &opts) {
  auto stage_start = std::chrono::steady_clock::now();
  auto log_elapsed = [&stage_start] {
    auto now = std::chrono::steady_clock::now();
    log(log_level_t::info)
        << "elapsed: "
        << std::chrono::duration_cast<std::chrono::milliseconds>(now -
                                                                 stage_start)
               .count()
        << "ms\n";
    stage_start = now;
  };

  // keep one copy of identical files
  log(log_level_t::info) << "detect duplicates...\n";
  const auto groups =
      group_by_hash(media_files, opts.hash_algo, opts.max_thread);
  file_entry_vec unique_media;
  unique_media.reserve(groups.size());
  for (const auto &group : groups) {
    unique_media.push_back(group.files.front());
  }
  const auto dupe_size = std::accumulate(
      groups.begin(), groups.end(), uint64_t{0},
      [](uint64_t sum, const dupe_group_t &group) {
        return sum + (group.files.size() - 1) * group.files.front().size();
      });
  log(log_level_t::info) << "unique files: " << unique_media.size()
                         << " media files\n";
  log(log_level_t::info) << "duplicate files: "
                         << media_files.size() - unique_media.size() << " ("
                         << dupe_size << " bytes)\n";
  log_elapsed();

  // destination paths
  log(log_level_t::info) << "generating destinations...\n";
  auto placements = plan_by_date(unique_media, opts.output_dir, opts.depth,
                                 opts.rename_suffix);
  placements = check_destinations(placements, opts.hash_algo);
  log_elapsed();

  if (opts.dry_run) {
    log(log_level_t::info) << "dry run, " << placements.size()
                           << " files would be copied to " << opts.output_dir
                           << '\n';
    return placements;
  }

  log(log_level_t::info) << "copying " << placements.size() << " files to "
                         << opts.output_dir << '\n';
  copy_files(placements);
  log_elapsed();
  return placements;
}

placement_vec organize(const options_t &opts) {
  check_dirs(opts);
  auto list_start = std::chrono::steady_clock::now();
  auto media_files =
      list_files(opts.input_dirs, is_media, opts.exclude_regex, opts.max_thread);
  log(log_level_t::info) << "total found: " << media_files.size()
                         << " media files\n";
  log(log_level_t::info)
      << "elapsed: "
      << std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - list_start)
             .count()
      << "ms\n";
  return organize_files(media_files, opts);
}

}  // namespace detail_v1

}  // namespace picsort
