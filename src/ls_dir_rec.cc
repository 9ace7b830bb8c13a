#include "picsort/ls_dir_rec.hh"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>

#include <boost/asio.hpp>

#include "picsort/log.hh"

namespace picsort {

inline namespace detail_v1 {

namespace ba = boost::asio;

bool is_media(const std::filesystem::path &path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return (char)std::tolower(c);
  });
  return std::find(media_exts.begin(), media_exts.end(), ext) !=
         media_exts.end();
}

void ls_dir_rec(const std::filesystem::path dir, file_entry_vec &file_list,
                std::mutex &mtx, ba::thread_pool &pool,
                const file_filter_t &filter,
                const std::vector<std::regex> &exclude_regex) {
  log(log_level_t::debug) << "listing directory " << dir << '\n';
  file_entry_vec file_list_tmp;
  try {
    for (const auto &dir_entry : std::filesystem::directory_iterator(dir)) {
      if (is_excluded(dir_entry.path(), exclude_regex)) {
        // exclude, skip
        log(log_level_t::info) << "exclude: " << dir_entry.path() << '\n';

      } else if (dir_entry.is_symlink()) {
        // symlink, skip
        log(log_level_t::warn) << "skip symlink: " << dir_entry.path() << '\n';

      } else if (dir_entry.is_directory()) {
        // directory, recursive call
        ba::post(pool, std::bind(ls_dir_rec, dir_entry.path(),
                                 std::ref(file_list), std::ref(mtx),
                                 std::ref(pool), std::cref(filter),
                                 std::cref(exclude_regex)));

      } else if (dir_entry.is_regular_file()) {
        // regular file, add to list when accepted
        if (filter && !filter(dir_entry.path())) {
          continue;
        }
        std::error_code ec;
        auto file_size = dir_entry.file_size(ec);
        if (ec) {
          log(log_level_t::warn) << "skip file: " << dir_entry.path() << " - "
                                 << ec.message() << '\n';
        } else {
          log(log_level_t::debug) << "listed " << dir_entry.path() << '\n';
          file_list_tmp.emplace_back(dir_entry.path(), file_size);
        }

      } else {
        // other file type, skip
        log(log_level_t::warn) << "skip unsupported file: " << dir_entry.path()
                               << '\n';
      }
    }
  } catch (std::filesystem::filesystem_error &e) {
    // error iterate directory, skip
    log(log_level_t::warn) << "skip directory: " << dir << " - "
                           << e.code().message() << '\n';
  }

  // append to global list
  if (!file_list_tmp.empty()) {
    std::lock_guard lk(mtx);
    file_list.insert(file_list.end(),
                     std::make_move_iterator(file_list_tmp.begin()),
                     std::make_move_iterator(file_list_tmp.end()));
  }
}

file_entry_vec list_files(const std::vector<std::filesystem::path> &roots,
                          const file_filter_t &filter,
                          const std::vector<std::regex> &exclude_regex,
                          const uint32_t max_thread) {
  file_entry_vec all_files;
  for (const auto &root : roots) {
    if (is_excluded(root, exclude_regex)) {
      log(log_level_t::info) << "exclude: " << root << '\n';
      continue;
    }
    log(log_level_t::info) << "listing files in " << root << '\n';
    file_entry_vec file_list;
    {
      ba::thread_pool pool(max_thread == 0 ? 1 : max_thread);
      std::mutex mtx;
      ba::post(pool, std::bind(ls_dir_rec, root, std::ref(file_list),
                               std::ref(mtx), std::ref(pool), std::cref(filter),
                               std::cref(exclude_regex)));
      pool.join();
    }
    // pool completion order is arbitrary
    std::sort(file_list.begin(), file_list.end(),
              [](const auto &lhs, const auto &rhs) {
                return lhs.path() < rhs.path();
              });
    log(log_level_t::info) << "found " << file_list.size() << " files\n";
    all_files.insert(all_files.end(),
                     std::make_move_iterator(file_list.begin()),
                     std::make_move_iterator(file_list.end()));
  }
  return all_files;
}

}  // namespace detail_v1

}  // namespace picsort
