#include "picsort/dedupe.hh"

#include <atomic>
#include <exception>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

#include "picsort/log.hh"
#include "picsort/ordered_multimap.hh"

namespace picsort {

inline namespace detail_v1 {

namespace ba = boost::asio;

namespace {

// hash one file into its slot; the first failure stops later jobs from
// opening more files
void hash_job(const file_entry_t &file, const EVP_MD *md, digest_t &digest,
              std::exception_ptr &error, std::atomic<bool> &abort) {
  if (abort.load(std::memory_order_relaxed)) {
    return;
  }
  try {
    digest = digest_file(file.path(), md);
    log(log_level_t::debug) << "file: " << file.path() << " hash: "
                            << to_hex(digest) << '\n';
  } catch (...) {
    error = std::current_exception();
    abort.store(true, std::memory_order_relaxed);
  }
}

}  // namespace

std::vector<dupe_group_t> group_by_hash(const file_entry_vec &files,
                                        const std::string &hash_algo,
                                        const uint32_t max_thread) {
  const EVP_MD *md = get_digest(hash_algo);
  log(log_level_t::debug) << "group " << files.size() << " files by hash ("
                          << hash_algo << ")\n";

  // results are indexed by input position, never by completion order
  std::vector<digest_t> digests(files.size());
  std::vector<std::exception_ptr> errors(files.size());
  {
    std::atomic<bool> abort(false);
    ba::thread_pool pool(max_thread == 0 ? 1 : max_thread);
    for (std::size_t i = 0; i < files.size(); ++i) {
      ba::post(pool, std::bind(hash_job, std::cref(files[i]), md,
                               std::ref(digests[i]), std::ref(errors[i]),
                               std::ref(abort)));
    }
    pool.join();
  }
  for (const auto &error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }

  ordered_multimap_t<digest_t, file_entry_t> hash_groups;
  for (std::size_t i = 0; i < files.size(); ++i) {
    hash_groups.insert(digests[i], files[i]);
  }
  log(log_level_t::debug) << "found " << hash_groups.size()
                          << " unique files\n";

  std::vector<dupe_group_t> groups;
  groups.reserve(hash_groups.size());
  for (auto &[digest, members] : std::move(hash_groups).release()) {
    groups.push_back({std::move(digest), std::move(members)});
  }
  return groups;
}

file_entry_vec dedupe(const file_entry_vec &files, const std::string &hash_algo,
                      const uint32_t max_thread) {
  file_entry_vec unique;
  for (auto &group : group_by_hash(files, hash_algo, max_thread)) {
    unique.emplace_back(std::move(group.files.front()));
  }
  return unique;
}

}  // namespace detail_v1

}  // namespace picsort
