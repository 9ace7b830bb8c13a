#pragma once

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace picsort {

inline namespace detail_v1 {

/**
 * @brief read-only handle to a file discovered on disk
 */
class file_entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;

 public:
  template <typename Tp>
    requires std::constructible_from<std::filesystem::path, Tp>
  inline file_entry_t(Tp &&path, const uint64_t size = 0) noexcept(
      noexcept(std::filesystem::path(std::forward<Tp>(path))))
      : _path(std::forward<Tp>(path)), _size(size) {}

  inline file_entry_t(const file_entry_t &rhs) = default;
  inline file_entry_t(file_entry_t &&rhs) = default;
  inline file_entry_t &operator=(const file_entry_t &rhs) = default;
  inline file_entry_t &operator=(file_entry_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }

  // terminal name including extension
  inline std::string name() const { return _path.filename().string(); }
  inline std::string stem() const { return _path.stem().string(); }
  inline std::string ext() const { return _path.extension().string(); }

  inline bool operator==(const file_entry_t &rhs) const noexcept {
    return _path == rhs._path;
  }
};

using file_entry_vec = std::vector<file_entry_t>;

}  // namespace detail_v1

}  // namespace picsort
