#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace picsort {

inline namespace detail_v1 {

// base of all errors tied to a path on disk
class error : public std::runtime_error {
  std::filesystem::path _path;

 public:
  inline error(const std::string &what, std::filesystem::path path)
      : std::runtime_error(what + ": " + path.string()),
        _path(std::move(path)) {}

  inline const std::filesystem::path &path() const noexcept { return _path; }
};

// a file could not be opened or read while hashing
class unreadable_file_error : public error {
 public:
  inline unreadable_file_error(std::filesystem::path path,
                               const std::string &reason)
      : error("cannot read file (" + reason + ")", std::move(path)) {}
};

// a configured input or output path exists but is not a directory
class invalid_directory_error : public error {
 public:
  inline explicit invalid_directory_error(std::filesystem::path path)
      : error("not a directory", std::move(path)) {}
};

// a planned destination already holds a different file
class destination_conflict_error : public error {
 public:
  inline explicit destination_conflict_error(std::filesystem::path path)
      : error("destination exists with different content", std::move(path)) {}
};

}  // namespace detail_v1

}  // namespace picsort
