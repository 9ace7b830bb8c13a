#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace picsort {

inline namespace detail_v1 {

// raw digest bytes, length fixed by the algorithm
using digest_t = std::vector<unsigned char>;

// RAII wrapper for libcrypto message digest context.
class hasher_t {
  EVP_MD_CTX *_ctx;
  const EVP_MD *_md;

 public:
  explicit hasher_t(const EVP_MD *md);
  ~hasher_t() noexcept;

  hasher_t(const hasher_t &rhs) = delete;
  hasher_t(hasher_t &&rhs) = delete;
  hasher_t &operator=(const hasher_t &rhs) = delete;
  hasher_t &operator=(hasher_t &&rhs) = delete;

  void reset();
  void update(const char *data, const uint64_t size);
  digest_t digest();
};

/**
 * @brief look up a digest algorithm by name
 *
 * @param hash_algo any name known to libcrypto (sha256, sha512, ...)
 * @throws std::invalid_argument if libcrypto does not know the name
 */
const EVP_MD *get_digest(const std::string &hash_algo);

/**
 * @brief hash the full content of a file, reading it block by block
 *
 * @param path file to hash
 * @param md digest algorithm
 * @throws unreadable_file_error if the file cannot be opened or read
 */
digest_t digest_file(const std::filesystem::path &path, const EVP_MD *md);

std::string to_hex(const digest_t &digest);

}  // namespace detail_v1

}  // namespace picsort
