#include "picsort/hasher.hh"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include "picsort/config.hh"
#include "picsort/error.hh"
#include "picsort/log.hh"

namespace picsort {

inline namespace detail_v1 {

hasher_t::hasher_t(const EVP_MD *md) : _ctx(EVP_MD_CTX_new()), _md(md) {
  if (_ctx == nullptr) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  reset();
}

hasher_t::~hasher_t() noexcept { EVP_MD_CTX_free(_ctx); }

void hasher_t::reset() {
  if (EVP_DigestInit_ex(_ctx, _md, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

void hasher_t::update(const char *data, const uint64_t size) {
  if (EVP_DigestUpdate(_ctx, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

digest_t hasher_t::digest() {
  digest_t out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(_ctx, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  out.resize(len);
  return out;
}

const EVP_MD *get_digest(const std::string &hash_algo) {
  const EVP_MD *md = EVP_get_digestbyname(hash_algo.c_str());
  if (md == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " + hash_algo);
  }
  // below 256 bits collisions are no longer negligible
  if (EVP_MD_size(md) < 32) {
    log(log_level_t::warn) << "weak hash algorithm: " << hash_algo << '\n';
  }
  return md;
}

digest_t digest_file(const std::filesystem::path &path, const EVP_MD *md) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw unreadable_file_error(path, std::strerror(errno));
  }

  hasher_t hasher(md);
  std::vector<char> buf(read_buf_sz);
  while (ifs) {
    ifs.read(buf.data(), (std::streamsize)buf.size());
    const auto read_len = ifs.gcount();
    if (read_len > 0) {
      hasher.update(buf.data(), (uint64_t)read_len);
    }
  }
  if (ifs.bad()) {
    throw unreadable_file_error(path, "read error");
  }
  return hasher.digest();
}

std::string to_hex(const digest_t &digest) {
  static constexpr char hex_chars[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(digest.size() * 2);
  for (const auto byte : digest) {
    hex += hex_chars[byte >> 4];
    hex += hex_chars[byte & 0x0f];
  }
  return hex;
}

}  // namespace detail_v1

}  // namespace picsort
