#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace picsort {

// 1MiB
constexpr auto read_buf_sz = 1UL * 1024UL * 1024UL;

constexpr uint32_t default_max_thread = 4;
constexpr uint32_t max_thread_limit = 256;

constexpr std::string_view default_hash_algo = "sha256";
constexpr std::string_view default_rename_suffix = "_#";
constexpr std::string_view no_date_bucket = "no-date";

// compared case-insensitively
constexpr std::array<std::string_view, 8> media_exts = {
    ".jpeg", ".jpg", ".gif", ".png", ".webp", ".raw", ".mp4", ".mkv"};

}  // namespace picsort
