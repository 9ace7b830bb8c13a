#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "picsort/config.hh"
#include "picsort/date_bucket.hh"
#include "picsort/log.hh"
#include "picsort/organize.hh"

using namespace std::literals;

namespace {

constexpr auto usage =
    "usage: picsort -i DIR [DIR...] -o DIR [-d none|year|month|day]\n"
    "               [-a hash_algo] [-e exclude_regex] [-j jobs]\n"
    "               [-n/--dry-run] [-p/--print] [--debug] [-h/--help]\n"
    "\n"
    "  -i, --input    input directories containing media files\n"
    "  -o, --output   directory where the organized media is saved\n"
    "  -d, --depth    none -> DIR/, year -> DIR/YYYY/,\n"
    "                 month -> DIR/YYYY/MM - Mon/,\n"
    "                 day -> DIR/YYYY/MM - Mon/DD - Day/ (default: month)\n"
    "  -a, --algo     digest algorithm (default: sha256)\n"
    "  -e, --exclude  skip paths matching the regex, may repeat\n"
    "  -j, --jobs     worker threads (default: 4)\n"
    "  -n, --dry-run  plan only, copy nothing\n"
    "  -p, --print    print every planned copy\n"
    "      --debug    debug logging\n";

bool is_flag(const char* arg) { return arg[0] == '-' && arg[1] != '\0'; }

}  // namespace

int main(int argc, char* argv[]) {
  picsort::options_t opts;
  bool print_out = false;
  bool has_output = false;

  for (int i = 1; i < argc; ++i) {
    if (argv[i] == "-i"sv || argv[i] == "--input"sv) {
      if (i + 1 >= argc || is_flag(argv[i + 1])) {
        std::cerr << "missing input directory" << std::endl;
        return 1;
      }
      while (i + 1 < argc && !is_flag(argv[i + 1])) {
        opts.input_dirs.emplace_back(argv[++i]);
      }
    } else if (argv[i] == "-o"sv || argv[i] == "--output"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing output directory" << std::endl;
        return 1;
      }
      opts.output_dir = argv[i];
      has_output = true;
    } else if (argv[i] == "-d"sv || argv[i] == "--depth"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing depth" << std::endl;
        return 1;
      }
      try {
        opts.depth = picsort::parse_depth(argv[i]);
      } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 1;
      }
    } else if (argv[i] == "-a"sv || argv[i] == "--algo"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing hash_algo" << std::endl;
        return 1;
      }
      opts.hash_algo = argv[i];
    } else if (argv[i] == "-e"sv || argv[i] == "--exclude"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing exclude_regex" << std::endl;
        return 1;
      }
      try {
        opts.exclude_regex.emplace_back(argv[i]);
      } catch (const std::regex_error& e) {
        std::cerr << "invalid exclude_regex: " << argv[i] << std::endl;
        return 1;
      }
    } else if (argv[i] == "-j"sv || argv[i] == "--jobs"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing jobs" << std::endl;
        return 1;
      }
      try {
        opts.max_thread = picsort::parse_max_thread(argv[i]);
      } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 1;
      }
    } else if (argv[i] == "-n"sv || argv[i] == "--dry-run"sv) {
      opts.dry_run = true;
    } else if (argv[i] == "-p"sv || argv[i] == "--print"sv) {
      print_out = true;
    } else if (argv[i] == "--debug"sv) {
      picsort::set_log_level(picsort::log_level_t::debug);
    } else if (argv[i] == "-h"sv || argv[i] == "--help"sv) {
      std::cerr << usage;
      return 0;
    } else {
      std::cerr << "unknown option: " << argv[i] << std::endl;
      return 1;
    }
  }

  if (opts.input_dirs.empty() || !has_output) {
    std::cerr << usage;
    return 1;
  }

  try {
    auto placements = picsort::organize(opts);
    if (print_out) {
      for (const auto& [src, dst] : placements) {
        std::cout << src.path().string() << " -> " << dst.string() << '\n';
      }
    }
  } catch (const std::exception& e) {
    picsort::log(picsort::log_level_t::err) << e.what() << '\n';
    return 1;
  }
}
