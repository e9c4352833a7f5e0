#include "luhn/luhn.hpp"
#include "luhn/checksum.hpp"
#include "luhn/json.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void usage() {
  std::cerr << "usage: luhn_cli validate <digits>...\n"
               "       luhn_cli generate <mii>... [--length=N] [--count=N] [--prefix]\n"
               "flags: --verbose  debug logging to stderr\n";
}

luhn::CardResult run_generate(const std::string& arg, std::size_t length,
                              bool as_prefix) {
  if (as_prefix)
    return luhn::generate_from_prefix(arg, length);
  return luhn::generate(luhn::GenerateConfig{luhn::parse_major_industry(arg), length});
}

// Unsigned flag value; stoull alone would wrap "-1" to ULLONG_MAX.
unsigned long long parse_unsigned(const std::string& v) {
  if (v.empty() || !luhn::all_digits(v))
    throw std::invalid_argument("expected a non-negative integer");
  return std::stoull(v);
}

} // namespace

int main(int argc, char** argv) {
  auto log = spdlog::stderr_color_mt("luhn");
  log->set_level(spdlog::level::warn);

  // Flags: --length=N, --count=N (generate only), --prefix, --verbose
  std::size_t length = luhn::kDefaultLength;
  unsigned count = 1;
  bool as_prefix = false;
  std::string mode;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    try {
      if (a.rfind("--length=", 0) == 0) {
        // generate() rejects anything above luhn::kMaxLength per request.
        length = static_cast<std::size_t>(parse_unsigned(a.substr(9)));
      } else if (a.rfind("--count=", 0) == 0) {
        unsigned long long v = parse_unsigned(a.substr(8));
        if (v > std::numeric_limits<unsigned>::max()) {
          log->warn("skip '{}': out of 32-bit range", a);
          continue;
        }
        count = static_cast<unsigned>(v);
      } else if (a == "--prefix") {
        as_prefix = true;
      } else if (a == "--verbose") {
        log->set_level(spdlog::level::debug);
      } else if (a.rfind("--", 0) == 0) {
        log->warn("skip unknown flag '{}'", a);
      } else if (mode.empty()) {
        mode = a;
      } else {
        args.push_back(a);
      }
    } catch (const std::exception& e) {
      log->error("bad value in '{}': {}", a, e.what());
      return 1;
    }
  }

  if ((mode != "validate" && mode != "generate") || args.empty()) {
    usage();
    return 1;
  }
  log->debug("luhn {} mode={} requests={}", luhn::LUHN_VERSION, mode, args.size());

  int status = 0;
  for (const auto& arg : args) {
    const unsigned reps = mode == "generate" ? count : 1;
    for (unsigned r = 0; r < reps; ++r) {
      auto t0 = std::chrono::steady_clock::now();
      try {
        luhn::CardResult res = mode == "validate"
                                   ? luhn::validate(arg)
                                   : run_generate(arg, length, as_prefix);
        auto t1 = std::chrono::steady_clock::now();
        std::cout << luhn::to_json(res) << "\n";
        log->debug("{} '{}' -> {} in {}ns", mode, arg, res.card_number,
                   std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
      } catch (const luhn::InvalidInput& e) {
        log->error("{} '{}' rejected: {}", mode, arg, e.what());
        std::cout << luhn::error_json(e.what()) << "\n";
        status = 2;
        break;
      }
    }
  }
  return status;
}
