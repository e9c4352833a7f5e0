#include "luhn/luhn.hpp"
#include <catch2/catch.hpp>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {
// Cycles through a fixed digit list.
luhn::DigitSource fixed_digits(std::vector<std::uint8_t> seq) {
  std::size_t i = 0;
  return [seq, i]() mutable { return seq[i++ % seq.size()]; };
}
} // namespace

TEST_CASE("Generated numbers carry the MII and pass validation") {
  for (int round = 0; round < 50; ++round) {
    auto res = luhn::generate(luhn::GenerateConfig{5, 16});
    REQUIRE(res.valid);
    REQUIRE(res.card_number.size() == 16);
    REQUIRE(res.card_number[0] == '5');
    REQUIRE(res.major_industry == 5);
    REQUIRE(luhn::validate(res.card_number).valid);
  }
}

TEST_CASE("Every MII and a spread of lengths") {
  for (int mii = 0; mii <= 9; ++mii) {
    for (std::size_t len : {2u, 3u, 7u, 8u, 13u, 16u, 19u}) {
      auto res = luhn::generate(luhn::GenerateConfig{mii, len});
      REQUIRE(res.card_number.size() == len);
      REQUIRE(res.major_industry == mii);
      REQUIRE(res.valid);
      REQUIRE(res.card_issuer + res.personal_digits +
                  std::to_string(res.check_digit) == res.card_number);
    }
  }
}

TEST_CASE("Default length is 16") {
  auto res = luhn::generate(luhn::GenerateConfig{4});
  REQUIRE(res.card_number.size() == luhn::kDefaultLength);
  REQUIRE(res.card_number.size() == 16);
}

TEST_CASE("Reject out-of-range MII and short lengths") {
  for (int mii : {-1, 10, 11, 99}) {
    REQUIRE_THROWS_AS(luhn::generate(luhn::GenerateConfig{mii, 16}), luhn::InvalidInput);
  }
  for (std::size_t len : {0u, 1u}) {
    REQUIRE_THROWS_AS(luhn::generate(luhn::GenerateConfig{5, len}), luhn::InvalidInput);
  }
}

TEST_CASE("Lengths above the maximum are rejected before any work") {
  const std::size_t huge = std::numeric_limits<std::size_t>::max();
  unsigned calls = 0;
  luhn::DigitSource counting = [&calls]() -> std::uint8_t { ++calls; return 0; };

  REQUIRE_THROWS_AS(luhn::generate(luhn::GenerateConfig{5, huge}, counting), luhn::InvalidInput);
  REQUIRE_THROWS_AS(luhn::generate(luhn::GenerateConfig{5, luhn::kMaxLength + 1}, counting),
                    luhn::InvalidInput);
  REQUIRE_THROWS_AS(luhn::generate_from_prefix("4", huge, counting), luhn::InvalidInput);
  REQUIRE(calls == 0);

  auto longest = luhn::generate(luhn::GenerateConfig{5, luhn::kMaxLength});
  REQUIRE(longest.card_number.size() == 19);
  REQUIRE(longest.valid);
}

TEST_CASE("Major industry text must be exactly one digit") {
  REQUIRE(luhn::parse_major_industry("0") == 0);
  REQUIRE(luhn::parse_major_industry("5") == 5);
  REQUIRE(luhn::parse_major_industry("9") == 9);
  for (auto s : {"", "05", "11", "5 ", " 5", "-5", "+5", "x"}) {
    REQUIRE_THROWS_AS(luhn::parse_major_industry(s), luhn::InvalidInput);
  }
}

TEST_CASE("Fixed digit source gives a deterministic number") {
  // 4 + 53914880343646 -> check digit 7
  auto src = fixed_digits({5, 3, 9, 1, 4, 8, 8, 0, 3, 4, 3, 6, 4, 6});
  auto res = luhn::generate(luhn::GenerateConfig{4, 16}, src);
  REQUIRE(res.card_number == "4539148803436467");
  REQUIRE(res.card_issuer == "453914");
  REQUIRE(res.personal_digits == "880343646");
  REQUIRE(res.check_digit == 7);

  auto zeros = luhn::generate(luhn::GenerateConfig{0, 16}, fixed_digits({0}));
  REQUIRE(zeros.card_number == "0000000000000000");
}

TEST_CASE("Minimal length uses no random digits") {
  unsigned calls = 0;
  luhn::DigitSource counting = [&calls]() -> std::uint8_t { ++calls; return 0; };
  auto res = luhn::generate(luhn::GenerateConfig{1, 2}, counting);
  REQUIRE(calls == 0);
  REQUIRE(res.card_number == "18");
}

TEST_CASE("Digit source outside 0..9 is a logic error") {
  REQUIRE_THROWS_AS(luhn::generate(luhn::GenerateConfig{4, 16}, fixed_digits({12})),
                    std::logic_error);
}

TEST_CASE("Prefix generation keeps the prefix verbatim") {
  auto res = luhn::generate_from_prefix("378282", 15);
  REQUIRE(res.card_number.size() == 15);
  REQUIRE(res.card_number.rfind("378282", 0) == 0);
  REQUIRE(res.card_issuer == "378282");
  REQUIRE(res.valid);

  auto exact = luhn::generate_from_prefix("7992739871", 11, fixed_digits({0}));
  REQUIRE(exact.card_number == "79927398713");
}

TEST_CASE("Prefix generation rejects bad prefixes and lengths") {
  REQUIRE_THROWS_AS(luhn::generate_from_prefix("", 16), luhn::InvalidInput);
  REQUIRE_THROWS_AS(luhn::generate_from_prefix("1234567", 16), luhn::InvalidInput);
  REQUIRE_THROWS_AS(luhn::generate_from_prefix("4a", 16), luhn::InvalidInput);
  REQUIRE_THROWS_AS(luhn::generate_from_prefix("453914", 6), luhn::InvalidInput);
  REQUIRE_THROWS_AS(luhn::generate_from_prefix("4", 1), luhn::InvalidInput);
}

TEST_CASE("Independent calls may differ but stay valid") {
  bool differs = false;
  auto first = luhn::generate(luhn::GenerateConfig{5, 16});
  for (int round = 0; round < 20 && !differs; ++round) {
    auto next = luhn::generate(luhn::GenerateConfig{5, 16});
    REQUIRE(next.valid);
    REQUIRE(next.card_number[0] == '5');
    differs = next.card_number != first.card_number;
  }
  REQUIRE(differs);
}
