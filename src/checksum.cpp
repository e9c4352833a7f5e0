// src/checksum.cpp
#include "luhn/checksum.hpp"
#include "luhn/luhn.hpp"
#include <cstddef>
#include <string>

namespace luhn {
static inline unsigned digit_at(const char* p, std::size_t i) {
  return static_cast<unsigned>(p[i] - '0');
}

// Doubled digit with its two decimal digits summed (0..9).
static inline unsigned doubled(unsigned d) {
  d *= 2;
  return d > 9 ? d - 9 : d;
}

bool all_digits(const std::string& s) noexcept {
  for (char c : s) {
    if (c < '0' || c > '9')
      return false;
  }
  return true;
}

unsigned luhn_sum(const char* digits, std::size_t n) noexcept {
  unsigned sum = 0;
  bool dbl = true; // rightmost payload digit sits left of the check digit
  for (std::size_t i = n; i-- > 0;) {
    unsigned d = digit_at(digits, i);
    sum += dbl ? doubled(d) : d;
    dbl = !dbl;
  }
  return sum;
}

int check_digit(const std::string& payload) {
  if (payload.empty())
    throw InvalidInput("payload must not be empty");
  if (!all_digits(payload))
    throw InvalidInput("payload must contain only decimal digits");
  unsigned partial = luhn_sum(payload.data(), payload.size());
  return static_cast<int>((10 - partial % 10) % 10);
}

bool passes_luhn(const std::string& number) noexcept {
  if (number.size() < 2 || !all_digits(number))
    return false;
  const std::size_t n = number.size() - 1;
  unsigned total = luhn_sum(number.data(), n) + digit_at(number.data(), n);
  return total % 10 == 0;
}

} // namespace luhn
