// src/decompose.cpp
#include "luhn/luhn.hpp"
#include <algorithm>
#include <cstddef>

namespace luhn {
// Splits r.card_number (>= 2 digits, already checked) by position.
// The issuer segment stops short of the check digit, so a 2..7 digit number
// has a truncated issuer and no personal digits.
void decompose_into(CardResult& r) {
  const std::string& s = r.card_number;
  const std::size_t n = s.size();
  const std::size_t iin = std::min(kIssuerDigits, n - 1);
  r.major_industry = s[0] - '0';
  r.card_issuer = s.substr(0, iin);
  r.personal_digits = s.substr(iin, n - 1 - iin);
  r.check_digit = s[n - 1] - '0';
}
} // namespace luhn
