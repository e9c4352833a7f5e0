// src/luhn_core.cpp
#include "luhn/checksum.hpp"
#include "luhn/luhn.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace luhn {
// Forward decl for the internal splitter (no public header exposure)
void decompose_into(CardResult& r);
} // namespace luhn

namespace luhn {

CardResult validate(const std::string& number) {
  if (number.empty())
    throw InvalidInput("card number must not be empty");
  if (number.size() < 2)
    throw InvalidInput("card number needs at least one payload digit and a check digit");
  if (!all_digits(number))
    throw InvalidInput("card number must contain only decimal digits");

  CardResult out;
  out.card_number = number;
  out.valid = passes_luhn(number);
  decompose_into(out);
  return out;
}

CardResult generate_from_prefix(const std::string& prefix, std::size_t length,
                                DigitSource src) {
  if (prefix.empty() || prefix.size() > kIssuerDigits)
    throw InvalidInput("prefix must be 1 to 6 digits");
  if (!all_digits(prefix))
    throw InvalidInput("prefix must contain only decimal digits");
  if (length <= prefix.size())
    throw InvalidInput("length must leave room for the check digit");
  if (length > kMaxLength)
    throw InvalidInput("length must be at most " + std::to_string(kMaxLength));

  if (!src)
    src = system_digit_source();

  std::string digits;
  digits.reserve(length);
  digits = prefix;
  while (digits.size() < length - 1) {
    const std::uint8_t d = src();
    if (d > 9)
      throw std::logic_error("digit source returned a value outside 0..9");
    digits += static_cast<char>('0' + d);
  }
  digits += static_cast<char>('0' + check_digit(digits));

  CardResult out;
  out.card_number = std::move(digits);
  out.valid = passes_luhn(out.card_number);
#if defined(LUHN_ENABLE_DEBUG_INVARIANTS) || !defined(NDEBUG)
  if (!out.valid)
    throw std::logic_error("generated number failed its own checksum");
#endif
  decompose_into(out);
  return out;
}

CardResult generate(const GenerateConfig& cfg, DigitSource src) {
  if (cfg.major_industry < 0 || cfg.major_industry > 9)
    throw InvalidInput("major industry identifier must be a single digit 0..9");
  if (cfg.length < 2)
    throw InvalidInput("length must be >= 2");
  const std::string mii(1, static_cast<char>('0' + cfg.major_industry));
  return generate_from_prefix(mii, cfg.length, std::move(src));
}

int parse_major_industry(const std::string& text) {
  if (text.size() != 1 || !all_digits(text))
    throw InvalidInput("major industry identifier must be a single digit 0..9, got '" +
                       text + "'");
  return text[0] - '0';
}

} // namespace luhn
