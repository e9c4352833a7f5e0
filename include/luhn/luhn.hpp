// include/luhn/luhn.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace luhn {

// Library version; reported by luhn_cli --verbose and luhncore.__version__.
inline constexpr const char* LUHN_VERSION = "0.1.0";

// Default total length for generated numbers.
inline constexpr std::size_t kDefaultLength = 16;

// Longest number generate() will build (ISO/IEC 7812 maximum PAN length).
inline constexpr std::size_t kMaxLength = 19;

// Issuer identification number width (MII digit included).
inline constexpr std::size_t kIssuerDigits = 6;

// The only error the engine reports: the caller handed it something that is
// not a well-formed request. Thrown before any algorithmic work is done.
class InvalidInput : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Positional view of a card number plus its checksum verdict.
// card_issuer + personal_digits + check_digit == card_number.
struct CardResult {
  bool valid = false;
  std::string card_number;
  int major_industry = 0;       // first digit
  std::string card_issuer;      // first min(6, n-1) digits
  std::string personal_digits;  // between issuer and check digit, may be empty
  int check_digit = 0;          // last digit
};

// Supplies one digit in [0,9] per call.
using DigitSource = std::function<std::uint8_t()>;

struct GenerateConfig {
  int major_industry;                  // must be a single digit 0..9
  std::size_t length = kDefaultLength; // total digits, check digit included
};

// Checks `number` against the Luhn rule and decomposes it by position.
// The decomposition is filled in even when the checksum fails.
// Throws InvalidInput if number is shorter than 2 or holds a non-digit.
CardResult validate(const std::string& number);

// Builds a random Luhn-valid number starting with cfg.major_industry.
// An empty `src` draws from system_digit_source().
// Throws InvalidInput if major_industry is outside 0..9 or length is
// outside 2..kMaxLength.
CardResult generate(const GenerateConfig& cfg, DigitSource src = {});

// Same as generate(), but keeps a 1..6 digit issuer prefix verbatim.
// Throws InvalidInput unless prefix is 1..6 digits and
// prefix size < length <= kMaxLength.
CardResult generate_from_prefix(const std::string& prefix,
                                std::size_t length = kDefaultLength,
                                DigitSource src = {});

// Reads a major industry identifier typed by a user: exactly one ASCII
// digit. "05", "5 " or "11" throw InvalidInput rather than being coerced.
int parse_major_industry(const std::string& text);

// Uniform digits from a thread_local engine seeded by std::random_device.
// Safe to call from any number of threads without locking.
DigitSource system_digit_source();

} // namespace luhn
