// include/luhn/checksum.hpp
#pragma once
#include <cstddef>
#include <string>

namespace luhn {

// Luhn total of n payload digits, as if a check digit followed them
// (so the rightmost payload digit is the first one doubled).
// Caller guarantees digits[0..n) are ASCII '0'..'9'.
unsigned luhn_sum(const char* digits, std::size_t n) noexcept;

// The unique check digit in [0,9] that makes payload + digit pass.
// Throws InvalidInput on an empty payload or a non-digit character.
int check_digit(const std::string& payload);

// True iff number is >= 2 ASCII digits and its checksum is 0 mod 10.
bool passes_luhn(const std::string& number) noexcept;

// True iff every byte of s is an ASCII decimal digit (vacuously true if empty).
bool all_digits(const std::string& s) noexcept;

} // namespace luhn
