// src/industry.cpp
#include "luhn/industry.hpp"

namespace luhn {

const char* major_industry_name(int mii) noexcept {
  static constexpr const char* names[] = {
      "ISO/TC 68 and other industry assignments",
      "Airline industry",
      "Airline industry",
      "Travel/Entertainment",
      "Banking/Financial",
      "Banking/Financial",
      "Merchandising & Banking/Financial",
      "Petroleum industries",
      "Health, telecomm and future",
      "For assignment by standards bodies"};
  if (mii < 0 || mii > 9)
    return "Unknown";
  return names[mii];
}

} // namespace luhn
