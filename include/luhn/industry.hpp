// include/luhn/industry.hpp
#pragma once

namespace luhn {

// ISO/IEC 7812 category for a major industry identifier digit.
// Returns "Unknown" for anything outside 0..9.
const char* major_industry_name(int mii) noexcept;

} // namespace luhn
