// include/luhn/json.hpp
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "luhn.hpp"  // for luhn::CardResult

namespace luhn {

// Response object with the keys adapters expose: valid, card number,
// major industry, industry, card issuer, personal digits, check digit.
// Digit runs stay strings so leading zeros survive.
nlohmann::json result_to_json(const CardResult& r);

// result_to_json(r) rendered on one line.
std::string to_json(const CardResult& r);

// {"error": message} rendered on one line.
std::string error_json(const std::string& message);

} // namespace luhn
