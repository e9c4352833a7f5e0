// src/json.cpp
#include "luhn/json.hpp"
#include "luhn/industry.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace luhn {

nlohmann::json result_to_json(const CardResult& r) {
  nlohmann::json j;
  j["valid"] = r.valid;
  j["card number"] = r.card_number;
  j["major industry"] = r.major_industry;
  j["industry"] = major_industry_name(r.major_industry);
  j["card issuer"] = r.card_issuer;
  j["personal digits"] = r.personal_digits;
  j["check digit"] = r.check_digit;
  return j;
}

std::string to_json(const CardResult& r) {
  return result_to_json(r).dump();
}

std::string error_json(const std::string& message) {
  nlohmann::json j;
  j["error"] = message;
  return j.dump();
}

} // namespace luhn
