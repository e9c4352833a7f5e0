#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstddef>
#include <string>

#include "luhn/industry.hpp"
#include "luhn/luhn.hpp"

namespace py = pybind11;

// Same keys as luhn::to_json, as a JSON-friendly dict.
static py::dict result_to_dict(const luhn::CardResult& r) {
  py::dict out;
  out["valid"] = r.valid;
  out["card number"] = r.card_number;
  out["major industry"] = r.major_industry;
  out["industry"] = luhn::major_industry_name(r.major_industry);
  out["card issuer"] = r.card_issuer;
  out["personal digits"] = r.personal_digits;
  out["check digit"] = r.check_digit;
  return out;
}

static py::dict validate_py(const std::string& number) {
  return result_to_dict(luhn::validate(number));
}

static py::dict generate_py(int major_industry, std::size_t length) {
  return result_to_dict(luhn::generate(luhn::GenerateConfig{major_industry, length}));
}

static py::dict generate_from_prefix_py(const std::string& prefix, std::size_t length) {
  return result_to_dict(luhn::generate_from_prefix(prefix, length));
}

PYBIND11_MODULE(luhncore, m) {
  m.doc() = "Luhn card-number core (pybind11)";
  m.attr("__version__") = luhn::LUHN_VERSION;

  // luhn::InvalidInput derives from std::invalid_argument, which pybind11
  // already translates to ValueError.

  m.def("validate", &validate_py, py::arg("number"),
        R"pbdoc(
Check a card number against the Luhn rule and split it by position.

Args:
  number (str): decimal digits only, at least 2 of them.

Returns:
  dict { valid, card number, major industry, industry, card issuer,
         personal digits, check digit }.

Raises:
  ValueError: on empty input or any non-digit character.
)pbdoc");

  m.def("generate", &generate_py,
        py::arg("major_industry"),
        py::arg("length") = luhn::kDefaultLength,
        R"pbdoc(Generate a random Luhn-valid number starting with the given MII digit (0-9).)pbdoc");

  m.def("generate_from_prefix", &generate_from_prefix_py,
        py::arg("prefix"),
        py::arg("length") = luhn::kDefaultLength,
        R"pbdoc(Generate a random Luhn-valid number that starts with a 1-6 digit prefix.)pbdoc");
}
