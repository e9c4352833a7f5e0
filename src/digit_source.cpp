// src/digit_source.cpp
#include "luhn/luhn.hpp"
#include <cstdint>
#include <random>

namespace luhn {
namespace {

std::mt19937_64 seeded_engine() {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd()};
  return std::mt19937_64(seq);
}

// One engine per thread: no shared state between concurrent generators.
std::mt19937_64& thread_engine() {
  thread_local std::mt19937_64 eng = seeded_engine();
  return eng;
}

} // namespace

DigitSource system_digit_source() {
  return [] {
    std::uniform_int_distribution<int> dist(0, 9);
    return static_cast<std::uint8_t>(dist(thread_engine()));
  };
}

} // namespace luhn
