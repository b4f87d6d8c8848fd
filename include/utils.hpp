#pragma once
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// Generates N -many random bytes, filling preallocated memory `data`
//
// Note, this is meant for examples, benchmarks and tests only. It is not a
// source of secret key material.
inline static void
random_data(uint8_t* const data, const size_t len)
{
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<uint16_t> dis(0, 255);

  for (size_t i = 0; i < len; i++) {
    data[i] = static_cast<uint8_t>(dis(gen));
  }
}

// Given a byte array of length N, this routine converts it to a lower case
// hexadecimal string of length 2N
inline static const std::string
to_hex(const uint8_t* const bytes, const size_t len)
{
  std::stringstream ss;
  ss << std::hex;

  for (size_t i = 0; i < len; i++) {
    ss << std::setw(2) << std::setfill('0') << static_cast<uint32_t>(bytes[i]);
  }

  return ss.str();
}

// Given a hexadecimal string of length 2N, this routine parses it into a byte
// vector of length N
inline static std::vector<uint8_t>
from_hex(const std::string_view hex)
{
  const size_t hlen = hex.length();
  assert((hlen & 1ul) == 0ul);

  const size_t blen = hlen >> 1;
  std::vector<uint8_t> res;
  res.reserve(blen);

  for (size_t i = 0; i < blen; i++) {
    const size_t off = i << 1;

    uint16_t byte = 0;
    std::stringstream ss;
    ss << std::hex << hex.substr(off, 2);
    ss >> byte;

    res.push_back(static_cast<uint8_t>(byte));
  }

  return res;
}
