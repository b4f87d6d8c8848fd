#pragma once
#include "errors.hpp"
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <type_traits>

// Chaskey-LTS keyed permutation
namespace chaskey {

// Byte length of permutation block
constexpr size_t BLOCK_LEN = 16;

// Byte length of secret key
constexpr size_t KEY_LEN = 16;

// # -of rounds applied by Chaskey-LTS ( original Chaskey uses 8 )
constexpr size_t ROUNDS = 16;

// Forward direction is what's used for generating key stream in counter mode,
// while inverse direction undoes it
enum class direction_t
{
  forward,
  inverse
};

// Compile-time check to ensure that rotation is only ever applied on unsigned
// integers of bit width ∈ {8, 16, 32, 64}
template<typename T>
inline static constexpr bool
check_rot_bit_width()
{
  constexpr int blen = std::numeric_limits<T>::digits;
  return std::is_unsigned_v<T> &&
         ((blen == 8) || (blen == 16) || (blen == 32) || (blen == 64));
}

// Rotates w -bit unsigned integer `n` leftwards by (r mod w) bit places, where
// w is bit width of T. Result is masked so that it never leaves w bits, even
// when T gets promoted to wider integer during shifting.
template<typename T>
inline static constexpr T
rotl(const T n, const size_t r) requires(check_rot_bit_width<T>())
{
  constexpr size_t w = static_cast<size_t>(std::numeric_limits<T>::digits);
  constexpr T mask = std::numeric_limits<T>::max();

  const size_t r_ = r % w;
  if (r_ == 0ul) {
    return n;
  }

  return static_cast<T>(((n << r_) & mask) | ((n & mask) >> (w - r_)));
}

// Rotates w -bit unsigned integer `n` rightwards by (r mod w) bit places, such
// that rotl(n, r) == rotr(n, w - r)
template<typename T>
inline static constexpr T
rotr(const T n, const size_t r) requires(check_rot_bit_width<T>())
{
  constexpr size_t w = static_cast<size_t>(std::numeric_limits<T>::digits);
  constexpr T mask = std::numeric_limits<T>::max();

  const size_t r_ = r % w;
  if (r_ == 0ul) {
    return n;
  }

  return static_cast<T>(((n & mask) >> r_) | ((n << (w - r_)) & mask));
}

// Compile-time check to ensure that only uint32_t or uint64_t can be converted
// to and/ or from byte array of length 4 and 8, respectively.
template<typename T>
inline static constexpr bool
check_type_bit_width()
{
  constexpr int blen = std::numeric_limits<T>::digits;
  return (blen == 32) || (blen == 64);
}

// Given a byte array of length 4/ 8, this routine interprets those bytes in
// little endian byte order, computing a 32/ 64 -bit unsigned integer
template<typename T>
inline static T
from_le_bytes(const uint8_t* const bytes) requires(check_type_bit_width<T>())
{
  constexpr size_t bcnt = sizeof(T);

  T v = 0;
  for (size_t i = 0; i < bcnt; i++) {
    v |= static_cast<T>(bytes[i]) << (i << 3);
  }

  return v;
}

// Given a 32/ 64 -bit unsigned integer & a byte array of length 4/ 8, this
// routine interprets u32/ u64 in little endian byte order and places each of 4/
// 8 bytes in designated byte indices.
template<typename T>
inline static void
to_le_bytes(const T v, uint8_t* const bytes) requires(check_type_bit_width<T>())
{
  constexpr size_t bcnt = sizeof(T);

  for (size_t i = 0; i < bcnt; i++) {
    const size_t boff = i << 3;
    bytes[i] = static_cast<uint8_t>(v >> boff);
  }
}

// Interprets 16 -bytes as four little endian 32 -bit words, irrespective of
// host byte order
inline static void
load_words(const uint8_t* const bytes, uint32_t* const words)
{
  if constexpr (std::endian::native == std::endian::little) {
    std::memcpy(words, bytes, BLOCK_LEN);
  } else {
    words[0] = from_le_bytes<uint32_t>(bytes + 0ul);
    words[1] = from_le_bytes<uint32_t>(bytes + 4ul);
    words[2] = from_le_bytes<uint32_t>(bytes + 8ul);
    words[3] = from_le_bytes<uint32_t>(bytes + 12ul);
  }
}

// Writes four 32 -bit words as 16 little endian bytes, irrespective of host
// byte order
inline static void
store_words(const uint32_t* const words, uint8_t* const bytes)
{
  if constexpr (std::endian::native == std::endian::little) {
    std::memcpy(bytes, words, BLOCK_LEN);
  } else {
    to_le_bytes<uint32_t>(words[0], bytes + 0ul);
    to_le_bytes<uint32_t>(words[1], bytes + 4ul);
    to_le_bytes<uint32_t>(words[2], bytes + 8ul);
    to_le_bytes<uint32_t>(words[3], bytes + 12ul);
  }
}

// Single round of Chaskey-LTS, mixing four 32 -bit state words with additions
// ( modulo 2^32 ), rotations and XORs
inline static void
round(uint32_t* const v)
{
  v[0] += v[1];
  v[1] = rotl<uint32_t>(v[1], 5);
  v[1] ^= v[0];
  v[0] = rotl<uint32_t>(v[0], 16);

  v[2] += v[3];
  v[3] = rotl<uint32_t>(v[3], 8);
  v[3] ^= v[2];

  v[0] += v[3];
  v[3] = rotl<uint32_t>(v[3], 13);
  v[3] ^= v[0];

  v[2] += v[1];
  v[1] = rotl<uint32_t>(v[1], 7);
  v[1] ^= v[2];
  v[2] = rotl<uint32_t>(v[2], 16);
}

// Inverse of `round`, undoing each of its steps in reverse order
inline static void
inv_round(uint32_t* const v)
{
  v[2] = rotr<uint32_t>(v[2], 16);
  v[1] ^= v[2];
  v[1] = rotr<uint32_t>(v[1], 7);
  v[2] -= v[1];

  v[3] ^= v[0];
  v[3] = rotr<uint32_t>(v[3], 13);
  v[0] -= v[3];

  v[3] ^= v[2];
  v[3] = rotr<uint32_t>(v[3], 8);
  v[2] -= v[3];

  v[0] = rotr<uint32_t>(v[0], 16);
  v[1] ^= v[0];
  v[1] = rotr<uint32_t>(v[1], 5);
  v[0] -= v[1];
}

// Given 16 -bytes secret key and 16 -bytes input block, this routine applies
// Chaskey-LTS permutation ( in requested direction ) on input block, writing
// 16 -bytes output block to `out`
//
// Input block is first XOR-ed with key ( pre-whitening ), then 16 rounds are
// applied, followed by XOR-ing with key again ( post-whitening ). Both block
// and key are always interpreted as little endian 32 -bit words.
//
// For fixed key, permute(inverse, permute(forward, b)) == b, for any block b.
//
// Throws `invalid_length` when either key or block is not exactly 16 -bytes.
// `out` must not alias `blk`.
static void
permute(const direction_t dir,
        const uint8_t* const __restrict key, // 128 -bit secret key
        const size_t klen,                   // len(key) | must be = 16
        const uint8_t* const __restrict blk, // 128 -bit input block
        const size_t blen,                   // len(blk) | must be = 16
        uint8_t* const __restrict out        // 128 -bit output block
)
{
  if (klen != KEY_LEN) {
    throw invalid_length("key", KEY_LEN, klen);
  }
  if (blen != BLOCK_LEN) {
    throw invalid_length("block", BLOCK_LEN, blen);
  }

  uint32_t v[4]{};
  uint32_t k[4]{};

  load_words(blk, v);
  load_words(key, k);

  for (size_t i = 0; i < 4; i++) {
    v[i] ^= k[i];
  }

  if (dir == direction_t::forward) {
    for (size_t r = 0; r < ROUNDS; r++) {
      round(v);
    }
  } else {
    for (size_t r = 0; r < ROUNDS; r++) {
      inv_round(v);
    }
  }

  for (size_t i = 0; i < 4; i++) {
    v[i] ^= k[i];
  }

  store_words(v, out);
}

}
