#pragma once
#include "chaskey.hpp"
#include <cstring>

// Counter mode on top of Chaskey-LTS permutation
namespace ctr {

// Byte length of counter block, which is interpreted as 128 -bit big endian
// unsigned integer
constexpr size_t COUNTER_LEN = chaskey::BLOCK_LEN;

// # -of counter blocks consumed while processing `len` -bytes of input i.e.
// ceil(len / 16)
inline static constexpr size_t
block_count(const size_t len)
{
  return (len >> 4) + 1ul * ((len & 15ul) > 0ul);
}

// Increments 128 -bit big endian counter by 1, wrapping around modulo 2^128
inline static void
increment(uint8_t* const counter // 128 -bit counter | assert len(counter) == 16
)
{
  for (size_t i = COUNTER_LEN; i > 0; i--) {
    counter[i - 1] += 1;
    if (counter[i - 1] != 0) {
      break;
    }
  }
}

// Adds `blocks` to 128 -bit big endian counter, wrapping around modulo 2^128
//
// Useful when key stream space needs to be partitioned into disjoint counter
// ranges, each of which can then be processed independently.
inline static void
advance(uint8_t* const counter, // 128 -bit counter | assert len(counter) == 16
        const uint64_t blocks   // # -of blocks to skip
)
{
  uint64_t carry = blocks;

  for (size_t i = COUNTER_LEN; (i > 0) && (carry > 0); i--) {
    const uint64_t sum = static_cast<uint64_t>(counter[i - 1]) + (carry & 0xfful);

    counter[i - 1] = static_cast<uint8_t>(sum);
    carry = (carry >> 8) + (sum >> 8);
  }
}

// Given 16 -bytes secret key, 16 -bytes counter & N -bytes input, this routine
// XORs input with Chaskey-LTS key stream, writing N -bytes output
//
// Key stream is produced by applying forward permutation on current counter
// value, 16 -bytes at a time. Counter is advanced after each block, even when
// the last block is only partially consumed, so after processing N -bytes
// counter is incremented by ceil(N / 16).
//
// Encryption and decryption are the same operation. Counter is updated in
// place, so that subsequent calls continue the key stream instead of reusing
// it.
//
// Throws `invalid_length` ( before touching counter or output ) when key is not
// 16 -bytes.
static void
apply(const uint8_t* const __restrict key, // 128 -bit secret key
      const size_t klen,                   // len(key) | must be = 16
      uint8_t* const __restrict counter,   // 128 -bit big endian counter
      const uint8_t* const __restrict in,  // N -bytes input
      uint8_t* const __restrict out,       // N -bytes output
      const size_t len                     // len(in) = len(out) = N | >= 0
)
{
  if (klen != chaskey::KEY_LEN) {
    throw chaskey::invalid_length("key", chaskey::KEY_LEN, klen);
  }

  const size_t blk_cnt = len >> 4;
  const size_t rm_bytes = len & 15ul;

  uint8_t ks[chaskey::BLOCK_LEN]{};

  for (size_t i = 0; i < blk_cnt; i++) {
    const size_t off = i << 4;

    chaskey::permute(
      chaskey::direction_t::forward, key, klen, counter, COUNTER_LEN, ks);

    for (size_t j = 0; j < chaskey::BLOCK_LEN; j++) {
      out[off + j] = in[off + j] ^ ks[j];
    }

    increment(counter);
  }

  if (rm_bytes > 0) {
    const size_t off = blk_cnt << 4;

    chaskey::permute(
      chaskey::direction_t::forward, key, klen, counter, COUNTER_LEN, ks);

    for (size_t j = 0; j < rm_bytes; j++) {
      out[off + j] = in[off + j] ^ ks[j];
    }

    increment(counter);
  }

  std::memset(ks, 0, sizeof(ks));
}

}
