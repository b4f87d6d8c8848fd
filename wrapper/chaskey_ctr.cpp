#include "ctr.hpp"

// Thin C wrapper on top of underlying C++ implementation of Chaskey-LTS
// permutation & counter mode, which can be used for producing shared library
// object with conformant C-ABI & used from other languages such as Rust, Python
//
// No C++ exception crosses this boundary, instead each routine returns a status
// code.

// Status codes; invalid length is returned when key, block or counter is not
// 16 -bytes
#define CHASKEY_OK 0
#define CHASKEY_INVALID_LENGTH -1

// Function prototype
extern "C"
{
  int chaskey_permute(const int,                       // forward ( != 0 ) ?
                      const uint8_t* const __restrict, // 128 -bit secret key
                      const size_t,                    // byte length of key
                      const uint8_t* const __restrict, // 128 -bit input block
                      const size_t,                    // byte length of block
                      uint8_t* const __restrict        // 128 -bit output block
  );

  int chaskey_ctr_apply(
    const uint8_t* const __restrict, // 128 -bit secret key
    const size_t,                    // byte length of key
    uint8_t* const __restrict,       // 128 -bit big endian counter
    const size_t,                    // byte length of counter
    const uint8_t* const __restrict, // N -bytes input
    uint8_t* const __restrict,       // N -bytes output
    const size_t                     // byte length of input/ output = N | >= 0
  );
}

// Function implementation
extern "C"
{
  int chaskey_permute(const int forward,
                      const uint8_t* const __restrict key,
                      const size_t klen,
                      const uint8_t* const __restrict blk,
                      const size_t blen,
                      uint8_t* const __restrict out)
  {
    const auto dir = forward ? chaskey::direction_t::forward
                             : chaskey::direction_t::inverse;

    try {
      chaskey::permute(dir, key, klen, blk, blen, out);
    } catch (const chaskey::invalid_length&) {
      return CHASKEY_INVALID_LENGTH;
    }

    return CHASKEY_OK;
  }

  // Counter is updated in place, so that next call continues the key stream
  int chaskey_ctr_apply(const uint8_t* const __restrict key,
                        const size_t klen,
                        uint8_t* const __restrict counter,
                        const size_t clen,
                        const uint8_t* const __restrict in,
                        uint8_t* const __restrict out,
                        const size_t len)
  {
    if (clen != ctr::COUNTER_LEN) {
      return CHASKEY_INVALID_LENGTH;
    }

    try {
      ctr::apply(key, klen, counter, in, out, len);
    } catch (const chaskey::invalid_length&) {
      return CHASKEY_INVALID_LENGTH;
    }

    return CHASKEY_OK;
  }
}
