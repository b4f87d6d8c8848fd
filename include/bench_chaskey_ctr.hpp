#pragma once
#include "chaskey_ctr.hpp"
#include "utils.hpp"
#include <benchmark/benchmark.h>
#include <cassert>
#include <cstdlib>

// Benchmark Chaskey-LTS permutation & counter mode
namespace bench_chaskey_ctr {

// Benchmarks single invocation of Chaskey-LTS permutation, on CPU system, in
// direction selected by benchmark argument ( 0 => forward, 1 => inverse )
static void
permute(benchmark::State& state)
{
  const auto dir = state.range(0) == 0 ? chaskey::direction_t::forward
                                       : chaskey::direction_t::inverse;

  uint8_t key[chaskey::KEY_LEN];
  uint8_t blk[chaskey::BLOCK_LEN];
  uint8_t out[chaskey::BLOCK_LEN];

  random_data(key, sizeof(key));
  random_data(blk, sizeof(blk));

  for (auto _ : state) {
    chaskey::permute(dir, key, sizeof(key), blk, sizeof(blk), out);

    benchmark::DoNotOptimize(out);
    benchmark::ClobberMemory();
  }

  state.SetBytesProcessed(
    static_cast<int64_t>(chaskey::BLOCK_LEN * state.iterations()));
}

// Benchmarks Chaskey-LTS counter mode key stream application, on CPU system,
// with variable length input ( which is randomly generated )
static void
ctr_apply(benchmark::State& state)
{
  const size_t ctlen = state.range(0);

  uint8_t* key = static_cast<uint8_t*>(std::malloc(chaskey::KEY_LEN));
  uint8_t* counter = static_cast<uint8_t*>(std::malloc(ctr::COUNTER_LEN));
  uint8_t* txt = static_cast<uint8_t*>(std::malloc(ctlen));
  uint8_t* enc = static_cast<uint8_t*>(std::malloc(ctlen));

  random_data(key, chaskey::KEY_LEN);
  random_data(counter, ctr::COUNTER_LEN);
  random_data(txt, ctlen);

  std::memset(enc, 0, ctlen);

  for (auto _ : state) {
    ctr::apply(key, chaskey::KEY_LEN, counter, txt, enc, ctlen);

    benchmark::DoNotOptimize(enc);
    benchmark::DoNotOptimize(counter);
    benchmark::ClobberMemory();
  }

  const size_t total_data = ctlen * state.iterations();
  state.SetBytesProcessed(static_cast<int64_t>(total_data));

  std::free(key);
  std::free(counter);
  std::free(txt);
  std::free(enc);
}

// Benchmarks encryption through Chaskey-LTS cipher facade, followed by
// checking that a fresh instance, starting from same nonce, decrypts it back
static void
encrypt(benchmark::State& state)
{
  const size_t ctlen = state.range(0);

  chaskey_ctr::bytes_t key(chaskey::KEY_LEN);
  chaskey_ctr::bytes_t nonce(ctr::COUNTER_LEN);
  chaskey_ctr::bytes_t txt(ctlen);
  chaskey_ctr::bytes_t enc;

  random_data(key.data(), key.size());
  random_data(nonce.data(), nonce.size());
  random_data(txt.data(), txt.size());

  for (auto _ : state) {
    chaskey_ctr::cipher_t c("ctr", key, { nonce });
    enc = c.encrypt(txt);

    benchmark::DoNotOptimize(enc);
    benchmark::ClobberMemory();
  }

  chaskey_ctr::cipher_t c("ctr", key, { nonce });
  const auto dec = c.decrypt(enc);
  assert(dec == txt);

  const size_t total_data = ctlen * state.iterations();
  state.SetBytesProcessed(static_cast<int64_t>(total_data));
}

}
