#include "bench_chaskey_ctr.hpp"

// register Chaskey-LTS permutation for benchmarking
BENCHMARK(bench_chaskey_ctr::permute)->Arg(0); // forward
BENCHMARK(bench_chaskey_ctr::permute)->Arg(1); // inverse

// register Chaskey-LTS counter mode for benchmarking
BENCHMARK(bench_chaskey_ctr::ctr_apply)->Arg(32);
BENCHMARK(bench_chaskey_ctr::ctr_apply)->Arg(64);
BENCHMARK(bench_chaskey_ctr::ctr_apply)->Arg(128);
BENCHMARK(bench_chaskey_ctr::ctr_apply)->Arg(256);
BENCHMARK(bench_chaskey_ctr::ctr_apply)->Arg(512);
BENCHMARK(bench_chaskey_ctr::ctr_apply)->Arg(1024);
BENCHMARK(bench_chaskey_ctr::ctr_apply)->Arg(2048);
BENCHMARK(bench_chaskey_ctr::ctr_apply)->Arg(4096);

BENCHMARK(bench_chaskey_ctr::encrypt)->Arg(64);
BENCHMARK(bench_chaskey_ctr::encrypt)->Arg(1024);
BENCHMARK(bench_chaskey_ctr::encrypt)->Arg(4096);

// benchmark runner main function
BENCHMARK_MAIN();
