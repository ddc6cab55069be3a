#include <cstddef>
#include <cstdlib>

#include <algorithm>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "aux/chunk.hpp"
#include "readers/range_chunk_reader.hpp"
#include "readers/stream_chunk_reader.hpp"
#include "scanners/file_scanner.hpp"
#include "searchers/boyer_moore_searcher.hpp"
#include "searchers/knuth_morris_pratt_searcher.hpp"
#include "searchers/naive_searcher.hpp"

using namespace benchmark;

namespace binfind::bench
{

namespace
{
    auto bm_generate_data(size_t bytes_count)
    {
        std::vector<byte_t> data(bytes_count);

        std::random_device rdev;
        std::default_random_engine gen{rdev()};
        std::uniform_int_distribution<int> dist(0, 255);

        std::generate(data.begin(), data.end(), [&]{ return static_cast<byte_t>(dist(gen)); });

        return data;
    }

    // the pattern is the tail of the data so that the whole data is to be looked through
    auto bm_tail_pattern(std::vector<byte_t> const &data, size_t pattern_size)
    {
        pattern_t pattern(std::min(data.size(), pattern_size));
        std::copy_n(data.rbegin(), pattern.size(), pattern.rbegin());
        return pattern;
    }
} // anonymous namespace

void BM_StreamChunkReader(State &state)
{
    auto const bytes_count = static_cast<size_t>(state.range(0));
    auto const data = bm_generate_data(bytes_count);
    std::string const text(data.begin(), data.end());

    for (auto _ : state)
    {
        state.PauseTiming();
        std::istringstream text_stream(text);
        StreamChunkReader reader(text_stream, kDefaultChunkSize, 15);
        state.ResumeTiming();
        for (auto chunk = reader(); reader; chunk = reader())
            DoNotOptimize(chunk);
    }

    state.SetBytesProcessed(state.iterations() * bytes_count);
    state.SetComplexityN(bytes_count);
}

void BM_RangeChunkReader(State &state)
{
    auto const bytes_count = static_cast<size_t>(state.range(0));
    auto const data = bm_generate_data(bytes_count);

    for (auto _ : state)
    {
        RangeChunkReader<std::vector<byte_t>::const_iterator> reader(data, kDefaultChunkSize, 15);
        for (auto chunk = reader(); reader; chunk = reader())
            DoNotOptimize(chunk);
    }

    state.SetBytesProcessed(state.iterations() * bytes_count);
    state.SetComplexityN(bytes_count);
}

template <typename SearcherT>
void BM_Searcher(State &state)
{
    auto const bytes_count = static_cast<size_t>(state.range(0));

    auto const data = bm_generate_data(bytes_count);
    SearcherT const searcher(bm_tail_pattern(data, 16));

    for (auto _ : state)
    {
        auto token = searcher(data);
        DoNotOptimize(token);
    }

    state.SetBytesProcessed(state.iterations() * bytes_count);
    state.SetComplexityN(bytes_count);
}

template <typename SearcherT>
void BM_ChunkedScan(State &state)
{
    auto const bytes_count = static_cast<size_t>(state.range(0));

    auto const data = bm_generate_data(bytes_count);
    auto const pattern = bm_tail_pattern(data, 16);
    FileScanner<SearcherT> const scanner(SearcherT(pattern), pattern.size());

    for (auto _ : state)
    {
        size_t findings = 0;
        scanner.scan_range(data, [&findings](pos_t) { ++findings; });
        DoNotOptimize(findings);
    }

    state.SetBytesProcessed(state.iterations() * bytes_count);
    state.SetComplexityN(bytes_count);
}

BENCHMARK(BM_StreamChunkReader)
    ->RangeMultiplier(10)
    ->Range(10000, 100000000)
    ->Unit(kMillisecond)
    ->Complexity(oN);

BENCHMARK(BM_RangeChunkReader)
    ->RangeMultiplier(10)
    ->Range(10000, 100000000)
    ->Unit(kMillisecond)
    ->Complexity(oN);

BENCHMARK_TEMPLATE(BM_Searcher, NaiveSearcher<pattern_t>)
    ->RangeMultiplier(10)
    ->Range(1000, 100000000)
    ->Unit(kMillisecond)
    ->Complexity();

BENCHMARK_TEMPLATE(BM_Searcher, BoyerMooreSearcher<pattern_t>)
    ->RangeMultiplier(10)
    ->Range(1000, 100000000)
    ->Unit(kMillisecond)
    ->Complexity();

BENCHMARK_TEMPLATE(BM_Searcher, BoyerMooreSearcher<pattern_t, searchers::Boosted>)
    ->RangeMultiplier(10)
    ->Range(1000, 100000000)
    ->Unit(kMillisecond)
    ->Complexity();

BENCHMARK_TEMPLATE(BM_Searcher, KnuthMorrisPrattSearcher<pattern_t>)
    ->RangeMultiplier(10)
    ->Range(1000, 100000000)
    ->Unit(kMillisecond)
    ->Complexity();

BENCHMARK_TEMPLATE(BM_ChunkedScan, NaiveSearcher<pattern_t>)
    ->RangeMultiplier(10)
    ->Range(10000, 100000000)
    ->Unit(kMillisecond)
    ->Complexity(oN);

BENCHMARK_TEMPLATE(BM_ChunkedScan, BoyerMooreSearcher<pattern_t>)
    ->RangeMultiplier(10)
    ->Range(10000, 100000000)
    ->Unit(kMillisecond)
    ->Complexity(oN);

} // namespace binfind::bench

BENCHMARK_MAIN();
