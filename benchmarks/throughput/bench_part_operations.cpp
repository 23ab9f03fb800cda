/**
 * @file bench_part_operations.cpp
 * @brief Benchmarks for per-part operations on the transfer path
 *
 * Covers the work done for every part or chunk independent of the remote
 * service: reordering out-of-order chunks, hashing upload parts and sizing
 * multipart uploads.
 */

#include <benchmark/benchmark.h>

#include <kcenon/omics_transfer/core/checksum.h>
#include <kcenon/omics_transfer/core/chunksize_adjuster.h>
#include <kcenon/omics_transfer/core/output_manager.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <random>

namespace kcenon::omics_transfer::benchmark {

/**
 * @brief Reordering of chunks arriving in random order
 *
 * Args: total bytes, chunk size
 */
static void BM_DeferQueue_ShuffledChunks(::benchmark::State& state) {
    const auto total = static_cast<uint64_t>(state.range(0));
    const auto chunk = static_cast<uint64_t>(state.range(1));

    std::vector<uint64_t> offsets;
    for (uint64_t offset = 0; offset < total; offset += chunk) {
        offsets.push_back(offset);
    }
    std::mt19937 gen(42);
    std::shuffle(offsets.begin(), offsets.end(), gen);

    for (auto _ : state) {
        defer_queue queue;
        std::size_t released = 0;
        for (auto offset : offsets) {
            auto size = std::min(chunk, total - offset);
            released += queue.request_writes(offset, std::vector<std::byte>(size)).size();
        }
        ::benchmark::DoNotOptimize(released);
    }

    state.SetBytesProcessed(static_cast<int64_t>(total) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["chunks"] = static_cast<double>(offsets.size());
}

/**
 * @brief SHA-256 of one upload part
 */
static void BM_Checksum_SHA256(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_fastq_data(size, 150, 42);

    for (auto _ : state) {
        auto digest = checksum::sha256(data);
        if (!digest) {
            state.SkipWithError("sha256 failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Part size selection for increasingly large uploads
 */
static void BM_ChunksizeAdjuster_Adjust(::benchmark::State& state) {
    const auto file_size = static_cast<uint64_t>(state.range(0));
    chunksize_adjuster adjuster;

    for (auto _ : state) {
        auto part_size = adjuster.adjust(sizes::min_upload_part, file_size);
        ::benchmark::DoNotOptimize(part_size);
    }

    auto part_size = adjuster.adjust(sizes::min_upload_part, file_size);
    state.counters["parts"] =
        static_cast<double>(chunksize_adjuster::part_count(file_size, part_size));
}

BENCHMARK(BM_DeferQueue_ShuffledChunks)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(64 * sizes::KB)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(64 * sizes::KB)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(256 * sizes::KB)})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_SHA256)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(sizes::min_upload_part))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ChunksizeAdjuster_Adjust)
    ->Arg(static_cast<int64_t>(sizes::GB))
    ->Arg(static_cast<int64_t>(100 * sizes::GB))
    ->Arg(static_cast<int64_t>(4096 * sizes::GB));

}  // namespace kcenon::omics_transfer::benchmark
