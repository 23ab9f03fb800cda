/**
 * @file bench_upload_throughput.cpp
 * @brief Benchmarks for multipart read set upload throughput
 */

#include <benchmark/benchmark.h>

#include <kcenon/omics_transfer/omics_transfer.h>

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <sstream>

namespace kcenon::omics_transfer::benchmark {

/**
 * @brief Upload a FASTQ file read part by part from disk
 *
 * Args: file size, part size
 */
static void BM_Upload_FastqFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto part_size = static_cast<std::size_t>(state.range(1));

    scratch_directory scratch("upload");
    auto path = scratch.path() / "reads.fastq";
    {
        auto data = test_data_generator::generate_fastq_data(file_size, 150, 42);
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
    }

    transfer_config config;
    config.directory = scratch.path();
    config.multipart_chunksize = part_size;
    auto manager = transfer_manager::builder()
                       .with_client(std::make_shared<memory_storage_client>())
                       .with_config(config)
                       .build();
    if (!manager) {
        state.SkipWithError(manager.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        read_set_upload_request request;
        request.store_id = "store";
        request.subject_id = "subject";
        request.sample_id = "sample";
        request.source1 = path;

        auto future = manager.value().upload_read_set(std::move(request));
        if (!future) {
            state.SkipWithError(future.error().message.c_str());
            return;
        }
        if (auto id = future.value().result(); !id) {
            state.SkipWithError(id.error().message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Upload a stream held in memory, bounded by the in-memory part limit
 *
 * Args: file size, in-memory part limit
 */
static void BM_Upload_Stream(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto in_memory_parts = static_cast<std::size_t>(state.range(1));

    auto data = test_data_generator::generate_fastq_data(file_size, 150, 7);
    std::string text(reinterpret_cast<const char*>(data.data()), data.size());

    scratch_directory scratch("upload_stream");
    transfer_config config;
    config.directory = scratch.path();
    config.multipart_chunksize = sizes::min_upload_part;
    config.max_in_memory_upload_chunks = in_memory_parts;
    auto manager = transfer_manager::builder()
                       .with_client(std::make_shared<memory_storage_client>())
                       .with_config(config)
                       .build();
    if (!manager) {
        state.SkipWithError(manager.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        read_set_upload_request request;
        request.store_id = "store";
        request.subject_id = "subject";
        request.sample_id = "sample";
        request.source1 = std::make_shared<std::istringstream>(text);

        auto future = manager.value().upload_read_set(std::move(request));
        if (!future) {
            state.SkipWithError(future.error().message.c_str());
            return;
        }
        if (auto id = future.value().result(); !id) {
            state.SkipWithError(id.error().message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Upload_FastqFile)
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::min_upload_part)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::min_upload_part)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(32 * sizes::MB)})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Upload_Stream)
    ->Args({static_cast<int64_t>(sizes::medium_file), 1})
    ->Args({static_cast<int64_t>(sizes::medium_file), 10})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::omics_transfer::benchmark
