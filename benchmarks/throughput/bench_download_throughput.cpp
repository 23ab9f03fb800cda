/**
 * @file bench_download_throughput.cpp
 * @brief Benchmarks for end-to-end download throughput
 *
 * Runs whole transfers through the manager against an in-memory service,
 * so the numbers cover part fan-out, reordering and local writes.
 */

#include <benchmark/benchmark.h>

#include <kcenon/omics_transfer/omics_transfer.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::omics_transfer::benchmark {

namespace {

class null_buffer : public std::streambuf {
protected:
    auto overflow(int_type ch) -> int_type override { return traits_type::not_eof(ch); }
    auto xsputn(const char*, std::streamsize count) -> std::streamsize override { return count; }
};

/// Non-seekable sink, like stdout redirected to a pipe
class null_stream : public std::ostream {
public:
    null_stream() : std::ostream(&buffer_) {}

private:
    null_buffer buffer_;
};

auto make_manager(const std::shared_ptr<memory_storage_client>& client,
                  const std::filesystem::path& directory,
                  std::size_t concurrency) -> result<transfer_manager> {
    transfer_config config;
    config.directory = directory;
    config.max_request_concurrency = concurrency;
    return transfer_manager::builder().with_client(client).with_config(config).build();
}

}  // namespace

/**
 * @brief Download one file into a named file
 *
 * Args: file size, request concurrency
 */
static void BM_Download_NamedFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto concurrency = static_cast<std::size_t>(state.range(1));

    scratch_directory scratch("download");
    auto client = std::make_shared<memory_storage_client>();
    client->add_file(resource_ref{resource_kind::read_set, "store", "readset"}, "source1",
                     test_data_generator::generate_random_data(file_size, 42),
                     sizes::default_part);

    auto manager = make_manager(client, scratch.path(), concurrency);
    if (!manager) {
        state.SkipWithError(manager.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        auto future = manager.value().download_read_set_file("store", "readset",
                                                             read_set_file::source1);
        if (!future) {
            state.SkipWithError(future.error().message.c_str());
            return;
        }
        auto path = future.value().result();
        if (!path) {
            state.SkipWithError(path.error().message.c_str());
            return;
        }

        state.PauseTiming();
        scratch.clear();
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["parts"] =
        static_cast<double>((file_size + sizes::default_part - 1) / sizes::default_part);
}

/**
 * @brief Download one file into a non-seekable stream
 *
 * Every chunk passes through the reorder queue and the io pool.
 */
static void BM_Download_NonSeekableStream(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto concurrency = static_cast<std::size_t>(state.range(1));

    scratch_directory scratch("stream");
    auto client = std::make_shared<memory_storage_client>();
    client->add_file(resource_ref{resource_kind::read_set, "store", "readset"}, "source1",
                     test_data_generator::generate_random_data(file_size, 42),
                     sizes::small_part);

    auto manager = make_manager(client, scratch.path(), concurrency);
    if (!manager) {
        state.SkipWithError(manager.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        std::shared_ptr<std::ostream> sink = std::make_shared<null_stream>();
        auto future = manager.value().download_read_set_file("store", "readset",
                                                             read_set_file::source1, sink);
        if (!future) {
            state.SkipWithError(future.error().message.c_str());
            return;
        }
        if (auto done = future.value().result(); !done) {
            state.SkipWithError(done.error().message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Download every file of several read sets at once
 *
 * Args: number of read sets
 */
static void BM_Download_ManyReadSets(::benchmark::State& state) {
    const auto num_sets = static_cast<int>(state.range(0));
    constexpr std::size_t file_size = 4 * sizes::MB;

    scratch_directory scratch("many");
    auto client = std::make_shared<memory_storage_client>();
    for (int i = 0; i < num_sets; ++i) {
        resource_ref resource{resource_kind::read_set, "store", "rs" + std::to_string(i)};
        client->add_file(resource, "source1",
                         test_data_generator::generate_fastq_data(file_size, 150, i + 1),
                         sizes::small_part);
        client->add_file(resource, "source2",
                         test_data_generator::generate_fastq_data(file_size, 150, i + 101),
                         sizes::small_part);
    }

    auto manager = make_manager(client, scratch.path(), 10);
    if (!manager) {
        state.SkipWithError(manager.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        std::vector<transfer_future> futures;
        for (int i = 0; i < num_sets; ++i) {
            auto submitted = manager.value().download_read_set("store", "rs" + std::to_string(i),
                                                               std::nullopt, {}, false);
            if (!submitted) {
                state.SkipWithError(submitted.error().message.c_str());
                return;
            }
            futures.insert(futures.end(), submitted.value().begin(), submitted.value().end());
        }
        for (const auto& future : futures) {
            if (auto done = future.result(); !done) {
                state.SkipWithError(done.error().message.c_str());
                return;
            }
        }

        state.PauseTiming();
        scratch.clear();
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(2 * file_size) * num_sets *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Download_NamedFile)
    ->Args({static_cast<int64_t>(sizes::medium_file), 1})
    ->Args({static_cast<int64_t>(sizes::medium_file), 10})
    ->Args({static_cast<int64_t>(sizes::large_file), 10})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Download_NonSeekableStream)
    ->Args({static_cast<int64_t>(sizes::medium_file), 1})
    ->Args({static_cast<int64_t>(sizes::medium_file), 10})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Download_ManyReadSets)
    ->Arg(1)
    ->Arg(8)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::omics_transfer::benchmark
