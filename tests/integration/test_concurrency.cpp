/**
 * @file test_concurrency.cpp
 * @brief Concurrency and load tests for the transfer manager
 *
 * This file contains tests for:
 * - Many downloads submitted from several threads at once
 * - Mixed uploads and downloads sharing the pools
 * - Back-pressure from small queues and the in-memory upload limit
 * - Cancellation racing with completion
 * - Interrupting a shutdown with a large backlog
 */

#include "test_fixtures.h"

#include <atomic>
#include <barrier>
#include <chrono>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

namespace kcenon::omics_transfer::test {

using namespace std::chrono_literals;

namespace {
constexpr std::size_t kib = 1024;
constexpr std::size_t mib = 1024 * kib;
}  // namespace

// =============================================================================
// Concurrency Test Fixture
// =============================================================================

class ConcurrencyTest : public ManagerFixture {
protected:
    void SetUp() override {
        ManagerFixture::SetUp();
        config_.io_chunksize = 16 * kib;
        config_.max_request_concurrency = 8;
        config_.max_submission_concurrency = 4;
    }

    /**
     * @brief Register num_sets read sets of one source file each
     */
    void add_read_sets(int num_sets, std::size_t size, uint64_t part_size) {
        for (int i = 0; i < num_sets; ++i) {
            client_->add_file(read_set("rs" + std::to_string(i)), "source1",
                              make_bytes(size, static_cast<uint32_t>(i)), part_size);
        }
    }
};

// =============================================================================
// Concurrent Submission Tests
// =============================================================================

TEST_F(ConcurrencyTest, ManyThreadsSubmitDownloads) {
    constexpr int num_threads = 8;
    constexpr int per_thread = 4;
    add_read_sets(num_threads * per_thread, 200 * kib + 5, 64 * kib);
    build_manager();

    std::barrier sync_point(num_threads);
    std::mutex futures_mutex;
    std::vector<std::pair<int, transfer_future>> futures;
    std::atomic<int> rejected{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            sync_point.arrive_and_wait();
            for (int j = 0; j < per_thread; ++j) {
                int index = t * per_thread + j;
                auto future = manager_->download_read_set_file(
                    "store1", "rs" + std::to_string(index), read_set_file::source1);
                if (!future) {
                    ++rejected;
                    continue;
                }
                std::lock_guard lock(futures_mutex);
                futures.emplace_back(index, std::move(future.value()));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(rejected.load(), 0);
    ASSERT_EQ(futures.size(), static_cast<std::size_t>(num_threads * per_thread));

    for (const auto& [index, future] : futures) {
        auto result = future.result();
        ASSERT_TRUE(result.has_value()) << result.error().message;
        EXPECT_EQ(read_file(result.value()),
                  make_bytes(200 * kib + 5, static_cast<uint32_t>(index)));
    }

    ASSERT_TRUE(manager_->shutdown().has_value());
    EXPECT_EQ(manager_->in_flight(), 0u);
    EXPECT_FALSE(has_temp_file(download_dir_));
}

TEST_F(ConcurrencyTest, SmallQueuesApplyBackPressure) {
    constexpr int num_sets = 12;
    add_read_sets(num_sets, 128 * kib, 16 * kib);
    config_.max_request_queue_size = 2;
    config_.max_submission_queue_size = 2;
    config_.max_io_queue_size = 2;
    config_.max_request_concurrency = 2;
    build_manager();

    std::vector<transfer_future> futures;
    for (int i = 0; i < num_sets; ++i) {
        auto future = manager_->download_read_set_file("store1", "rs" + std::to_string(i),
                                                       read_set_file::source1);
        ASSERT_TRUE(future.has_value()) << future.error().message;
        futures.push_back(std::move(future.value()));
    }

    for (const auto& future : futures) {
        auto result = future.result();
        ASSERT_TRUE(result.has_value()) << result.error().message;
    }
    EXPECT_EQ(client_->get_part_calls(), num_sets * 8);
}

TEST_F(ConcurrencyTest, SharedSubscriberSeesEveryTransfer) {
    constexpr int num_sets = 10;
    add_read_sets(num_sets, 100 * kib, 32 * kib);
    build_manager();

    auto recorder = std::make_shared<recording_subscriber>();
    std::vector<transfer_future> futures;
    for (int i = 0; i < num_sets; ++i) {
        auto future = manager_->download_read_set_file("store1", "rs" + std::to_string(i),
                                                       read_set_file::source1, std::nullopt,
                                                       {recorder});
        ASSERT_TRUE(future.has_value());
        futures.push_back(std::move(future.value()));
    }

    ASSERT_TRUE(manager_->shutdown().has_value());
    EXPECT_EQ(recorder->queued(), num_sets);
    EXPECT_EQ(recorder->done(), num_sets);
    EXPECT_EQ(recorder->total_progress(), static_cast<int64_t>(num_sets * 100 * kib));
}

// =============================================================================
// Mixed Workload Tests
// =============================================================================

TEST_F(ConcurrencyTest, UploadsAndDownloadsShareThePools) {
    constexpr int num_downloads = 6;
    constexpr int num_uploads = 3;
    add_read_sets(num_downloads, 300 * kib, 64 * kib);
    config_.multipart_chunksize = 5 * mib;
    config_.max_in_memory_upload_chunks = 2;
    build_manager();

    std::vector<transfer_future> downloads;
    std::vector<transfer_future> uploads;
    for (int i = 0; i < num_downloads; ++i) {
        auto future = manager_->download_read_set_file("store1", "rs" + std::to_string(i),
                                                       read_set_file::source1);
        ASSERT_TRUE(future.has_value());
        downloads.push_back(std::move(future.value()));
    }
    for (int i = 0; i < num_uploads; ++i) {
        read_set_upload_request request;
        request.store_id = "store1";
        request.subject_id = "subject";
        request.sample_id = "sample-" + std::to_string(i);
        request.source1 =
            std::make_shared<std::istringstream>(as_string(make_bytes(11 * mib, 100 + i)));

        auto future = manager_->upload_read_set(std::move(request));
        ASSERT_TRUE(future.has_value()) << future.error().message;
        uploads.push_back(std::move(future.value()));
    }

    std::set<std::string> read_set_ids;
    for (const auto& future : uploads) {
        auto result = future.result();
        ASSERT_TRUE(result.has_value()) << result.error().message;
        read_set_ids.insert(result.value());
    }
    for (const auto& future : downloads) {
        ASSERT_TRUE(future.result().has_value());
    }

    EXPECT_EQ(read_set_ids.size(), static_cast<std::size_t>(num_uploads));
    EXPECT_EQ(client_->create_calls(), num_uploads);
    EXPECT_EQ(client_->complete_calls(), num_uploads);
    EXPECT_EQ(client_->upload_part_calls(), num_uploads * 3);
    EXPECT_TRUE(client_->upload_checksums_valid());
}

// =============================================================================
// Cancellation and Shutdown Tests
// =============================================================================

TEST_F(ConcurrencyTest, CancelRacesWithCompletion) {
    constexpr int num_sets = 16;
    add_read_sets(num_sets, 256 * kib, 32 * kib);
    build_manager();

    std::vector<transfer_future> futures;
    for (int i = 0; i < num_sets; ++i) {
        auto future = manager_->download_read_set_file("store1", "rs" + std::to_string(i),
                                                       read_set_file::source1);
        ASSERT_TRUE(future.has_value());
        futures.push_back(std::move(future.value()));
    }

    std::this_thread::sleep_for(5ms);
    manager_->cancel_all("racing cancel");

    int finished = 0;
    int cancelled = 0;
    for (const auto& future : futures) {
        auto result = future.result();
        if (result) {
            ++finished;
            EXPECT_EQ(std::filesystem::file_size(result.value()), 256 * kib);
        } else {
            ++cancelled;
            EXPECT_EQ(result.error().code, error_code::cancelled);
        }
    }
    EXPECT_EQ(finished + cancelled, num_sets);

    ASSERT_TRUE(manager_->shutdown().has_value());
    EXPECT_FALSE(has_temp_file(download_dir_));
}

TEST_F(ConcurrencyTest, InterruptedShutdownCancelsBacklog) {
    constexpr int num_sets = 20;
    add_read_sets(num_sets, 64 * kib, 16 * kib);
    client_->delay_part(1, 100ms);
    config_.max_request_concurrency = 2;
    build_manager();

    std::vector<transfer_future> futures;
    for (int i = 0; i < num_sets; ++i) {
        auto future = manager_->download_read_set_file("store1", "rs" + std::to_string(i),
                                                       read_set_file::source1);
        ASSERT_TRUE(future.has_value());
        futures.push_back(std::move(future.value()));
    }

    std::thread interrupter([this] {
        std::this_thread::sleep_for(50ms);
        manager_->request_interrupt();
    });

    auto stopped = manager_->shutdown();
    interrupter.join();

    ASSERT_FALSE(stopped.has_value());
    EXPECT_EQ(stopped.error().code, error_code::interrupted);

    int interrupted = 0;
    for (const auto& future : futures) {
        EXPECT_TRUE(future.done());
        auto result = future.result();
        if (!result) {
            EXPECT_EQ(result.error().code, error_code::interrupted);
            ++interrupted;
        }
    }
    EXPECT_GT(interrupted, 0);
    EXPECT_EQ(manager_->in_flight(), 0u);
    EXPECT_FALSE(has_temp_file(download_dir_));
}

}  // namespace kcenon::omics_transfer::test
