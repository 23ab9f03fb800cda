/**
 * @file test_transfer_coordinator.cpp
 * @brief Unit tests for the transfer coordinator, future and controller
 */

#include <gtest/gtest.h>

#include <kcenon/omics_transfer/core/transfer_coordinator.h>
#include <kcenon/omics_transfer/core/transfer_task.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::omics_transfer::test {

using namespace std::chrono_literals;

// =============================================================================
// Transfer Coordinator Tests
// =============================================================================

class TransferCoordinatorTest : public ::testing::Test {
protected:
    std::shared_ptr<transfer_coordinator> coordinator_ =
        std::make_shared<transfer_coordinator>(1);
};

TEST_F(TransferCoordinatorTest, InitialState) {
    EXPECT_EQ(coordinator_->transfer_id(), 1u);
    EXPECT_EQ(coordinator_->state(), transfer_state::not_started);
    EXPECT_FALSE(coordinator_->done());
    EXPECT_FALSE(coordinator_->announced());
    EXPECT_FALSE(coordinator_->exception().has_value());
}

TEST_F(TransferCoordinatorTest, QueuedOnlyFromNotStarted) {
    EXPECT_TRUE(coordinator_->set_status_to_queued().has_value());
    EXPECT_EQ(coordinator_->state(), transfer_state::queued);

    auto again = coordinator_->set_status_to_queued();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::internal_error);
}

TEST_F(TransferCoordinatorTest, SuccessfulLifecycle) {
    ASSERT_TRUE(coordinator_->set_status_to_queued().has_value());
    ASSERT_TRUE(coordinator_->set_status_to_running().has_value());
    EXPECT_EQ(coordinator_->state(), transfer_state::running);

    coordinator_->set_result("/data/out.bam");
    EXPECT_TRUE(coordinator_->done());
    coordinator_->announce_done();

    auto result = coordinator_->result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), "/data/out.bam");
    EXPECT_EQ(coordinator_->state(), transfer_state::success);
}

TEST_F(TransferCoordinatorTest, AnnounceWithoutOutcomeIsSuccess) {
    coordinator_->announce_done();
    EXPECT_EQ(coordinator_->state(), transfer_state::success);
    auto result = coordinator_->result();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(TransferCoordinatorTest, FirstErrorWins) {
    coordinator_->set_exception(error{error_code::connection_reset, "first"});
    coordinator_->set_exception(error{error_code::remote_service_error, "second"});
    coordinator_->set_result("ignored");
    coordinator_->announce_done();

    EXPECT_EQ(coordinator_->state(), transfer_state::failed);
    auto result = coordinator_->result();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::connection_reset);
    EXPECT_EQ(result.error().message, "first");
}

TEST_F(TransferCoordinatorTest, RunningNeverLeavesTerminalState) {
    coordinator_->set_exception(error{error_code::internal_error});
    ASSERT_TRUE(coordinator_->set_status_to_running().has_value());
    EXPECT_EQ(coordinator_->state(), transfer_state::failed);
}

TEST_F(TransferCoordinatorTest, CancelNotStartedAnnouncesImmediately) {
    coordinator_->cancel("stop");
    EXPECT_EQ(coordinator_->state(), transfer_state::cancelled);
    EXPECT_TRUE(coordinator_->announced());

    auto result = coordinator_->result();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::cancelled);
    EXPECT_EQ(result.error().message, "stop");
}

TEST_F(TransferCoordinatorTest, CancelRunningWaitsForFinalTask) {
    ASSERT_TRUE(coordinator_->set_status_to_queued().has_value());
    ASSERT_TRUE(coordinator_->set_status_to_running().has_value());

    coordinator_->cancel({}, error_code::interrupted);
    EXPECT_TRUE(coordinator_->done());
    EXPECT_FALSE(coordinator_->announced());
    EXPECT_FALSE(coordinator_->wait_for(10ms));

    coordinator_->announce_done();
    auto result = coordinator_->result();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::interrupted);
    EXPECT_EQ(result.error().message, "interrupted");
}

TEST_F(TransferCoordinatorTest, CancelDoneIsNoOp) {
    coordinator_->set_result("done");
    coordinator_->cancel("too late");
    coordinator_->announce_done();

    EXPECT_EQ(coordinator_->state(), transfer_state::success);
    EXPECT_TRUE(coordinator_->result().has_value());
}

TEST_F(TransferCoordinatorTest, AnnounceRunsOnce) {
    int callbacks = 0;
    coordinator_->add_done_callback([&callbacks] { ++callbacks; });

    coordinator_->announce_done();
    coordinator_->announce_done();
    EXPECT_EQ(callbacks, 1);
}

TEST_F(TransferCoordinatorTest, CallbacksRunInOrderAfterCleanups) {
    std::vector<std::string> events;
    coordinator_->add_done_callback([&events] { events.push_back("done-1"); });
    coordinator_->add_failure_cleanup([&events] { events.push_back("cleanup"); });
    coordinator_->add_done_callback([&events] { events.push_back("done-2"); });

    coordinator_->set_exception(error{error_code::internal_error});
    coordinator_->announce_done();

    EXPECT_EQ(events, (std::vector<std::string>{"cleanup", "done-1", "done-2"}));
}

TEST_F(TransferCoordinatorTest, FailureCleanupsSkippedOnSuccess) {
    bool cleaned = false;
    coordinator_->add_failure_cleanup([&cleaned] { cleaned = true; });
    coordinator_->set_result("ok");
    coordinator_->announce_done();
    EXPECT_FALSE(cleaned);
}

TEST_F(TransferCoordinatorTest, ThrowingCallbackDoesNotStopOthers) {
    bool second = false;
    coordinator_->add_done_callback([] { throw std::runtime_error("callback failed"); });
    coordinator_->add_done_callback([&second] { second = true; });
    coordinator_->announce_done();
    EXPECT_TRUE(second);
}

TEST_F(TransferCoordinatorTest, LateCallbackRunsImmediately) {
    coordinator_->announce_done();
    bool ran = false;
    coordinator_->add_done_callback([&ran] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST_F(TransferCoordinatorTest, ResultBlocksUntilAnnounced) {
    std::thread announcer([this] {
        std::this_thread::sleep_for(30ms);
        coordinator_->set_result("late");
        coordinator_->announce_done();
    });

    auto result = coordinator_->result();
    announcer.join();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), "late");
}

TEST_F(TransferCoordinatorTest, SubmitTracksAssociatedFutures) {
    bounded_executor executor("test", 10, 2);
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();

    auto submitted = coordinator_->submit(executor, [gate_future] { gate_future.wait(); });
    ASSERT_TRUE(submitted.has_value());
    EXPECT_EQ(coordinator_->associated_futures().size(), 1u);

    gate.set_value();
    coordinator_->wait_for_associated_futures();
    EXPECT_TRUE(coordinator_->associated_futures().empty());
}

TEST_F(TransferCoordinatorTest, SubmitToStoppedPoolFails) {
    bounded_executor executor("test", 10, 1);
    executor.shutdown();

    auto submitted = coordinator_->submit(executor, [] {});
    ASSERT_FALSE(submitted.has_value());
    EXPECT_EQ(submitted.error().code, error_code::executor_shutdown);
    EXPECT_TRUE(coordinator_->associated_futures().empty());
}

// =============================================================================
// Count Callback Invoker Tests
// =============================================================================

TEST(CountCallbackInvokerTest, FiresOnceAfterFinalizeAndZero) {
    int fired = 0;
    count_callback_invoker invoker([&fired] { ++fired; });

    ASSERT_TRUE(invoker.increment().has_value());
    ASSERT_TRUE(invoker.increment().has_value());
    invoker.decrement();
    EXPECT_EQ(fired, 0);

    invoker.finalize();
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(invoker.current_count(), 1u);

    invoker.decrement();
    EXPECT_EQ(fired, 1);
}

TEST(CountCallbackInvokerTest, FinalizeAtZeroFiresImmediately) {
    int fired = 0;
    count_callback_invoker invoker([&fired] { ++fired; });
    invoker.finalize();
    EXPECT_EQ(fired, 1);
    invoker.finalize();
    EXPECT_EQ(fired, 1);
}

TEST(CountCallbackInvokerTest, IncrementAfterFinalizeFails) {
    count_callback_invoker invoker([] {});
    invoker.finalize();
    auto result = invoker.increment();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::internal_error);
}

// =============================================================================
// Transfer Task Tests
// =============================================================================

namespace {

class scripted_task : public transfer_task {
public:
    scripted_task(std::shared_ptr<transfer_coordinator> coordinator,
                  std::function<result<void>()> body,
                  bool is_final = false,
                  std::vector<std::function<void()>> done_callbacks = {})
        : transfer_task(std::move(coordinator), is_final, std::move(done_callbacks)),
          body_(std::move(body)) {}

    int runs = 0;

protected:
    auto execute() -> result<void> override {
        ++runs;
        return body_();
    }

private:
    std::function<result<void>()> body_;
};

}  // namespace

TEST_F(TransferCoordinatorTest, TaskErrorIsStored) {
    scripted_task task(coordinator_, [] {
        return result<void>(unexpected(error{error_code::file_write_error, "disk full"}));
    });
    task();

    EXPECT_EQ(task.runs, 1);
    EXPECT_EQ(coordinator_->state(), transfer_state::failed);
    EXPECT_EQ(coordinator_->exception()->code, error_code::file_write_error);
    EXPECT_FALSE(coordinator_->announced());
}

TEST_F(TransferCoordinatorTest, TaskExceptionBecomesInternalError) {
    scripted_task task(coordinator_, []() -> result<void> { throw std::runtime_error("bad"); });
    task();

    ASSERT_TRUE(coordinator_->exception().has_value());
    EXPECT_EQ(coordinator_->exception()->code, error_code::internal_error);
    EXPECT_EQ(coordinator_->exception()->message, "bad");
}

TEST_F(TransferCoordinatorTest, TaskSkippedWhenDoneButCallbacksRun) {
    coordinator_->cancel("stop");
    int callbacks = 0;
    scripted_task task(coordinator_, [] { return result<void>{}; }, false,
                       {[&callbacks] { ++callbacks; }});
    task();

    EXPECT_EQ(task.runs, 0);
    EXPECT_EQ(callbacks, 1);
}

TEST_F(TransferCoordinatorTest, FinalTaskAnnounces) {
    scripted_task task(coordinator_, [this] {
        coordinator_->set_result("final");
        return result<void>{};
    }, true);
    task();

    EXPECT_TRUE(coordinator_->announced());
    EXPECT_EQ(coordinator_->result().value(), "final");
}

// =============================================================================
// Transfer Future and Controller Tests
// =============================================================================

TEST(TransferFutureTest, ExposesMetaAndSize) {
    transfer_request request;
    request.resource = resource_ref{resource_kind::read_set, "store", "rs"};
    request.file_name = "source1";

    auto meta = std::make_shared<transfer_meta>(request, 5);
    auto coordinator = std::make_shared<transfer_coordinator>(5);
    transfer_future future(meta, coordinator);

    EXPECT_EQ(future.transfer_id(), 5u);
    EXPECT_EQ(future.meta().request().file_name, "source1");
    EXPECT_FALSE(future.meta().size().has_value());

    future.meta().provide_transfer_size(1024);
    EXPECT_EQ(future.meta().size().value(), 1024u);

    future.cancel("user");
    EXPECT_TRUE(future.done());
    EXPECT_EQ(future.result().error().code, error_code::cancelled);
}

TEST(TransferCoordinatorControllerTest, TracksAndCancelsAll) {
    transfer_coordinator_controller controller;
    auto a = std::make_shared<transfer_coordinator>(1);
    auto b = std::make_shared<transfer_coordinator>(2);
    controller.add_transfer_coordinator(a);
    controller.add_transfer_coordinator(b);
    EXPECT_EQ(controller.size(), 2u);

    controller.cancel("shutdown", error_code::fatal_error);
    EXPECT_EQ(a->exception()->code, error_code::fatal_error);
    EXPECT_EQ(b->exception()->code, error_code::fatal_error);

    controller.remove_transfer_coordinator(1);
    EXPECT_EQ(controller.size(), 1u);
    EXPECT_EQ(controller.tracked_transfer_coordinators().front()->transfer_id(), 2u);
}

TEST(TransferCoordinatorControllerTest, WaitReturnsWhenAllAnnounced) {
    transfer_coordinator_controller controller;
    auto coordinator = std::make_shared<transfer_coordinator>(1);
    controller.add_transfer_coordinator(coordinator);

    std::thread finisher([coordinator] {
        std::this_thread::sleep_for(30ms);
        coordinator->set_exception(error{error_code::remote_service_error});
        coordinator->announce_done();
    });

    // Failures are not reported by wait
    EXPECT_TRUE(controller.wait().has_value());
    finisher.join();
}

TEST(TransferCoordinatorControllerTest, WaitObservesInterrupt) {
    transfer_coordinator_controller controller;
    auto coordinator = std::make_shared<transfer_coordinator>(1);
    controller.add_transfer_coordinator(coordinator);

    std::atomic<bool> interrupt{false};
    std::thread interrupter([&interrupt] {
        std::this_thread::sleep_for(30ms);
        interrupt = true;
    });

    auto waited = controller.wait(&interrupt, 5ms);
    interrupter.join();
    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().code, error_code::interrupted);
}

}  // namespace kcenon::omics_transfer::test
