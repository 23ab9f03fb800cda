/**
 * @file transfer_manager.cpp
 * @brief Implementation of the omics transfer manager
 */

#include "kcenon/omics_transfer/client/transfer_manager.h"

#include "kcenon/omics_transfer/client/download_tasks.h"
#include "kcenon/omics_transfer/core/bounded_executor.h"
#include "kcenon/omics_transfer/core/logging.h"
#include "kcenon/omics_transfer/core/transfer_task.h"

#include <atomic>
#include <mutex>

namespace kcenon::omics_transfer {

namespace {

auto ensure_directory(const std::filesystem::path& directory) -> result<void> {
    std::error_code ec;
    if (std::filesystem::exists(directory, ec)) {
        if (!std::filesystem::is_directory(directory, ec)) {
            return unexpected(error{error_code::invalid_argument,
                                    directory.string() + " exists and is not a directory"});
        }
        return {};
    }
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return unexpected(error{error_code::file_write_error,
                                "Failed to create " + directory.string() + ": " + ec.message()});
    }
    return {};
}

auto default_file_name(const resource_ref& resource, std::string_view file_key) -> std::string {
    return resource.store_id + "_" + resource.resource_id + "_" + std::string(file_key);
}

}  // namespace

// ============================================================================
// transfer_manager::impl
// ============================================================================

struct transfer_manager::impl {
    std::shared_ptr<omics_storage_client> client;
    transfer_config config;

    std::shared_ptr<transfer_coordinator_controller> controller =
        std::make_shared<transfer_coordinator_controller>();
    std::atomic<uint64_t> next_transfer_id{1};
    std::atomic<bool> interrupt{false};

    bounded_executor submission_executor;
    bounded_executor request_executor;
    bounded_executor io_executor;

    std::mutex shutdown_mutex;
    bool is_shutdown = false;

    impl(std::shared_ptr<omics_storage_client> storage_client, transfer_config cfg)
        : client(std::move(storage_client)),
          config(std::move(cfg)),
          submission_executor("submission",
                              config.max_submission_queue_size,
                              config.max_submission_concurrency,
                              {},
                              config.use_threads),
          request_executor("request",
                           config.max_request_queue_size,
                           config.max_request_concurrency,
                           {{std::string(task_tag::in_memory_upload),
                             config.max_in_memory_upload_chunks}},
                           config.use_threads),
          // One io worker serializes every destination write.
          io_executor("io", config.max_io_queue_size, 1, {}, config.use_threads) {}

    // Members are destroyed io first, so the pools must be stopped before that.
    ~impl() {
        auto outcome = shutdown(false, {}, error_code::cancelled);
        if (!outcome) {
            OT_LOG_WARN(log_category::manager,
                        "Shutdown on release ended with: " + outcome.error().message);
        }
    }

    /**
     * @brief Create and register the coordinator and future of a transfer
     */
    auto make_transfer(transfer_request request) -> transfer_future {
        auto transfer_id = next_transfer_id.fetch_add(1);
        auto coordinator = std::make_shared<transfer_coordinator>(transfer_id);
        auto meta = std::make_shared<transfer_meta>(std::move(request), transfer_id);

        std::weak_ptr<transfer_coordinator_controller> weak_controller = controller;
        coordinator->add_done_callback([weak_controller, transfer_id] {
            if (auto registry = weak_controller.lock()) {
                registry->remove_transfer_coordinator(transfer_id);
            }
        });

        std::weak_ptr<transfer_coordinator> weak_coordinator = coordinator;
        coordinator->add_done_callback([meta, weak_coordinator] {
            if (auto owner = weak_coordinator.lock()) {
                notify_done(transfer_future(meta, owner));
            }
        });

        controller->add_transfer_coordinator(coordinator);
        return transfer_future(std::move(meta), std::move(coordinator));
    }

    /**
     * @brief Hand a submission task to the submission pool
     */
    auto submit(const transfer_future& future, std::shared_ptr<submission_task> task)
        -> result<void> {
        auto submitted = submission_executor.submit([task] { (*task)(); });
        if (!submitted) {
            future.coordinator()->set_exception(submitted.error());
            future.coordinator()->announce_done();
            return unexpected(submitted.error());
        }
        return {};
    }

    auto shutdown(bool cancel, const std::string& message, error_code code) -> result<void> {
        std::lock_guard lock(shutdown_mutex);
        if (is_shutdown) {
            return {};
        }

        OT_LOG_INFO(log_category::manager,
                    "Shutting down transfer manager with " +
                        std::to_string(controller->size()) + " transfers in flight");

        if (cancel) {
            controller->cancel(message, code);
        }

        result<void> outcome;
        auto waited = controller->wait(&interrupt);
        if (!waited) {
            OT_LOG_WARN(log_category::manager, "Shutdown interrupted; cancelling all transfers");
            controller->cancel("interrupted", error_code::interrupted);
            outcome = unexpected(error{error_code::interrupted, "interrupted"});
        }

        submission_executor.shutdown();
        request_executor.shutdown();
        io_executor.shutdown();
        is_shutdown = true;
        return outcome;
    }
};

// ============================================================================
// transfer_manager::builder
// ============================================================================

transfer_manager::builder::builder() = default;

auto transfer_manager::builder::with_client(std::shared_ptr<omics_storage_client> client)
    -> builder& {
    client_ = std::move(client);
    return *this;
}

auto transfer_manager::builder::with_config(transfer_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto transfer_manager::builder::build() -> result<transfer_manager> {
    if (!client_) {
        return unexpected(error{error_code::invalid_configuration,
                                "A storage client is required"});
    }
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    return transfer_manager{std::move(client_), std::move(config_)};
}

// ============================================================================
// transfer_manager
// ============================================================================

transfer_manager::transfer_manager(std::shared_ptr<omics_storage_client> client,
                                   transfer_config config)
    : impl_(std::make_unique<impl>(std::move(client), std::move(config))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

transfer_manager::transfer_manager(transfer_manager&&) noexcept = default;

auto transfer_manager::operator=(transfer_manager&& other) noexcept -> transfer_manager& {
    if (this != &other) {
        // Waits for the transfers of the replaced manager before its pools go away.
        auto released = std::move(impl_);
        impl_ = std::move(other.impl_);
        released.reset();
    }
    return *this;
}

transfer_manager::~transfer_manager() = default;

auto transfer_manager::download_read_set_file(const std::string& store_id,
                                              const std::string& read_set_id,
                                              read_set_file file,
                                              std::optional<download_destination> destination,
                                              subscriber_list subscribers,
                                              std::optional<file_part_info> file_metadata)
    -> result<transfer_future> {
    download_request request;
    request.resource = resource_ref{resource_kind::read_set, store_id, read_set_id};
    request.file_name = to_string(file);
    request.destination = std::move(destination);
    request.subscribers = std::move(subscribers);
    request.file_metadata = file_metadata;
    return download_file(std::move(request));
}

auto transfer_manager::download_reference_file(const std::string& store_id,
                                               const std::string& reference_id,
                                               reference_file file,
                                               std::optional<download_destination> destination,
                                               subscriber_list subscribers,
                                               std::optional<file_part_info> file_metadata)
    -> result<transfer_future> {
    download_request request;
    request.resource = resource_ref{resource_kind::reference, store_id, reference_id};
    request.file_name = to_string(file);
    request.destination = std::move(destination);
    request.subscribers = std::move(subscribers);
    request.file_metadata = file_metadata;
    return download_file(std::move(request));
}

auto transfer_manager::download_file(download_request request) -> result<transfer_future> {
    if (request.resource.store_id.empty() || request.resource.resource_id.empty()) {
        return unexpected(error{error_code::invalid_argument,
                                "Store id and resource id must not be empty"});
    }

    auto file_key = normalize_file_key(request.resource.kind, request.file_name);
    if (!file_key) {
        return unexpected(file_key.error());
    }

    if (!request.destination) {
        if (auto created = ensure_directory(impl_->config.directory); !created) {
            return unexpected(created.error());
        }
        request.destination =
            impl_->config.directory / default_file_name(request.resource, file_key.value());
    }

    auto output = output_manager::select(std::move(*request.destination));
    if (!output) {
        return unexpected(output.error());
    }

    transfer_request transfer;
    transfer.direction = transfer_direction::download;
    transfer.resource = request.resource;
    transfer.file_name = file_key.value();
    transfer.subscribers = std::move(request.subscribers);
    transfer.file_metadata = request.file_metadata;

    auto future = impl_->make_transfer(std::move(transfer));

    transfer_log_context ctx;
    ctx.transfer_id = future.transfer_id();
    ctx.store_id = request.resource.store_id;
    ctx.resource_id = request.resource.resource_id;
    ctx.file_name = file_key.value();
    OT_LOG_DEBUG_CTX(log_category::manager,
                     std::string("Queueing download to ") + to_string(output.value()->kind()),
                     ctx);

    download_context context;
    context.client = impl_->client;
    context.config = impl_->config;
    context.request_executor = &impl_->request_executor;
    context.io_executor = &impl_->io_executor;

    auto task = std::make_shared<download_submission_task>(future, std::move(context),
                                                           std::move(output.value()));
    if (auto submitted = impl_->submit(future, std::move(task)); !submitted) {
        return unexpected(submitted.error());
    }
    return future;
}

auto transfer_manager::download_read_set(const std::string& store_id,
                                         const std::string& read_set_id,
                                         std::optional<std::filesystem::path> directory,
                                         subscriber_list subscribers,
                                         bool wait) -> result<std::vector<transfer_future>> {
    return download_resource(resource_ref{resource_kind::read_set, store_id, read_set_id},
                             std::move(directory), std::move(subscribers), wait);
}

auto transfer_manager::download_reference(const std::string& store_id,
                                          const std::string& reference_id,
                                          std::optional<std::filesystem::path> directory,
                                          subscriber_list subscribers,
                                          bool wait) -> result<std::vector<transfer_future>> {
    return download_resource(resource_ref{resource_kind::reference, store_id, reference_id},
                             std::move(directory), std::move(subscribers), wait);
}

auto transfer_manager::download_resource(const resource_ref& resource,
                                         std::optional<std::filesystem::path> directory,
                                         subscriber_list subscribers,
                                         bool wait) -> result<std::vector<transfer_future>> {
    auto files = impl_->client->get_file_metadata(resource);
    if (!files) {
        return unexpected(files.error());
    }

    auto target = directory.value_or(impl_->config.directory);
    if (auto created = ensure_directory(target); !created) {
        return unexpected(created.error());
    }

    std::vector<transfer_future> futures;
    futures.reserve(files.value().size());
    for (const auto& [name, info] : files.value()) {
        auto file_key = normalize_file_key(resource.kind, name);
        if (!file_key) {
            return unexpected(file_key.error());
        }

        download_request request;
        request.resource = resource;
        request.file_name = file_key.value();
        request.destination = target / default_file_name(resource, file_key.value());
        request.subscribers = subscribers;
        request.file_metadata = info;

        auto future = download_file(std::move(request));
        if (!future) {
            return unexpected(future.error());
        }
        futures.push_back(std::move(future.value()));
    }

    OT_LOG_INFO(log_category::manager,
                "Downloading " + std::to_string(futures.size()) + " files of " +
                    to_string(resource.kind) + " " + resource.resource_id);

    if (wait) {
        for (const auto& future : futures) {
            auto outcome = future.result();
            if (!outcome) {
                return unexpected(outcome.error());
            }
        }
    }
    return futures;
}

auto transfer_manager::upload_read_set(read_set_upload_request request)
    -> result<transfer_future> {
    if (auto valid = validate_upload_request(request); !valid) {
        return unexpected(valid.error());
    }

    transfer_request transfer;
    transfer.direction = transfer_direction::upload;
    transfer.resource = resource_ref{resource_kind::read_set, request.store_id, {}};
    transfer.file_name = to_string(read_set_file::source1);
    transfer.subscribers = request.subscribers;

    auto future = impl_->make_transfer(std::move(transfer));

    OT_LOG_DEBUG(log_category::manager,
                 std::string("Queueing ") + to_string(request.file_type) +
                     " read set upload to store " + request.store_id);

    upload_context context;
    context.client = impl_->client;
    context.config = impl_->config;
    context.request_executor = &impl_->request_executor;

    auto task = std::make_shared<read_set_upload_submission_task>(future, std::move(context),
                                                                  std::move(request));
    if (auto submitted = impl_->submit(future, std::move(task)); !submitted) {
        return unexpected(submitted.error());
    }
    return future;
}

void transfer_manager::cancel_all(const std::string& message) {
    OT_LOG_INFO(log_category::manager,
                "Cancelling " + std::to_string(impl_->controller->size()) + " transfers");
    impl_->controller->cancel(message, error_code::cancelled);
}

auto transfer_manager::shutdown(bool cancel, const std::string& cancel_message) -> result<void> {
    return impl_->shutdown(cancel, cancel_message, error_code::cancelled);
}

void transfer_manager::request_interrupt() noexcept {
    impl_->interrupt.store(true);
}

auto transfer_manager::guarded(const std::function<result<void>(transfer_manager&)>& body)
    -> result<void> {
    result<void> outcome;
    try {
        outcome = body(*this);
    } catch (const std::exception& e) {
        outcome = unexpected(error{error_code::internal_error, e.what()});
    }

    if (outcome) {
        return shutdown(false);
    }

    const auto& trigger = outcome.error();
    auto message = trigger.message.empty() ? std::string(to_string(trigger.code)) : trigger.message;

    // An interrupted body counts as a user request to stop.
    auto cancel_code =
        trigger.code == error_code::interrupted ? error_code::cancelled : error_code::fatal_error;

    OT_LOG_ERROR(log_category::manager, "Guarded block failed: " + message);

    auto stopped = impl_->shutdown(true, message, cancel_code);
    if (!stopped) {
        OT_LOG_WARN(log_category::manager, "Shutdown ended with: " + stopped.error().message);
    }
    return unexpected(error{error_code::fatal_error, message, trigger});
}

auto transfer_manager::config() const -> const transfer_config& {
    return impl_->config;
}

auto transfer_manager::in_flight() const -> std::size_t {
    return impl_->controller->size();
}

}  // namespace kcenon::omics_transfer
