/**
 * @file local_store_example.cpp
 * @brief Read set download and upload against a store kept in a local directory
 *
 * This example demonstrates:
 * - Implementing omics_storage_client over a directory tree
 * - Downloading every file of a read set with progress reporting
 * - Uploading paired FASTQ files through a multipart session
 * - Interrupting transfers with Ctrl-C via request_interrupt()
 *
 * Store layout: <root>/<store_id>/<READ_SET|REFERENCE>/<resource_id>/<file_key>
 */

#include <kcenon/omics_transfer/omics_transfer.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

using namespace kcenon::omics_transfer;

namespace {

transfer_manager* active_manager = nullptr;

void handle_sigint(int) {
    if (active_manager != nullptr) {
        active_manager->request_interrupt();
    }
}

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Serves a directory tree as an omics store
 */
class local_directory_client : public omics_storage_client {
public:
    local_directory_client(std::filesystem::path root, uint64_t part_size)
        : root_(std::move(root)), part_size_(part_size) {}

    auto get_file_metadata(const resource_ref& resource) -> result<file_metadata_map> override {
        auto dir = resource_dir(resource);
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            return unexpected(error{error_code::remote_not_found,
                                    "No such resource: " + dir.string()});
        }

        file_metadata_map files;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            auto size = entry.file_size();
            file_part_info info;
            info.content_length = size;
            info.part_size = part_size_;
            info.total_parts = size == 0 ? 1 : (size + part_size_ - 1) / part_size_;
            files.emplace(entry.path().filename().string(), info);
        }
        return files;
    }

    auto get_part(const resource_ref& resource, std::string_view file_key, uint64_t part_number)
        -> result<std::unique_ptr<part_stream>> override {
        auto path = resource_dir(resource) / std::string(file_key);
        auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
        if (!*file) {
            return unexpected(error{error_code::remote_not_found,
                                    "No such file: " + path.string()});
        }
        file->seekg(static_cast<std::streamoff>((part_number - 1) * part_size_));
        return std::unique_ptr<part_stream>(
            std::make_unique<file_part_stream>(std::move(file), part_size_));
    }

    auto create_multipart_read_set_upload(const create_read_set_upload_request& request)
        -> result<std::string> override {
        auto upload_id = "upload" + std::to_string(next_upload_++);
        std::error_code ec;
        std::filesystem::create_directories(upload_dir(request.store_id, upload_id), ec);
        if (ec) {
            return unexpected(error{error_code::remote_service_error, ec.message()});
        }
        return upload_id;
    }

    auto upload_read_set_part(const upload_part_request& request)
        -> result<std::string> override {
        auto path = upload_dir(request.store_id, request.upload_id) /
                    (std::string(to_string(request.source)) + "_" +
                     std::to_string(request.part_number));
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(request.payload.data()),
                   static_cast<std::streamsize>(request.payload.size()));
        if (!file) {
            return unexpected(error{error_code::remote_service_error,
                                    "Failed to store " + path.string()});
        }
        return request.payload_sha256;
    }

    auto complete_multipart_read_set_upload(std::string_view store_id,
                                            std::string_view upload_id,
                                            const std::vector<completed_part>& parts)
        -> result<std::string> override {
        auto staging = upload_dir(std::string(store_id), std::string(upload_id));
        auto target = root_ / std::string(store_id) / to_string(resource_kind::read_set) /
                      std::string(upload_id);
        std::error_code ec;
        std::filesystem::create_directories(target, ec);

        for (const auto& part : parts) {
            auto name = part.source == part_source::source1 ? "source1" : "source2";
            std::ofstream out(target / name, std::ios::binary | std::ios::app);
            std::ifstream in(staging / (std::string(to_string(part.source)) + "_" +
                                        std::to_string(part.part_number)),
                             std::ios::binary);
            out << in.rdbuf();
            if (!out) {
                return unexpected(error{error_code::remote_service_error,
                                        "Failed to assemble part " +
                                            std::to_string(part.part_number)});
            }
        }
        std::filesystem::remove_all(staging, ec);
        return std::string(upload_id);
    }

    auto abort_multipart_read_set_upload(std::string_view store_id, std::string_view upload_id)
        -> result<void> override {
        std::error_code ec;
        std::filesystem::remove_all(upload_dir(std::string(store_id), std::string(upload_id)),
                                    ec);
        return {};
    }

private:
    class file_part_stream : public part_stream {
    public:
        file_part_stream(std::unique_ptr<std::ifstream> file, uint64_t remaining)
            : file_(std::move(file)), remaining_(remaining) {}

        auto read(std::size_t max_bytes) -> result<std::vector<std::byte>> override {
            auto want = std::min<uint64_t>(max_bytes, remaining_);
            std::vector<std::byte> chunk(want);
            file_->read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(want));
            if (file_->bad()) {
                return unexpected(error{error_code::connection_reset, "Read failed"});
            }
            chunk.resize(static_cast<std::size_t>(file_->gcount()));
            remaining_ -= chunk.size();
            return chunk;
        }

    private:
        std::unique_ptr<std::ifstream> file_;
        uint64_t remaining_;
    };

    auto resource_dir(const resource_ref& resource) const -> std::filesystem::path {
        return root_ / resource.store_id / to_string(resource.kind) / resource.resource_id;
    }

    auto upload_dir(const std::string& store_id, const std::string& upload_id) const
        -> std::filesystem::path {
        return root_ / store_id / "uploads" / upload_id;
    }

    std::filesystem::path root_;
    uint64_t part_size_;
    std::atomic<uint64_t> next_upload_{1};
};

/**
 * @brief Prints aggregate progress of all transfers
 */
class console_progress : public transfer_subscriber {
public:
    void on_progress(const transfer_future&, int64_t bytes) override {
        auto total = transferred_ += bytes;
        std::lock_guard lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        if (now - last_print_ >= std::chrono::milliseconds(200)) {
            last_print_ = now;
            std::cout << "\r" << format_bytes(static_cast<uint64_t>(std::max<int64_t>(total, 0)))
                      << " transferred     " << std::flush;
        }
    }

    void on_done(const transfer_future& future) override {
        auto outcome = future.result();
        std::lock_guard lock(mutex_);
        std::cout << "\r[" << (outcome ? "done" : "failed") << "] "
                  << future.meta().request().file_name;
        if (!outcome) {
            std::cout << ": " << outcome.error().message;
        }
        std::cout << std::endl;
    }

private:
    std::atomic<int64_t> transferred_{0};
    std::mutex mutex_;
    std::chrono::steady_clock::time_point last_print_{};
};

}  // namespace

void print_usage(const char* program) {
    std::cout << "Local Store Example - Omics Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " <root> download <store_id> <read_set_id> <out_dir>"
              << std::endl;
    std::cout << "   or: " << program << " <root> upload <store_id> <reads_1> [reads_2]"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Press Ctrl-C to interrupt running transfers." << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 5) {
        print_usage(argv[0]);
        return 1;
    }

    std::filesystem::path root = argv[1];
    std::string command = argv[2];
    std::string store_id = argv[3];

    transfer_config config;
    config.multipart_chunksize = 8 * transfer_config::mib;

    auto client = std::make_shared<local_directory_client>(root, 8 * transfer_config::mib);
    auto built = transfer_manager::builder().with_client(client).with_config(config).build();
    if (!built) {
        std::cerr << "Failed to create manager: " << built.error().message << std::endl;
        return 1;
    }
    auto& manager = built.value();

    active_manager = &manager;
    std::signal(SIGINT, handle_sigint);

    auto progress = std::make_shared<console_progress>();
    auto outcome = manager.guarded([&](transfer_manager& m) -> result<void> {
        if (command == "download" && argc >= 6) {
            auto futures = m.download_read_set(store_id, argv[4], std::filesystem::path(argv[5]),
                                               {progress});
            if (!futures) {
                return unexpected(futures.error());
            }
            return {};
        }

        if (command == "upload") {
            read_set_upload_request request;
            request.store_id = store_id;
            request.file_type = read_set_file_type::fastq;
            request.subject_id = "example-subject";
            request.sample_id = "example-sample";
            request.source1 = std::filesystem::path(argv[4]);
            if (argc >= 6) {
                request.source2 = std::filesystem::path(argv[5]);
            }
            request.subscribers = {progress};

            auto future = m.upload_read_set(std::move(request));
            if (!future) {
                return unexpected(future.error());
            }
            auto read_set_id = future.value().result();
            if (!read_set_id) {
                return unexpected(read_set_id.error());
            }
            std::cout << "Created read set " << read_set_id.value() << std::endl;
            return {};
        }

        return unexpected(error{error_code::invalid_argument, "Unknown command: " + command});
    });

    active_manager = nullptr;

    if (!outcome) {
        std::cerr << "Transfer failed: " << outcome.error().message << std::endl;
        return 1;
    }
    return 0;
}
