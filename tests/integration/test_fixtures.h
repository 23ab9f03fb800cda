/**
 * @file test_fixtures.h
 * @brief Test fixtures for omics transfer tests
 */

#ifndef KCENON_OMICS_TRANSFER_TEST_FIXTURES_H
#define KCENON_OMICS_TRANSFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/omics_transfer/core/checksum.h>
#include <kcenon/omics_transfer/omics_transfer.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <streambuf>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

namespace kcenon::omics_transfer::test {

// =============================================================================
// Data helpers
// =============================================================================

inline auto make_bytes(std::size_t size, uint32_t seed = 42) -> std::vector<std::byte> {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<> dis(0, 255);
    std::vector<std::byte> data(size);
    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }
    return data;
}

inline auto to_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> data(text.size());
    if (!text.empty()) {
        std::memcpy(data.data(), text.data(), text.size());
    }
    return data;
}

inline auto as_string(const std::vector<std::byte>& data) -> std::string {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

inline auto read_file(const std::filesystem::path& path) -> std::vector<std::byte> {
    std::ifstream file(path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return to_bytes(content);
}

inline void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data) {
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
}

/**
 * @brief Output buffer that cannot seek, like a pipe
 */
class append_only_buffer : public std::streambuf {
public:
    [[nodiscard]] auto str() const -> std::string {
        std::lock_guard lock(mutex_);
        return data_;
    }

protected:
    auto overflow(int_type ch) -> int_type override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        std::lock_guard lock(mutex_);
        data_.push_back(traits_type::to_char_type(ch));
        return ch;
    }

    auto xsputn(const char* s, std::streamsize count) -> std::streamsize override {
        std::lock_guard lock(mutex_);
        data_.append(s, static_cast<std::size_t>(count));
        return count;
    }

private:
    mutable std::mutex mutex_;
    std::string data_;
};

/**
 * @brief std::ostream over an append_only_buffer
 */
class append_only_stream : public std::ostream {
public:
    append_only_stream() : std::ostream(nullptr) { rdbuf(&buffer_); }

    [[nodiscard]] auto str() const -> std::string { return buffer_.str(); }

private:
    append_only_buffer buffer_;
};

// =============================================================================
// Subscribers
// =============================================================================

/**
 * @brief Records every lifecycle event it receives
 */
class recording_subscriber : public transfer_subscriber {
public:
    void on_queued(const transfer_future&) override { ++queued_; }

    void on_progress(const transfer_future&, int64_t bytes) override {
        std::lock_guard lock(mutex_);
        progress_.push_back(bytes);
    }

    void on_done(const transfer_future&) override { ++done_; }

    [[nodiscard]] auto queued() const -> int { return queued_.load(); }
    [[nodiscard]] auto done() const -> int { return done_.load(); }

    [[nodiscard]] auto progress() const -> std::vector<int64_t> {
        std::lock_guard lock(mutex_);
        return progress_;
    }

    [[nodiscard]] auto total_progress() const -> int64_t {
        std::lock_guard lock(mutex_);
        int64_t total = 0;
        for (auto bytes : progress_) {
            total += bytes;
        }
        return total;
    }

    [[nodiscard]] auto corrections() const -> std::vector<int64_t> {
        std::lock_guard lock(mutex_);
        std::vector<int64_t> negative;
        std::copy_if(progress_.begin(), progress_.end(), std::back_inserter(negative),
                     [](int64_t bytes) { return bytes < 0; });
        return negative;
    }

private:
    std::atomic<int> queued_{0};
    std::atomic<int> done_{0};
    mutable std::mutex mutex_;
    std::vector<int64_t> progress_;
};

/**
 * @brief Cancels its transfer on the first progress event
 */
class cancel_on_progress_subscriber : public transfer_subscriber {
public:
    void on_progress(const transfer_future& future, int64_t) override {
        if (!fired_.exchange(true)) {
            transfer_future handle = future;
            handle.cancel("cancelled by subscriber");
        }
    }

private:
    std::atomic<bool> fired_{false};
};

// =============================================================================
// In-memory storage client
// =============================================================================

/**
 * @brief omics_storage_client backed by in-memory files
 *
 * Faults are injected per file and part. Every call is counted.
 */
class in_memory_storage_client : public omics_storage_client {
public:
    /// Read failure injected into the streams of one part
    struct read_fault {
        std::size_t failing_attempts = 1;  ///< get_part calls whose stream fails
        std::size_t reads_before_failure = 0;
        error_code code = error_code::connection_reset;
    };

    using read_hook = std::function<void(std::string_view file_key, uint64_t part_number)>;

    // -------------------------------------------------------------------------
    // Setup
    // -------------------------------------------------------------------------

    void add_file(const resource_ref& resource,
                  const std::string& file_key,
                  std::vector<std::byte> content,
                  uint64_t part_size) {
        std::lock_guard lock(mutex_);
        auto& entry = files_[key_of(resource)][file_key];
        entry.info.content_length = content.size();
        entry.info.part_size = part_size;
        entry.info.total_parts =
            content.empty() ? 1 : (content.size() + part_size - 1) / part_size;
        entry.content = std::move(content);
    }

    void override_metadata(const resource_ref& resource,
                           const std::string& file_key,
                           file_part_info info) {
        std::lock_guard lock(mutex_);
        files_[key_of(resource)][file_key].info = info;
    }

    void fail_metadata(error_code code) {
        std::lock_guard lock(mutex_);
        metadata_fault_ = code;
    }

    void fail_reads(const std::string& file_key, uint64_t part_number, read_fault fault) {
        std::lock_guard lock(mutex_);
        read_faults_[{file_key, part_number}] = fault;
    }

    void fail_get_part(const std::string& file_key, uint64_t part_number, error_code code) {
        std::lock_guard lock(mutex_);
        get_part_faults_[{file_key, part_number}] = code;
    }

    void delay_part(uint64_t part_number, std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        part_delays_[part_number] = delay;
    }

    void on_read(read_hook hook) {
        std::lock_guard lock(mutex_);
        read_hook_ = std::move(hook);
    }

    void fail_create(error_code code) {
        std::lock_guard lock(mutex_);
        create_fault_ = code;
    }

    void fail_upload_part(part_source source, uint64_t part_number, error_code code) {
        std::lock_guard lock(mutex_);
        upload_faults_[{source, part_number}] = code;
    }

    void fail_complete(error_code code) {
        std::lock_guard lock(mutex_);
        complete_fault_ = code;
    }

    void delay_create(std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        create_delay_ = delay;
    }

    // -------------------------------------------------------------------------
    // Observations
    // -------------------------------------------------------------------------

    [[nodiscard]] auto metadata_calls() const -> int { return metadata_calls_.load(); }
    [[nodiscard]] auto get_part_calls() const -> int { return get_part_calls_.load(); }
    [[nodiscard]] auto create_calls() const -> int { return create_calls_.load(); }
    [[nodiscard]] auto upload_part_calls() const -> int { return upload_part_calls_.load(); }
    [[nodiscard]] auto complete_calls() const -> int { return complete_calls_.load(); }
    [[nodiscard]] auto abort_calls() const -> int { return abort_calls_.load(); }

    [[nodiscard]] auto last_create_request() const -> create_read_set_upload_request {
        std::lock_guard lock(mutex_);
        return last_create_;
    }

    [[nodiscard]] auto completed_parts() const -> std::vector<completed_part> {
        std::lock_guard lock(mutex_);
        return completed_;
    }

    /**
     * @brief Uploaded payload of one source, parts concatenated in order
     */
    [[nodiscard]] auto uploaded(part_source source) const -> std::vector<std::byte> {
        std::lock_guard lock(mutex_);
        std::vector<std::byte> joined;
        for (const auto& [key, payload] : uploaded_) {
            if (key.first == source) {
                joined.insert(joined.end(), payload.begin(), payload.end());
            }
        }
        return joined;
    }

    [[nodiscard]] auto uploaded_part_count(part_source source) const -> std::size_t {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(
            std::count_if(uploaded_.begin(), uploaded_.end(),
                          [source](const auto& entry) { return entry.first.first == source; }));
    }

    [[nodiscard]] auto upload_checksums_valid() const -> bool {
        std::lock_guard lock(mutex_);
        return checksums_valid_;
    }

    // -------------------------------------------------------------------------
    // omics_storage_client
    // -------------------------------------------------------------------------

    auto get_file_metadata(const resource_ref& resource) -> result<file_metadata_map> override {
        ++metadata_calls_;
        std::lock_guard lock(mutex_);
        if (metadata_fault_) {
            return unexpected(error{*metadata_fault_, "injected metadata failure"});
        }
        auto it = files_.find(key_of(resource));
        if (it == files_.end()) {
            return unexpected(error{error_code::remote_not_found,
                                    "Resource " + resource.resource_id + " not found"});
        }
        file_metadata_map files;
        for (const auto& [key, entry] : it->second) {
            files.emplace(key, entry.info);
        }
        return files;
    }

    auto get_part(const resource_ref& resource, std::string_view file_key, uint64_t part_number)
        -> result<std::unique_ptr<part_stream>> override {
        ++get_part_calls_;

        std::chrono::milliseconds delay{0};
        std::vector<std::byte> body;
        std::optional<read_fault> fault;
        read_hook hook;
        {
            std::lock_guard lock(mutex_);
            auto key = std::make_pair(std::string(file_key), part_number);

            if (auto failing = get_part_faults_.find(key); failing != get_part_faults_.end()) {
                return unexpected(error{failing->second, "injected get_part failure"});
            }

            auto resource_it = files_.find(key_of(resource));
            if (resource_it == files_.end()) {
                return unexpected(error{error_code::remote_not_found, "Resource not found"});
            }
            auto file_it = resource_it->second.find(std::string(file_key));
            if (file_it == resource_it->second.end()) {
                return unexpected(error{error_code::remote_not_found, "File not found"});
            }

            const auto& entry = file_it->second;
            const auto& info = entry.info;
            uint64_t offset = (part_number - 1) * info.part_size;
            if (offset < entry.content.size()) {
                auto end = std::min<uint64_t>(offset + info.part_size, entry.content.size());
                body.assign(entry.content.begin() + static_cast<std::ptrdiff_t>(offset),
                            entry.content.begin() + static_cast<std::ptrdiff_t>(end));
            }

            if (auto faulty = read_faults_.find(key); faulty != read_faults_.end()) {
                if (faulty->second.failing_attempts > 0) {
                    --faulty->second.failing_attempts;
                    fault = faulty->second;
                }
            }
            if (auto delayed = part_delays_.find(part_number); delayed != part_delays_.end()) {
                delay = delayed->second;
            }
            hook = read_hook_;
        }

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return std::unique_ptr<part_stream>(std::make_unique<memory_part_stream>(
            std::move(body), fault, std::move(hook), std::string(file_key), part_number));
    }

    auto create_multipart_read_set_upload(const create_read_set_upload_request& request)
        -> result<std::string> override {
        ++create_calls_;
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard lock(mutex_);
            last_create_ = request;
            if (create_fault_) {
                return unexpected(error{*create_fault_, "injected create failure"});
            }
            delay = create_delay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return std::string("upload-") + std::to_string(create_calls_.load());
    }

    auto upload_read_set_part(const upload_part_request& request)
        -> result<std::string> override {
        ++upload_part_calls_;
        std::lock_guard lock(mutex_);
        auto key = std::make_pair(request.source, request.part_number);
        if (auto failing = upload_faults_.find(key); failing != upload_faults_.end()) {
            return unexpected(error{failing->second, "injected upload failure"});
        }
        if (!checksum::verify_sha256(request.payload, request.payload_sha256)) {
            checksums_valid_ = false;
        }
        uploaded_[key] = request.payload;
        return "checksum-" + std::string(omics_transfer::to_string(request.source)) + "-" +
               std::to_string(request.part_number);
    }

    auto complete_multipart_read_set_upload(std::string_view,
                                            std::string_view upload_id,
                                            const std::vector<completed_part>& parts)
        -> result<std::string> override {
        ++complete_calls_;
        std::lock_guard lock(mutex_);
        if (complete_fault_) {
            return unexpected(error{*complete_fault_, "injected complete failure"});
        }
        completed_ = parts;
        return "readset-" + std::string(upload_id);
    }

    auto abort_multipart_read_set_upload(std::string_view, std::string_view)
        -> result<void> override {
        ++abort_calls_;
        return {};
    }

private:
    struct file_entry {
        file_part_info info;
        std::vector<std::byte> content;
    };

    class memory_part_stream : public part_stream {
    public:
        memory_part_stream(std::vector<std::byte> body,
                           std::optional<read_fault> fault,
                           read_hook hook,
                           std::string file_key,
                           uint64_t part_number)
            : body_(std::move(body)),
              fault_(fault),
              hook_(std::move(hook)),
              file_key_(std::move(file_key)),
              part_number_(part_number) {}

        auto read(std::size_t max_bytes) -> result<std::vector<std::byte>> override {
            if (fault_ && reads_ == fault_->reads_before_failure) {
                return unexpected(error{fault_->code, "injected read failure"});
            }
            ++reads_;
            if (hook_) {
                hook_(file_key_, part_number_);
            }
            auto count = std::min(max_bytes, body_.size() - position_);
            std::vector<std::byte> chunk(body_.begin() + static_cast<std::ptrdiff_t>(position_),
                                         body_.begin() +
                                             static_cast<std::ptrdiff_t>(position_ + count));
            position_ += count;
            return chunk;
        }

    private:
        std::vector<std::byte> body_;
        std::optional<read_fault> fault_;
        read_hook hook_;
        std::string file_key_;
        uint64_t part_number_;
        std::size_t position_ = 0;
        std::size_t reads_ = 0;
    };

    static auto key_of(const resource_ref& resource) -> std::string {
        return std::string(omics_transfer::to_string(resource.kind)) + "/" + resource.store_id +
               "/" + resource.resource_id;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, file_entry>> files_;
    std::optional<error_code> metadata_fault_;
    std::map<std::pair<std::string, uint64_t>, read_fault> read_faults_;
    std::map<std::pair<std::string, uint64_t>, error_code> get_part_faults_;
    std::map<uint64_t, std::chrono::milliseconds> part_delays_;
    read_hook read_hook_;

    std::optional<error_code> create_fault_;
    std::chrono::milliseconds create_delay_{0};
    std::map<std::pair<part_source, uint64_t>, error_code> upload_faults_;
    std::optional<error_code> complete_fault_;
    create_read_set_upload_request last_create_;
    std::map<std::pair<part_source, uint64_t>, std::vector<std::byte>> uploaded_;
    std::vector<completed_part> completed_;
    bool checksums_valid_ = true;

    std::atomic<int> metadata_calls_{0};
    std::atomic<int> get_part_calls_{0};
    std::atomic<int> create_calls_{0};
    std::atomic<int> upload_part_calls_{0};
    std::atomic<int> complete_calls_{0};
    std::atomic<int> abort_calls_{0};
};

// =============================================================================
// Fixtures
// =============================================================================

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("omics_trans_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        download_dir_ = test_dir_ / "downloads";
        std::filesystem::create_directories(download_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const std::vector<std::byte>& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        write_file(path, content);
        return path;
    }

    /**
     * @brief Names of files in a directory, temporary files included
     */
    [[nodiscard]] static auto list_files(const std::filesystem::path& dir)
        -> std::set<std::string> {
        std::set<std::string> names;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            names.insert(entry.path().filename().string());
        }
        return names;
    }

    [[nodiscard]] static auto has_temp_file(const std::filesystem::path& dir) -> bool {
        for (const auto& name : list_files(dir)) {
            if (name.find(".tmp_") != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path download_dir_;
};

/**
 * @brief Fixture owning an in-memory client and a manager built on it
 */
class ManagerFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        client_ = std::make_shared<in_memory_storage_client>();
        config_.directory = download_dir_;
        config_.io_chunksize = 4096;
    }

    void TearDown() override {
        manager_.reset();
        TempDirectoryFixture::TearDown();
    }

    void build_manager() {
        auto built = transfer_manager::builder()
                         .with_client(client_)
                         .with_config(config_)
                         .build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        manager_ = std::make_unique<transfer_manager>(std::move(built.value()));
    }

    static auto read_set(const std::string& id = "rs1") -> resource_ref {
        return resource_ref{resource_kind::read_set, "store1", id};
    }

    static auto reference(const std::string& id = "ref1") -> resource_ref {
        return resource_ref{resource_kind::reference, "refstore1", id};
    }

    std::shared_ptr<in_memory_storage_client> client_;
    transfer_config config_;
    std::unique_ptr<transfer_manager> manager_;
};

}  // namespace kcenon::omics_transfer::test

#endif  // KCENON_OMICS_TRANSFER_TEST_FIXTURES_H
