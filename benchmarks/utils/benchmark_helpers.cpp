/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>

namespace kcenon::omics_transfer::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_fastq_data(std::size_t size,
                                              std::size_t read_length,
                                              uint32_t seed) -> std::vector<std::byte> {
    static constexpr char bases[] = {'A', 'C', 'G', 'T'};

    std::vector<std::byte> data;
    data.reserve(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<int> base_dis(0, 3);
    std::uniform_int_distribution<int> quality_dis('5', 'I');

    auto append = [&data](const std::string& text) {
        for (char c : text) {
            data.push_back(static_cast<std::byte>(c));
        }
    };

    for (uint64_t read = 1; data.size() < size; ++read) {
        std::string sequence(read_length, 'N');
        std::string quality(read_length, '#');
        for (std::size_t i = 0; i < read_length; ++i) {
            sequence[i] = bases[base_dis(gen)];
            quality[i] = static_cast<char>(quality_dis(gen));
        }
        append("@read" + std::to_string(read) + "\n" + sequence + "\n+\n" + quality + "\n");
    }

    data.resize(size);
    return data;
}

// scratch_directory implementation

scratch_directory::scratch_directory(const std::string& name)
    : path_(std::filesystem::temp_directory_path() /
            ("omics_trans_bench_" + name + "_" + std::to_string(std::random_device{}()))) {
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
}

scratch_directory::~scratch_directory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

void scratch_directory::clear() {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(path_, ec)) {
        std::filesystem::remove_all(entry.path(), ec);
    }
}

// memory_storage_client implementation

namespace {

class buffer_part_stream : public part_stream {
public:
    buffer_part_stream(const std::vector<std::byte>& content, uint64_t offset, uint64_t size)
        : content_(content), position_(offset), end_(offset + size) {}

    auto read(std::size_t max_bytes) -> result<std::vector<std::byte>> override {
        auto count = std::min<uint64_t>(max_bytes, end_ - position_);
        auto first = content_.begin() + static_cast<std::ptrdiff_t>(position_);
        std::vector<std::byte> chunk(first, first + static_cast<std::ptrdiff_t>(count));
        position_ += count;
        return chunk;
    }

private:
    // Files are never removed while the client is alive
    const std::vector<std::byte>& content_;
    uint64_t position_;
    uint64_t end_;
};

}  // namespace

void memory_storage_client::add_file(const resource_ref& resource,
                                     const std::string& file_key,
                                     std::vector<std::byte> content,
                                     uint64_t part_size) {
    std::lock_guard lock(mutex_);
    auto& entry = files_[key_of(resource)][file_key];
    entry.info.content_length = content.size();
    entry.info.part_size = part_size;
    entry.info.total_parts = content.empty() ? 1 : (content.size() + part_size - 1) / part_size;
    entry.content = std::move(content);
}

auto memory_storage_client::get_file_metadata(const resource_ref& resource)
    -> result<file_metadata_map> {
    std::lock_guard lock(mutex_);
    auto it = files_.find(key_of(resource));
    if (it == files_.end()) {
        return unexpected(error{error_code::remote_not_found, "Resource not found"});
    }

    file_metadata_map files;
    for (const auto& [key, entry] : it->second) {
        files.emplace(key, entry.info);
    }
    return files;
}

auto memory_storage_client::get_part(const resource_ref& resource,
                                     std::string_view file_key,
                                     uint64_t part_number) -> result<std::unique_ptr<part_stream>> {
    std::lock_guard lock(mutex_);
    auto resource_it = files_.find(key_of(resource));
    if (resource_it == files_.end()) {
        return unexpected(error{error_code::remote_not_found, "Resource not found"});
    }
    auto file_it = resource_it->second.find(file_key);
    if (file_it == resource_it->second.end()) {
        return unexpected(error{error_code::remote_not_found, "File not found"});
    }

    const auto& entry = file_it->second;
    auto offset = std::min<uint64_t>((part_number - 1) * entry.info.part_size,
                                     entry.content.size());
    auto size = std::min<uint64_t>(entry.info.part_size, entry.content.size() - offset);
    return std::unique_ptr<part_stream>(
        std::make_unique<buffer_part_stream>(entry.content, offset, size));
}

auto memory_storage_client::create_multipart_read_set_upload(
    const create_read_set_upload_request&) -> result<std::string> {
    return "upload-" + std::to_string(next_upload_++);
}

auto memory_storage_client::upload_read_set_part(const upload_part_request& request)
    -> result<std::string> {
    return request.payload_sha256;
}

auto memory_storage_client::complete_multipart_read_set_upload(std::string_view,
                                                               std::string_view upload_id,
                                                               const std::vector<completed_part>&)
    -> result<std::string> {
    return "readset-" + std::string(upload_id);
}

auto memory_storage_client::abort_multipart_read_set_upload(std::string_view, std::string_view)
    -> result<void> {
    return {};
}

auto memory_storage_client::key_of(const resource_ref& resource) -> std::string {
    return std::string(to_string(resource.kind)) + "/" + resource.store_id + "/" +
           resource.resource_id;
}

}  // namespace kcenon::omics_transfer::benchmark
