/**
 * @file output_manager.cpp
 * @brief Implementation of download destination strategies
 */

#include "kcenon/omics_transfer/core/output_manager.h"

#include "kcenon/omics_transfer/core/logging.h"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::omics_transfer {

namespace {

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

constexpr std::array<unsigned char, 2> gzip_magic = {0x1f, 0x8b};

auto random_suffix() -> std::string {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << engine();
    return oss.str();
}

auto write_stream(std::ostream& stream, std::span<const std::byte> data) -> result<void> {
    stream.write(reinterpret_cast<const char*>(data.data()),
                 static_cast<std::streamsize>(data.size()));
    if (!stream) {
        return unexpected(error{error_code::file_write_error, "Failed to write to output stream"});
    }
    return {};
}

/**
 * @brief Writes one chunk on the io pool
 */
class io_write_task : public transfer_task {
public:
    io_write_task(std::shared_ptr<transfer_coordinator> coordinator,
                  std::shared_ptr<output_manager> output,
                  uint64_t offset,
                  std::vector<std::byte> data)
        : transfer_task(std::move(coordinator)),
          output_(std::move(output)),
          offset_(offset),
          data_(std::move(data)) {}

protected:
    auto execute() -> result<void> override { return output_->write(offset_, data_); }

private:
    std::shared_ptr<output_manager> output_;
    uint64_t offset_;
    std::vector<std::byte> data_;
};

/**
 * @brief Completes the destination and announces the download done
 */
class final_io_task : public transfer_task {
public:
    final_io_task(std::shared_ptr<transfer_coordinator> coordinator,
                  std::shared_ptr<output_manager> output,
                  uint64_t content_length)
        : transfer_task(std::move(coordinator), true),
          output_(std::move(output)),
          content_length_(content_length) {}

protected:
    auto execute() -> result<void> override {
        return output_->commit(*coordinator_, content_length_);
    }

private:
    std::shared_ptr<output_manager> output_;
    uint64_t content_length_;
};

}  // namespace

// ============================================================================
// defer_queue
// ============================================================================

auto defer_queue::request_writes(uint64_t offset, std::vector<std::byte> data)
    -> std::vector<pending_write> {
    std::vector<pending_write> writes;

    if (offset + data.size() <= next_offset_) {
        return writes;
    }

    auto existing = pending_.find(offset);
    if (existing == pending_.end() || existing->second.size() < data.size()) {
        pending_[offset] = std::move(data);
    }

    while (!pending_.empty()) {
        auto it = pending_.begin();
        uint64_t start = it->first;
        uint64_t end = start + it->second.size();

        if (end <= next_offset_) {
            pending_.erase(it);
            continue;
        }
        if (start > next_offset_) {
            break;
        }

        auto chunk = std::move(it->second);
        pending_.erase(it);
        if (start < next_offset_) {
            chunk.erase(chunk.begin(),
                        chunk.begin() + static_cast<std::ptrdiff_t>(next_offset_ - start));
            start = next_offset_;
        }
        next_offset_ += chunk.size();
        writes.push_back(pending_write{start, std::move(chunk)});
    }

    return writes;
}

auto is_gzip_file(const std::filesystem::path& path) -> bool {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::array<char, 2> header{};
    file.read(header.data(), static_cast<std::streamsize>(header.size()));
    if (file.gcount() != static_cast<std::streamsize>(header.size())) {
        return false;
    }
    return static_cast<unsigned char>(header[0]) == gzip_magic[0] &&
           static_cast<unsigned char>(header[1]) == gzip_magic[1];
}

// ============================================================================
// output_manager
// ============================================================================

output_manager::output_manager(strategy selected) : strategy_(std::move(selected)) {}

auto output_manager::select(download_destination destination)
    -> result<std::shared_ptr<output_manager>> {
    if (auto* path = std::get_if<std::filesystem::path>(&destination)) {
        if (path->empty()) {
            return unexpected(error{error_code::unsupported_output,
                                    "Destination path must not be empty"});
        }
        return std::make_shared<output_manager>(named_file_output{*path, {}, nullptr});
    }

    auto& stream = std::get<std::shared_ptr<std::ostream>>(destination);
    if (!stream) {
        return unexpected(error{error_code::unsupported_output, "Destination stream is null"});
    }
    if (!stream->good()) {
        return unexpected(error{error_code::unsupported_output,
                                "Destination stream is not in a good state"});
    }

    auto position = stream->tellp();
    if (position != std::ostream::pos_type(-1)) {
        stream->seekp(position);
        if (stream->good()) {
            return std::make_shared<output_manager>(
                seekable_stream_output{stream, static_cast<std::streamoff>(position)});
        }
    }
    stream->clear();
    return std::make_shared<output_manager>(non_seekable_stream_output{stream, {}});
}

auto output_manager::kind() const -> output_kind {
    return std::visit(overloaded{
                          [](const named_file_output&) { return output_kind::named_file; },
                          [](const seekable_stream_output&) { return output_kind::seekable_stream; },
                          [](const non_seekable_stream_output&) {
                              return output_kind::non_seekable_stream;
                          },
                      },
                      strategy_);
}

auto output_manager::final_path() const -> std::filesystem::path {
    if (const auto* named = std::get_if<named_file_output>(&strategy_)) {
        return named->final_path;
    }
    return {};
}

auto output_manager::temp_path() const -> std::filesystem::path {
    if (const auto* named = std::get_if<named_file_output>(&strategy_)) {
        return named->temp_path;
    }
    return {};
}

auto output_manager::open(transfer_coordinator& coordinator) -> result<void> {
    auto* named = std::get_if<named_file_output>(&strategy_);
    if (named == nullptr) {
        return {};
    }

    named->temp_path = named->final_path;
    named->temp_path += ".tmp_" + random_suffix();

    named->file = std::make_unique<std::ofstream>(
        named->temp_path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!named->file->is_open()) {
        named->file.reset();
        return unexpected(error{error_code::file_open_error,
                                "Failed to open " + named->temp_path.string() + " for writing"});
    }

    auto self = shared_from_this();
    coordinator.add_failure_cleanup([self] { self->discard_temp_file(); });

    OT_LOG_DEBUG(log_category::output, "Writing to temporary file " + named->temp_path.string());
    return {};
}

auto output_manager::queue_write(const std::shared_ptr<transfer_coordinator>& coordinator,
                                 bounded_executor& io_executor,
                                 uint64_t offset,
                                 std::vector<std::byte> data) -> result<void> {
    auto self = shared_from_this();

    auto* ordered = std::get_if<non_seekable_stream_output>(&strategy_);
    if (ordered == nullptr) {
        auto submitted = submit_task(
            io_executor,
            std::make_shared<io_write_task>(coordinator, self, offset, std::move(data)));
        if (!submitted) {
            return unexpected(submitted.error());
        }
        return {};
    }

    std::lock_guard lock(io_submit_mutex_);
    for (auto& write : ordered->queue.request_writes(offset, std::move(data))) {
        auto submitted = submit_task(
            io_executor,
            std::make_shared<io_write_task>(coordinator, self, write.offset, std::move(write.data)));
        if (!submitted) {
            return unexpected(submitted.error());
        }
    }
    return {};
}

auto output_manager::make_final_task(std::shared_ptr<transfer_coordinator> coordinator,
                                     uint64_t content_length) -> std::shared_ptr<transfer_task> {
    return std::make_shared<final_io_task>(std::move(coordinator), shared_from_this(),
                                           content_length);
}

auto output_manager::write(uint64_t offset, std::span<const std::byte> data) -> result<void> {
    return std::visit(
        overloaded{
            [&](named_file_output& named) -> result<void> {
                if (!named.file) {
                    return unexpected(error{error_code::file_write_error,
                                            "Temporary file is not open"});
                }
                named.file->seekp(static_cast<std::streamoff>(offset));
                return write_stream(*named.file, data);
            },
            [&](seekable_stream_output& seekable) -> result<void> {
                auto& stream = *seekable.stream;
                auto target = seekable.base_offset + static_cast<std::streamoff>(offset);
                stream.seekp(target);
                if (!stream) {
                    // String buffers cannot seek past their end; pad up to the offset.
                    stream.clear();
                    stream.seekp(0, std::ios::end);
                    auto end = static_cast<std::streamoff>(stream.tellp());
                    if (!stream || end > target) {
                        return unexpected(error{error_code::file_write_error,
                                                "Failed to seek output stream"});
                    }
                    std::vector<std::byte> padding(static_cast<std::size_t>(target - end));
                    if (auto padded = write_stream(stream, padding); !padded) {
                        return padded;
                    }
                }
                return write_stream(stream, data);
            },
            [&](non_seekable_stream_output& ordered) -> result<void> {
                return write_stream(*ordered.stream, data);
            },
        },
        strategy_);
}

auto output_manager::finalize(uint64_t content_length) -> result<std::string> {
    auto* named = std::get_if<named_file_output>(&strategy_);
    if (named == nullptr) {
        auto& stream = std::holds_alternative<seekable_stream_output>(strategy_)
                           ? std::get<seekable_stream_output>(strategy_).stream
                           : std::get<non_seekable_stream_output>(strategy_).stream;
        stream->flush();
        if (!*stream) {
            return unexpected(error{error_code::file_write_error, "Failed to flush output stream"});
        }
        return std::string{};
    }

    if (named->file) {
        named->file->close();
        bool failed = named->file->fail();
        named->file.reset();
        if (failed) {
            return unexpected(error{error_code::file_write_error,
                                    "Failed to close " + named->temp_path.string()});
        }
    }

    std::error_code ec;
    auto written = std::filesystem::file_size(named->temp_path, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error,
                                "Failed to stat " + named->temp_path.string() + ": " +
                                    ec.message()});
    }
    if (written != content_length) {
        return unexpected(error{error_code::content_length_mismatch,
                                "Expected " + std::to_string(content_length) + " bytes but wrote " +
                                    std::to_string(written)});
    }

    auto target = named->final_path;
    if (is_gzip_file(named->temp_path)) {
        target += ".gz";
    }

    std::filesystem::rename(named->temp_path, target, ec);
    if (ec) {
        return unexpected(error{error_code::file_rename_error,
                                "Failed to rename " + named->temp_path.string() + " to " +
                                    target.string() + ": " + ec.message()});
    }

    OT_LOG_DEBUG(log_category::output, "Download saved to " + target.string());
    return target.string();
}

auto output_manager::commit(transfer_coordinator& coordinator, uint64_t content_length)
    -> result<void> {
    auto finished = finalize(content_length);
    if (!finished) {
        return unexpected(finished.error());
    }
    const auto& path = finished.value();
    if (coordinator.set_result(path) || path.empty()) {
        return {};
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    OT_LOG_DEBUG(log_category::output,
                 "Transfer " + std::to_string(coordinator.transfer_id()) +
                     " ended during rename; removed " + path);
    return {};
}

void output_manager::discard_temp_file() {
    auto* named = std::get_if<named_file_output>(&strategy_);
    if (named == nullptr || named->temp_path.empty()) {
        return;
    }
    if (named->file) {
        named->file->close();
        named->file.reset();
    }

    std::error_code ec;
    std::filesystem::remove(named->temp_path, ec);
    if (ec) {
        OT_LOG_WARN(log_category::output,
                    "Failed to remove " + named->temp_path.string() + ": " + ec.message());
    }
}

}  // namespace kcenon::omics_transfer
