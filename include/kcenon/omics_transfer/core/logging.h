// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if OMICS_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::omics_transfer {

/**
 * @brief Log categories for omics transfer
 */
struct log_category {
    static constexpr std::string_view manager = "omics_transfer.manager";
    static constexpr std::string_view coordinator = "omics_transfer.coordinator";
    static constexpr std::string_view executor = "omics_transfer.executor";
    static constexpr std::string_view download = "omics_transfer.download";
    static constexpr std::string_view upload = "omics_transfer.upload";
    static constexpr std::string_view output = "omics_transfer.output";
};

/**
 * @brief Log levels for omics transfer
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured context attached to transfer log lines
 */
struct transfer_log_context {
    std::optional<uint64_t> transfer_id;
    std::optional<std::string> store_id;
    std::optional<std::string> resource_id;
    std::optional<std::string> file_name;
    std::optional<uint64_t> part_number;
    std::optional<uint64_t> total_parts;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> attempt;
    std::optional<std::string> error_message;

    /**
     * @brief Render the populated fields as a JSON object
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";
        bool first = true;

        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (transfer_id) add_uint("transfer_id", *transfer_id);
        if (store_id) add_field("store_id", *store_id);
        if (resource_id) add_field("resource_id", *resource_id);
        if (file_name) add_field("file", *file_name);
        if (part_number) add_uint("part_number", *part_number);
        if (total_parts) add_uint("total_parts", *total_parts);
        if (bytes) add_uint("bytes", *bytes);
        if (attempt) add_uint("attempt", *attempt);
        if (error_message) add_field("error", *error_message);

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto escape_json_string(const std::string& input) -> std::string {
        std::ostringstream oss;
        for (char c : input) {
            switch (c) {
                case '"': oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\b': oss << "\\b"; break;
                case '\f': oss << "\\f"; break;
                case '\n': oss << "\\n"; break;
                case '\r': oss << "\\r"; break;
                case '\t': oss << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(static_cast<unsigned char>(c));
                    } else {
                        oss << c;
                    }
            }
        }
        return oss.str();
    }
};

class omics_transfer_logger;

/**
 * @brief Global logger accessor
 */
omics_transfer_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< One JSON object per line
};

/**
 * @brief Omics transfer logging interface
 */
class omics_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const transfer_log_context*)>;

    omics_transfer_logger() = default;
    ~omics_transfer_logger() = default;

    omics_transfer_logger(const omics_transfer_logger&) = delete;
    omics_transfer_logger& operator=(const omics_transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called when a transfer manager is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if OMICS_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    /**
     * @brief Shutdown the logger
     */
    void shutdown() {
#if OMICS_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    /**
     * @brief Set minimum log level
     */
    void set_level(log_level level) {
        min_level_.store(level);
#if OMICS_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Set custom log callback
     *
     * The callback observes every enabled log line before it is written.
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        std::string formatted = get_output_format() == log_output_format::json
                                    ? format_json(level, category, message, context)
                                    : format_text(category, message, context);

#if OMICS_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), formatted, file, line, function);
            } else {
                logger_->log(to_logger_level(level), formatted);
            }
            return;
        }
#endif
        if (get_output_format() == log_output_format::text) {
            formatted = get_timestamp() + " [" + std::string(log_level_to_string(level)) + "] " +
                        formatted;
        }
        output_to_stderr(formatted);
    }

    void flush() {
#if OMICS_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\""
            << transfer_log_context::escape_json_string(std::string(message)) << "\"";
        if (context) {
            oss << ",\"context\":" << context->to_json();
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if OMICS_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline omics_transfer_logger& get_logger() {
    static omics_transfer_logger instance;
    return instance;
}

// Logging macros for convenience
#define OT_LOG(level, category, message) \
    kcenon::omics_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define OT_LOG_CTX(level, category, message, context) \
    kcenon::omics_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define OT_LOG_TRACE(category, message) \
    OT_LOG(kcenon::omics_transfer::log_level::trace, category, message)

#define OT_LOG_DEBUG(category, message) \
    OT_LOG(kcenon::omics_transfer::log_level::debug, category, message)

#define OT_LOG_INFO(category, message) \
    OT_LOG(kcenon::omics_transfer::log_level::info, category, message)

#define OT_LOG_WARN(category, message) \
    OT_LOG(kcenon::omics_transfer::log_level::warn, category, message)

#define OT_LOG_ERROR(category, message) \
    OT_LOG(kcenon::omics_transfer::log_level::error, category, message)

#define OT_LOG_FATAL(category, message) \
    OT_LOG(kcenon::omics_transfer::log_level::fatal, category, message)

#define OT_LOG_TRACE_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::omics_transfer::log_level::trace, category, message, ctx)

#define OT_LOG_DEBUG_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::omics_transfer::log_level::debug, category, message, ctx)

#define OT_LOG_INFO_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::omics_transfer::log_level::info, category, message, ctx)

#define OT_LOG_WARN_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::omics_transfer::log_level::warn, category, message, ctx)

#define OT_LOG_ERROR_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::omics_transfer::log_level::error, category, message, ctx)

#define OT_LOG_FATAL_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::omics_transfer::log_level::fatal, category, message, ctx)

} // namespace kcenon::omics_transfer
