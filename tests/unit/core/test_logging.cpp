/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging
 */

#include <gtest/gtest.h>

#include <kcenon/omics_transfer/core/logging.h>

#include <mutex>
#include <string>
#include <vector>

namespace kcenon::omics_transfer::test {

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TransferLogContextTest, EmptyContextIsEmptyObject) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, PopulatedFieldsOnly) {
    transfer_log_context ctx;
    ctx.transfer_id = 7;
    ctx.store_id = "1234567890";
    ctx.part_number = 3;

    EXPECT_EQ(ctx.to_json(),
              R"({"transfer_id":7,"store_id":"1234567890","part_number":3})");
}

TEST_F(TransferLogContextTest, AllFields) {
    transfer_log_context ctx;
    ctx.transfer_id = 1;
    ctx.store_id = "s";
    ctx.resource_id = "r";
    ctx.file_name = "source1";
    ctx.part_number = 2;
    ctx.total_parts = 4;
    ctx.bytes = 1024;
    ctx.attempt = 1;
    ctx.error_message = "boom";

    auto json = ctx.to_json();
    EXPECT_NE(json.find(R"("file":"source1")"), std::string::npos);
    EXPECT_NE(json.find(R"("total_parts":4)"), std::string::npos);
    EXPECT_NE(json.find(R"("bytes":1024)"), std::string::npos);
    EXPECT_NE(json.find(R"("error":"boom")"), std::string::npos);
}

TEST_F(TransferLogContextTest, EscapesJsonStrings) {
    EXPECT_EQ(transfer_log_context::escape_json_string("a\"b"), "a\\\"b");
    EXPECT_EQ(transfer_log_context::escape_json_string("a\\b"), "a\\\\b");
    EXPECT_EQ(transfer_log_context::escape_json_string("line\nbreak"), "line\\nbreak");
    EXPECT_EQ(transfer_log_context::escape_json_string(std::string("\x01", 1)), "\\u0001");
}

// =============================================================================
// Logger Tests
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = get_logger().get_level();
        get_logger().set_level(log_level::trace);
        get_logger().set_callback([this](log_level level,
                                         std::string_view category,
                                         std::string_view message,
                                         const transfer_log_context* context) {
            std::lock_guard lock(mutex_);
            entries_.push_back(entry{level, std::string(category), std::string(message),
                                     context != nullptr});
        });
    }

    void TearDown() override {
        get_logger().set_callback({});
        get_logger().set_level(previous_level_);
        get_logger().set_output_format(log_output_format::text);
    }

    struct entry {
        log_level level;
        std::string category;
        std::string message;
        bool has_context;
    };

    auto entries() -> std::vector<entry> {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    log_level previous_level_{log_level::info};
    std::mutex mutex_;
    std::vector<entry> entries_;
};

TEST_F(LoggerTest, LevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(LoggerTest, InitializeIsIdempotent) {
    get_logger().initialize();
    get_logger().initialize();
    EXPECT_TRUE(get_logger().is_initialized());
}

TEST_F(LoggerTest, CallbackReceivesMessages) {
    OT_LOG_INFO(log_category::manager, "manager started");

    auto logged = entries();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].level, log_level::info);
    EXPECT_EQ(logged[0].category, "omics_transfer.manager");
    EXPECT_EQ(logged[0].message, "manager started");
    EXPECT_FALSE(logged[0].has_context);
}

TEST_F(LoggerTest, CallbackReceivesContext) {
    transfer_log_context ctx;
    ctx.transfer_id = 42;
    OT_LOG_DEBUG_CTX(log_category::download, "part fetched", ctx);

    auto logged = entries();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_TRUE(logged[0].has_context);
}

TEST_F(LoggerTest, MessagesBelowLevelAreDropped) {
    get_logger().set_level(log_level::warn);

    OT_LOG_DEBUG(log_category::executor, "hidden");
    OT_LOG_INFO(log_category::executor, "hidden too");
    OT_LOG_ERROR(log_category::executor, "shown");

    auto logged = entries();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].message, "shown");
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::fatal));
}

TEST_F(LoggerTest, OutputFormatCanBeSwitched) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    OT_LOG_WARN(log_category::upload, "json line");
    EXPECT_EQ(entries().size(), 1u);
}

}  // namespace kcenon::omics_transfer::test
