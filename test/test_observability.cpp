#include <gtest/gtest.h>
#include "document.hpp"
#include "json.hpp"
#include "observability.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Mock Logger and Metrics for testing
class MockLogger : public jsonbcpp::ILogger {
public:
    struct LogEntry {
        jsonbcpp::LogLevel level;
        std::string message;
        std::string operation;
        size_t buffer_offset;
    };

    std::atomic<int> log_call_count{0};
    std::mutex mutex;
    std::vector<LogEntry> logs;

    bool log(jsonbcpp::LogLevel level, std::string_view message, std::string_view operation,
             std::chrono::microseconds, size_t buffer_offset, std::string_view) override {
        log_call_count++;
        std::lock_guard<std::mutex> lock(mutex);
        logs.push_back({level, std::string(message), std::string(operation), buffer_offset});
        return true;
    }
};

class MockMetrics : public jsonbcpp::IMetrics {
public:
    std::atomic<int> metric_call_count{0};
    std::vector<jsonbcpp::ErrorKind> errors;
    std::vector<std::pair<std::string, std::string>> operations;
    size_t bytes_decoded = 0;

    bool record_latency(std::string_view, double) override { metric_call_count++; return true; }
    bool increment_operation_count(std::string_view operation, std::string_view status) override {
        metric_call_count++;
        operations.emplace_back(std::string(operation), std::string(status));
        return true;
    }
    bool record_bytes_decoded(size_t bytes) override {
        metric_call_count++;
        bytes_decoded += bytes;
        return true;
    }
    bool record_error(jsonbcpp::ErrorKind kind) override {
        metric_call_count++;
        errors.push_back(kind);
        return true;
    }
};

// Test fixture to reset global state
struct ObservabilityTest : public ::testing::Test {
    void SetUp() override {
        // Ensure globals are reset to null implementations before each test
        jsonbcpp::set_logger(nullptr);
        jsonbcpp::set_metrics(nullptr);
        jsonbcpp::set_log_level_threshold(jsonbcpp::LogLevel::Info);
    }

    void TearDown() override {
        jsonbcpp::set_logger(nullptr);
        jsonbcpp::set_metrics(nullptr);
        jsonbcpp::set_log_level_threshold(jsonbcpp::LogLevel::Info);
    }
};

TEST_F(ObservabilityTest, DecodeFailureIsLoggedAndCounted) {
    MockLogger logger;
    MockMetrics metrics;
    jsonbcpp::set_logger(&logger);
    jsonbcpp::set_metrics(&metrics);

    // array whose second child claims 2 payload bytes but has 1
    jsonbcpp::Document doc = jsonbcpp::Document::from_hex("3b 00 27 61");
    jsonbcpp::Value root = doc.root();
    EXPECT_THROW(root.array(), jsonbcpp::decode_error);

    ASSERT_EQ(logger.logs.size(), 1u);
    EXPECT_EQ(logger.logs[0].level, jsonbcpp::LogLevel::Warn);
    EXPECT_EQ(logger.logs[0].operation, "DecodeHeader");
    EXPECT_EQ(logger.logs[0].buffer_offset, 2u);

    ASSERT_EQ(metrics.errors.size(), 1u);
    EXPECT_EQ(metrics.errors[0], jsonbcpp::ErrorKind::InvalidHeader);
    EXPECT_EQ(metrics.bytes_decoded, 4u);
}

TEST_F(ObservabilityTest, DebugMessagesFollowThreshold) {
    MockLogger logger;
    jsonbcpp::set_logger(&logger);

    jsonbcpp::Document doc = jsonbcpp::Document::from_hex("00");
    doc.root();
    EXPECT_EQ(logger.log_call_count.load(), 0);

    jsonbcpp::set_log_level_threshold(jsonbcpp::LogLevel::Debug);
    doc.root();
    EXPECT_EQ(logger.log_call_count.load(), 1);
    EXPECT_EQ(logger.logs[0].operation, "DocumentRoot");
}

TEST_F(ObservabilityTest, RenderingRecordsOperationStatus) {
    MockMetrics metrics;
    jsonbcpp::set_metrics(&metrics);

    jsonbcpp::Document good = jsonbcpp::Document::from_hex("2b 00 01");
    EXPECT_EQ(jsonbcpp::jsonb_json::to_json_string(good.root()), "[null,true]");

    jsonbcpp::Document reserved = jsonbcpp::Document::from_hex("0d");
    EXPECT_THROW(jsonbcpp::jsonb_json::to_json_string(reserved.root()), jsonbcpp::decode_error);

    std::vector<std::pair<std::string, std::string>> to_json;
    for (const auto& op : metrics.operations) {
        if (op.first == "ToJson") {
            to_json.push_back(op);
        }
    }
    ASSERT_EQ(to_json.size(), 2u);
    EXPECT_EQ(to_json[0].second, "ok");
    EXPECT_EQ(to_json[1].second, "error");
    ASSERT_EQ(metrics.errors.size(), 1u);
    EXPECT_EQ(metrics.errors[0], jsonbcpp::ErrorKind::UnhandledType);
}

TEST_F(ObservabilityTest, ThreadSafetySetLogger) {
    MockLogger mock_logger1;
    MockLogger mock_logger2;
    const int num_threads = 100;
    std::vector<std::thread> threads;

    std::atomic<int> ready_threads = 0;
    std::atomic<bool> start_test = false;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            ready_threads++;
            while (!start_test) {
                std::this_thread::yield(); // Wait for signal to start
            }
            if (i % 2 == 0) {
                jsonbcpp::set_logger(&mock_logger1);
            } else {
                jsonbcpp::set_logger(&mock_logger2);
            }
        });
    }

    // Wait for all threads to be ready
    while (ready_threads < num_threads) {
        std::this_thread::yield();
    }

    // Signal all threads to start concurrently
    start_test = true;

    for (auto& t : threads) {
        t.join();
    }

    ASSERT_NE(jsonbcpp::g_logger.load(std::memory_order_acquire), nullptr);
}

TEST_F(ObservabilityTest, ThreadSafetySetMetrics) {
    MockMetrics mock_metrics1;
    MockMetrics mock_metrics2;
    const int num_threads = 100;
    std::vector<std::thread> threads;

    std::atomic<int> ready_threads = 0;
    std::atomic<bool> start_test = false;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            ready_threads++;
            while (!start_test) {
                std::this_thread::yield();
            }
            if (i % 2 == 0) {
                jsonbcpp::set_metrics(&mock_metrics1);
            } else {
                jsonbcpp::set_metrics(&mock_metrics2);
            }
        });
    }

    while (ready_threads < num_threads) {
        std::this_thread::yield();
    }
    start_test = true;

    for (auto& t : threads) {
        t.join();
    }

    ASSERT_NE(jsonbcpp::g_metrics.load(std::memory_order_acquire), nullptr);
}
