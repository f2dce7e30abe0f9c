/**
 * Tests for AsyncLogger: synchronous fallback, level filter, background drain
 */

#include "../include/logging/async_logger.hpp"
#include "test_helpers.hpp"

#include <cstring>
#include <thread>
#include <vector>

using namespace edgeloop::logging;
using edgeloop::testing::CapturingLogger;

TEST(writes_synchronously_when_not_started) {
    CapturingLogger cap;
    EL_LOG_INFO(cap.logger, LogCategory::System, "hello");
    ASSERT_EQ(cap.entries.size(), 1u);
    ASSERT_EQ(std::string(cap.entries[0].message), std::string("hello"));
    ASSERT_EQ(cap.entries[0].category, LogCategory::System);
    ASSERT_EQ(cap.logger.pending_count(), 0u);
}

TEST(level_filter) {
    CapturingLogger cap;
    cap.logger.set_min_level(LogLevel::Warn);
    EL_LOG_DEBUG(cap.logger, LogCategory::Store, "debug");
    EL_LOG_INFO(cap.logger, LogCategory::Store, "info");
    EL_LOG_WARN(cap.logger, LogCategory::Store, "warn");
    EL_LOG_ERROR(cap.logger, LogCategory::Store, "error");
    ASSERT_EQ(cap.entries.size(), 2u);
    ASSERT_EQ(cap.logger.total_logged(), 2u);
}

TEST(formatted_messages) {
    CapturingLogger cap;
    EL_LOGF_INFO(cap.logger, LogCategory::Regime, "regime.detected regime=%s confidence=%.2f", "TRENDING", 0.75);
    ASSERT_EQ(std::string(cap.entries.at(0).message), std::string("regime.detected regime=TRENDING confidence=0.75"));
}

TEST(long_messages_truncate) {
    CapturingLogger cap;
    std::string big(1000, 'x');
    EL_LOG_INFO(cap.logger, LogCategory::System, big.c_str());
    ASSERT_EQ(std::strlen(cap.entries.at(0).message), sizeof(LogEntry::message) - 1);
}

TEST(background_drain_flushes_on_stop) {
    CapturingLogger cap;
    cap.logger.start();
    ASSERT_TRUE(cap.logger.running());
    for (int i = 0; i < 100; ++i)
        EL_LOGF_INFO(cap.logger, LogCategory::Entry, "entry.plan n=%d", i);
    cap.logger.stop();
    ASSERT_FALSE(cap.logger.running());
    ASSERT_EQ(cap.entries.size() + cap.logger.dropped_count(), 100u);
    ASSERT_EQ(cap.logger.pending_count(), 0u);
}

TEST(concurrent_producers_while_started) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 5000;

    CapturingLogger cap;
    cap.logger.start();
    std::vector<std::thread> producers;
    for (int t = 0; t < THREADS; ++t) {
        producers.emplace_back([&cap, t]() {
            for (int i = 0; i < PER_THREAD; ++i)
                EL_LOGF_INFO(cap.logger, LogCategory::Store, "store.write thread=%d n=%d", t, i);
        });
    }
    for (auto& th : producers)
        th.join();
    cap.logger.stop();

    // Every accepted entry is delivered exactly once
    ASSERT_EQ(cap.entries.size(), cap.logger.total_logged());
    ASSERT_EQ(cap.logger.total_logged() + cap.logger.dropped_count(), static_cast<uint64_t>(THREADS * PER_THREAD));
    ASSERT_EQ(cap.logger.pending_count(), 0u);
    for (const auto& e : cap.entries)
        ASSERT_TRUE(std::strncmp(e.message, "store.write thread=", 19) == 0);
}

TEST(level_names) {
    ASSERT_EQ_ENUM(level_from_string("debug"), LogLevel::Debug);
    ASSERT_EQ_ENUM(level_from_string("warning"), LogLevel::Warn);
    ASSERT_EQ_ENUM(level_from_string("bogus", LogLevel::Error), LogLevel::Error);
    ASSERT_EQ(std::string(category_to_string(LogCategory::Calibration)), std::string("calibration"));
}

int main() {
    std::cout << "=== AsyncLogger Tests ===\n";

    RUN_TEST(writes_synchronously_when_not_started);
    RUN_TEST(level_filter);
    RUN_TEST(formatted_messages);
    RUN_TEST(long_messages_truncate);
    RUN_TEST(background_drain_flushes_on_stop);
    RUN_TEST(concurrent_producers_while_started);
    RUN_TEST(level_names);

    std::cout << "\nAll logger tests passed!\n";
    return 0;
}
