#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace edgeloop {
namespace logging {

enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

/**
 * Parse a config level name ("debug", "info", ...). Unknown names map to fallback.
 */
inline LogLevel level_from_string(const std::string& name, LogLevel fallback = LogLevel::Info) {
    if (name == "trace")
        return LogLevel::Trace;
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warn" || name == "warning")
        return LogLevel::Warn;
    if (name == "error")
        return LogLevel::Error;
    if (name == "fatal")
        return LogLevel::Fatal;
    return fallback;
}

// Category constants, one per component
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Store = 1;
constexpr uint8_t Calibration = 2;
constexpr uint8_t Weights = 3;
constexpr uint8_t Performance = 4;
constexpr uint8_t Regime = 5;
constexpr uint8_t Entry = 6;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Store:
        return "store";
    case LogCategory::Calibration:
        return "calibration";
    case LogCategory::Weights:
        return "weights";
    case LogCategory::Performance:
        return "performance";
    case LogCategory::Regime:
        return "regime";
    case LogCategory::Entry:
        return "entry";
    default:
        return "other";
    }
}

/**
 * Log Entry - fixed size, four cache lines.
 * Messages carry "event key=value ..." text, truncated to fit.
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // 8 bytes (wall clock)
    LogLevel level;        // 1 byte
    uint8_t category;      // 1 byte
    uint16_t reserved;     // 2 bytes padding
    uint32_t thread_id;    // 4 bytes
    char message[240];     // 240 bytes (null-terminated)
    // Total: 256 bytes

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Ring buffer between the logging threads and the drain thread.
 * One producer and one consumer at a time; AsyncLogger serialises each side.
 * One slot stays empty to tell full from empty.
 */
template <size_t Capacity = 4096>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {}

    /// False when full; the caller counts the drop
    bool try_push(const LogEntry& entry) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false;
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false;
        }

        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail + Capacity) & (Capacity - 1);
    }

private:
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    alignas(64) std::array<LogEntry, Capacity> buffer_{};
};

/**
 * Async Logger
 *
 * Two modes:
 *   - Not started (default): log() formats and writes on the calling thread.
 *   - Started: log() pushes into the ring buffer and a background thread
 *     drains it. Only the embedding application calls start().
 *
 * Safe to call log() from any number of threads in either mode.
 *
 * Usage:
 *   AsyncLogger logger;
 *   EL_LOGF_INFO(logger, LogCategory::Regime, "regime.detected regime=%s", name);
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * Start the background consumer thread
     */
    void start() {
        if (running_.exchange(true))
            return; // Already running

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the consumer thread and flush remaining entries
     */
    void stop() {
        if (running_.exchange(false)) {
            if (consumer_thread_.joinable()) {
                consumer_thread_.join();
            }
        }
        flush();
    }

    /**
     * Drain whatever is queued on the calling thread
     */
    void flush() {
        std::lock_guard<std::mutex> lock(consumer_mutex_);
        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    bool running() const { return running_.load(std::memory_order_acquire); }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level())
            return;

        LogEntry entry;
        entry.timestamp_ns = get_timestamp_ns();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        total_logged_.fetch_add(1, std::memory_order_relaxed);

        if (!running()) {
            std::lock_guard<std::mutex> lock(consumer_mutex_);
            output_entry(entry);
            return;
        }

        bool pushed;
        {
            std::lock_guard<std::mutex> lock(producer_mutex_);
            pushed = buffer_.try_push(entry);
        }
        if (!pushed) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
            total_logged_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    /**
     * Log with printf-style formatting
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level())
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }

    void set_output_callback(OutputCallback cb) {
        std::lock_guard<std::mutex> lock(consumer_mutex_);
        output_callback_ = std::move(cb);
    }

    // Statistics
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }

private:
    LogRingBuffer<4096> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    std::mutex producer_mutex_; // serialises pushes from logging threads
    std::mutex consumer_mutex_; // serialises the single consumer side
    std::atomic<LogLevel> min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        while (running_.load(std::memory_order_relaxed)) {
            {
                std::lock_guard<std::mutex> lock(consumer_mutex_);
                LogEntry entry;
                while (buffer_.try_pop(entry)) {
                    output_entry(entry);
                }
            }
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            auto ts_ms = entry.timestamp_ns / 1000000;
            std::fprintf(stderr, "[%llu.%03llu] [%s] [%s] %s\n", static_cast<unsigned long long>(ts_ms / 1000),
                         static_cast<unsigned long long>(ts_ms % 1000), level_to_string(entry.level),
                         category_to_string(entry.category), entry.message);
        }
    }

    static uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

/**
 * Process-wide logger used by components constructed without one.
 */
inline AsyncLogger& default_logger() {
    static AsyncLogger logger;
    return logger;
}

// Convenience macros
#define EL_LOG_DEBUG(logger, cat, msg) (logger).log(edgeloop::logging::LogLevel::Debug, cat, msg)
#define EL_LOG_INFO(logger, cat, msg) (logger).log(edgeloop::logging::LogLevel::Info, cat, msg)
#define EL_LOG_WARN(logger, cat, msg) (logger).log(edgeloop::logging::LogLevel::Warn, cat, msg)
#define EL_LOG_ERROR(logger, cat, msg) (logger).log(edgeloop::logging::LogLevel::Error, cat, msg)

// Printf-style variants
#define EL_LOGF_DEBUG(logger, cat, fmt, ...) (logger).logf(edgeloop::logging::LogLevel::Debug, cat, fmt, ##__VA_ARGS__)
#define EL_LOGF_INFO(logger, cat, fmt, ...) (logger).logf(edgeloop::logging::LogLevel::Info, cat, fmt, ##__VA_ARGS__)
#define EL_LOGF_WARN(logger, cat, fmt, ...) (logger).logf(edgeloop::logging::LogLevel::Warn, cat, fmt, ##__VA_ARGS__)
#define EL_LOGF_ERROR(logger, cat, fmt, ...) (logger).logf(edgeloop::logging::LogLevel::Error, cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace edgeloop
