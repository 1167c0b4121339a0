// utils.hpp
#pragma once

#include <chrono>
#include <atomic>
#include <mutex>
#include <string>

namespace eventposter {

// Shared stop flag for a batch of renders and its network transfers.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    double elapsed_ms() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Simple logger, safe to call from render workers
class Logger {
public:
    enum Level {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    static void log(Level level, const std::string& message);
    static void setLevel(Level level) { min_level_ = level; }
    static Level level() { return min_level_; }

private:
    static std::atomic<Level> min_level_;
    static std::mutex mutex_;
};

} // namespace eventposter
