// utils.cpp
#include "utils.hpp"
#include <iostream>
#include <iomanip>
#include <ctime>

namespace eventposter {

std::atomic<Logger::Level> Logger::min_level_{Logger::INFO};
std::mutex Logger::mutex_;

void Logger::log(Level level, const std::string& message) {
    if (level < min_level_.load()) return;

    const char* level_str[] = {"DEBUG", "INFO", "WARN", "ERROR"};

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[" << std::put_time(&local_tm, "%H:%M:%S");
    std::cout << "." << std::setfill('0') << std::setw(3) << ms.count();
    std::cout << "] [" << level_str[level] << "] " << message << std::endl;
}

} // namespace eventposter
