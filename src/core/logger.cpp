/**
 * @file logger.cpp
 * @brief Implementation of Logger class
 */

#include "snipq/logger.h"

#include <cerrno>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>

namespace snipq {

Logger::Logger(const std::string& log_dir)
    : log_dir_(log_dir) {
    if (!log_dir_.empty() && !createDirectory(log_dir_)) {
        // Could not create the directory; disable rather than fail every write
        log_dir_.clear();
    }
}

std::string Logger::logPath() const {
    if (log_dir_.empty()) {
        return "";
    }
    return log_dir_ + "/server.log";
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

bool Logger::createDirectory(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    size_t pos = 0;
    std::string current_path;

    while ((pos = path.find('/', pos + 1)) != std::string::npos) {
        current_path = path.substr(0, pos);
        if (!current_path.empty()) {
            struct stat st;
            if (stat(current_path.c_str(), &st) != 0) {
                if (mkdir(current_path.c_str(), 0755) != 0 && errno != EEXIST) {
                    return false;
                }
            }
        }
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
    }

    return true;
}

void Logger::log(const std::string& level, const std::string& message) {
    if (log_dir_.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::ofstream log_file(logPath(), std::ios::app);
    if (log_file.is_open()) {
        log_file << "[" << timestamp() << "] [" << level << "] " << message << "\n";
        log_file.flush();
    }
}

} // namespace snipq
