#include "workpipe/logger/FileLogger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace workpipe {

FileLogger::FileLogger(const std::string& filepath, bool auto_flush)
    : auto_flush_(auto_flush), filepath_(filepath) {
    file_.open(filepath_, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "FileLogger: Failed to open log file: " << filepath_ << std::endl;
    }
}

FileLogger::~FileLogger() {
    if (file_.is_open()) {
        file_.close();
    }
}

void FileLogger::logMessage(std::string_view msg) {
    write("INFO", msg);
}

void FileLogger::logWarning(std::string_view msg) {
    write("WARN", msg);
}

void FileLogger::logError(std::string_view msg) {
    write("ERROR", msg);
}

void FileLogger::write(std::string_view level, std::string_view msg) {
    if (!file_.is_open()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    file_ << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
          << '.' << std::setfill('0') << std::setw(3) << ms.count()
          << " [" << level << "] " << msg << '\n';

    if (auto_flush_) {
        file_.flush();
    }
}

void FileLogger::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileLogger::reopen() {
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
    file_.open(filepath_, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "FileLogger: Failed to reopen log file: " << filepath_ << std::endl;
        return;
    }
    write("INFO", "Log file reopened");
}

} // namespace workpipe
