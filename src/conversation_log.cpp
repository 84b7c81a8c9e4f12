#include "conversation_log.h"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::tm local_now() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm now_tm{};
    localtime_r(&now, &now_tm);
    return now_tm;
}

bool write_marker(const std::string& log_file, const std::string& what) {
    std::ofstream log(log_file, std::ios::app);
    if (!log) {
        return false;
    }
    std::tm now_tm = local_now();
    log << "=== Session " << what << " at " << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S") << " ===" << std::endl;
    return static_cast<bool>(log);
}

} // namespace

std::string default_log_file_name() {
    std::tm now_tm = local_now();
    std::ostringstream name;
    name << "relay_" << std::put_time(&now_tm, "%Y%m%d_%H%M%S") << ".log";
    return name.str();
}

void log_conversation(const std::string& log_file, const std::string& speaker, const std::string& message) {
    if (log_file.empty()) return;

    std::ofstream log(log_file, std::ios::app);
    if (!log) {
        std::cerr << "Error: Failed to open log file: " << log_file << std::endl;
        return;
    }

    std::tm now_tm = local_now();
    log << "[" << std::put_time(&now_tm, "%H:%M:%S") << "] " << speaker << ": " << message << std::endl;
}

bool begin_conversation_log(const std::string& log_file) {
    if (!write_marker(log_file, "started")) {
        std::cerr << "Error: Cannot write to log file at " << log_file << std::endl;
        return false;
    }
    return true;
}

void end_conversation_log(const std::string& log_file) {
    if (log_file.empty()) return;
    if (!write_marker(log_file, "ended")) {
        std::cerr << "Warning: Could not write session end marker to " << log_file << std::endl;
    }
}
