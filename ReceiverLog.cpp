#include "ReceiverLog.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

// --- Global Logging State ---
std::mutex g_log_mutex;
std::deque<std::string> g_logs;
std::atomic<bool> g_log_show_ingress{ true };
std::atomic<bool> g_log_to_console{ false };
std::atomic<int> g_log_min_level{ static_cast<int>(LogLevel::Info) };
const size_t g_log_max_lines = 1000;

const char* LogLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "?";
}

bool IsLogEnabled(LogType type, LogLevel level) {
    if (static_cast<int>(level) < g_log_min_level.load()) return false;
    if (type == LogType::INGRESS && !g_log_show_ingress.load()) return false;
    return true;
}

void AddLog(const std::string& msg, LogType type, LogLevel level) {
    if (!IsLogEnabled(type, level)) return;

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf; // Structure to hold the time
#ifdef _WIN32
    localtime_s(&tm_buf, &in_time_t);
#else
    localtime_r(&in_time_t, &tm_buf);
#endif
    std::stringstream ss;
    ss << "[" << std::put_time(&tm_buf, "%H:%M:%S") << "] [" << LogLevelName(level) << "] " << msg;
    std::string line = ss.str();

    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_logs.push_back(line);
    if (g_logs.size() > g_log_max_lines) {
        g_logs.pop_front();
    }
    if (g_log_to_console.load()) {
        if (level >= LogLevel::Warning) std::cerr << line << std::endl;
        else std::cout << line << std::endl;
    }
}

void GetLogs(std::vector<std::string>& logs) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    logs.assign(g_logs.begin(), g_logs.end());
}

void ClearLogs() {
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_logs.clear();
    }
    AddLog("Log cleared.");
}
