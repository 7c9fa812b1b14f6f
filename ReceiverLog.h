// ReceiverLog.h
#pragma once

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <atomic>
#include <cstddef>

enum class LogType {
    SYSTEM,    // Default, always show
    INGRESS,   // Datagram -> Registry
    LIFECYCLE  // Listener / sweeper start and stop
};

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

// True when a line of this type and level would be kept; lets callers skip building it.
bool IsLogEnabled(LogType type, LogLevel level);
void AddLog(const std::string& msg, LogType type = LogType::SYSTEM, LogLevel level = LogLevel::Info);

// --- Snapshot / maintenance helpers ---
void GetLogs(std::vector<std::string>& logs);
void ClearLogs();
const char* LogLevelName(LogLevel level);

// --- Global Logging State ---
extern std::mutex g_log_mutex;
extern std::deque<std::string> g_logs;
extern std::atomic<bool> g_log_show_ingress; // Show (Datagram -> Registry)
extern std::atomic<bool> g_log_to_console;   // Echo each line to stdout / stderr
extern std::atomic<int> g_log_min_level;     // Lines below this LogLevel are dropped
extern const size_t g_log_max_lines;         // Max log lines kept in memory
