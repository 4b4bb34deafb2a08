// Log.h
#pragma once

#include <deque>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

enum class LogType {
    SYSTEM,  // Default, always show
    INGRESS, // Device -> Clients
    EGRESS   // Clients -> Device
};

// --- Global Logging System ---
extern std::shared_mutex g_log_mutex;
extern std::deque<std::string> g_logs;
extern bool g_log_show_ingress; // Show (Device -> Clients)
extern bool g_log_show_egress;  // Show (Clients -> Device)
extern const size_t g_log_max_lines; // Max log lines kept in memory

void AddLog(const std::string& msg, LogType type = LogType::SYSTEM);
void GetLogs(std::vector<std::string>& logs);
