#include "Log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

// --- Global Logging System ---
std::shared_mutex g_log_mutex;
std::deque<std::string> g_logs;
bool g_log_show_ingress = true;
bool g_log_show_egress = true;
const size_t g_log_max_lines = 1000;

void AddLog(const std::string& msg, LogType type) {
    std::lock_guard<std::shared_mutex> lock(g_log_mutex);
    if (type == LogType::INGRESS && !g_log_show_ingress) return;
    if (type == LogType::EGRESS && !g_log_show_egress) return;
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &in_time_t);
#else
    localtime_r(&in_time_t, &tm_buf);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%H:%M:%S");
    std::string line = "[" + ss.str() + "] " + msg;
    std::cout << line << std::endl;
    g_logs.push_back(std::move(line));
    if (g_logs.size() > g_log_max_lines) {
        g_logs.pop_front();
    }
}

void GetLogs(std::vector<std::string>& logs) {
    std::shared_lock<std::shared_mutex> lock(g_log_mutex);
    logs.assign(g_logs.begin(), g_logs.end());
}
