// src/log.cpp
#include "log.h"
#include <atomic>
#include <mutex>
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstring>
#include <algorithm>

namespace mpay {

// ============================================================================
// Configuration
// ============================================================================
static std::atomic<LogLevel> g_log_level{LogLevel::INFO};
static std::atomic<uint32_t> g_log_categories{static_cast<uint32_t>(LogCategory::ALL)};
static std::atomic<bool> g_timestamps_enabled{true};

static std::mutex g_log_mutex;
static std::ofstream g_log_file;   // guarded by g_log_mutex

static const char* category_tag(LogCategory cat) {
    switch (cat) {
        case LogCategory::LEDGER:  return "ledger";
        case LogCategory::ESCROW:  return "escrow";
        case LogCategory::SPONSOR: return "sponsor";
        case LogCategory::CLIENT:  return "client";
        case LogCategory::MIRROR:  return "mirror";
        case LogCategory::NOTIFY:  return "notify";
        case LogCategory::DB:      return "db";
        case LogCategory::CONFIG:  return "config";
        default:                   return nullptr;
    }
}

static void format_timestamp(char* buf, size_t n) {
    using namespace std::chrono;
    const std::time_t tt = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::snprintf(buf, n, "%04d-%02d-%02d %02d:%02d:%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
}

static void write_line(const char* level, const char* tag, const std::string& msg) noexcept {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    try {
        std::string line;
        line.reserve(msg.size() + 48);
        line += '[';
        line += level;
        line += ']';
        if (g_timestamps_enabled.load(std::memory_order_relaxed)) {
            char ts[32];
            format_timestamp(ts, sizeof(ts));
            line += '[';
            line += ts;
            line += ']';
        }
        if (tag) {
            line += '[';
            line += tag;
            line += ']';
        }
        line += ' ';
        line += msg;

        const bool is_err = std::strcmp(level, "ERROR") == 0 || std::strcmp(level, "FATAL") == 0;
        std::ostream& os = is_err ? std::cerr : std::cout;
        os << line << '\n';
        if (g_log_file.is_open()) g_log_file << line << '\n';
    } catch (...) {
        // Never let logging take the process down
    }
}

static inline bool enabled(LogLevel lvl, LogCategory cat) {
    return g_log_level.load(std::memory_order_relaxed) <= lvl &&
           (g_log_categories.load(std::memory_order_relaxed) & static_cast<uint32_t>(cat)) != 0;
}

// ============================================================================
// Public API
// ============================================================================

void log_info(const std::string& m) {
    if (g_log_level.load(std::memory_order_relaxed) <= LogLevel::INFO) write_line("INFO", nullptr, m);
}

void log_warn(const std::string& m) {
    if (g_log_level.load(std::memory_order_relaxed) <= LogLevel::WARN) write_line("WARN", nullptr, m);
}

void log_error(const std::string& m) {
    if (g_log_level.load(std::memory_order_relaxed) <= LogLevel::ERR) write_line("ERROR", nullptr, m);
}

void log_trace(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::TRACE, cat)) write_line("TRACE", category_tag(cat), s);
}

void log_debug(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::DEBUG, cat)) write_line("DEBUG", category_tag(cat), s);
}

void log_info(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::INFO, cat)) write_line("INFO", category_tag(cat), s);
}

void log_warn(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::WARN, cat)) write_line("WARN", category_tag(cat), s);
}

void log_error(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::ERR, cat)) write_line("ERROR", category_tag(cat), s);
}

void log_fatal(LogCategory cat, const std::string& s) {
    if (enabled(LogLevel::FATAL, cat)) write_line("FATAL", category_tag(cat), s);
}

void log_set_level(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

void log_set_categories(uint32_t categories) {
    g_log_categories.store(categories, std::memory_order_relaxed);
}

void log_enable_timestamps(bool enable) {
    g_timestamps_enabled.store(enable, std::memory_order_relaxed);
}

LogLevel log_get_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

uint32_t log_get_categories() {
    return g_log_categories.load(std::memory_order_relaxed);
}

bool log_level_from_string(const std::string& s, LogLevel& out) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if (v == "trace") out = LogLevel::TRACE;
    else if (v == "debug") out = LogLevel::DEBUG;
    else if (v == "info") out = LogLevel::INFO;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "error" || v == "err") out = LogLevel::ERR;
    else if (v == "fatal") out = LogLevel::FATAL;
    else if (v == "none" || v == "off") out = LogLevel::NONE;
    else return false;
    return true;
}

bool log_enable_file(const std::string& filepath, std::string* err) {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    if (g_log_file.is_open()) g_log_file.close();
    if (filepath.empty()) return true;
    g_log_file.open(filepath, std::ios::out | std::ios::app);
    if (!g_log_file.is_open()) {
        if (err) *err = "cannot open log file " + filepath;
        return false;
    }
    return true;
}

void log_flush() {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::cout.flush();
    std::cerr.flush();
    if (g_log_file.is_open()) g_log_file.flush();
}

void log_init(LogLevel level, uint32_t categories, const std::string& log_file) {
    g_log_level.store(level, std::memory_order_relaxed);
    g_log_categories.store(categories, std::memory_order_relaxed);
    if (!log_file.empty()) {
        std::string err;
        if (!log_enable_file(log_file, &err)) log_warn(LogCategory::CONFIG, err);
    }
}

void log_shutdown() {
    log_flush();
    std::lock_guard<std::mutex> lk(g_log_mutex);
    if (g_log_file.is_open()) g_log_file.close();
}

}  // namespace mpay
