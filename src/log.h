// =============================================================================
// LOGGING
// =============================================================================

#pragma once
#include <string>
#include <cstdint>

namespace mpay {

// Note: ERR instead of ERROR to stay clear of the Windows ERROR macro
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERR   = 4,
    FATAL = 5,
    NONE  = 6
};

// Log categories for filtering
enum class LogCategory : uint32_t {
    GENERAL = 0x0001,
    LEDGER  = 0x0002,
    ESCROW  = 0x0004,
    SPONSOR = 0x0008,
    CLIENT  = 0x0010,
    MIRROR  = 0x0020,
    NOTIFY  = 0x0040,
    DB      = 0x0080,
    CONFIG  = 0x0100,
    ALL     = 0xFFFF
};

// Configuration
void log_set_level(LogLevel level);
void log_set_categories(uint32_t categories);
void log_enable_timestamps(bool enable);
// Append every line to `filepath` as well as the console. Empty path disables.
bool log_enable_file(const std::string& filepath, std::string* err = nullptr);

LogLevel log_get_level();
uint32_t log_get_categories();

// "trace" / "debug" / "info" / "warn" / "error" / "fatal" / "none"
bool log_level_from_string(const std::string& s, LogLevel& out);

// Uncategorized
void log_info(const std::string& s);
void log_warn(const std::string& s);
void log_error(const std::string& s);

// Categorized
void log_trace(LogCategory cat, const std::string& s);
void log_debug(LogCategory cat, const std::string& s);
void log_info(LogCategory cat, const std::string& s);
void log_warn(LogCategory cat, const std::string& s);
void log_error(LogCategory cat, const std::string& s);
void log_fatal(LogCategory cat, const std::string& s);

// Conditional logging (avoids string construction if level is disabled)
#define MPAY_LOG_TRACE(cat, msg) do { \
    if (mpay::log_get_level() <= mpay::LogLevel::TRACE && \
        (mpay::log_get_categories() & static_cast<uint32_t>(cat))) { \
        mpay::log_trace(cat, msg); \
    } \
} while(0)

#define MPAY_LOG_DEBUG(cat, msg) do { \
    if (mpay::log_get_level() <= mpay::LogLevel::DEBUG && \
        (mpay::log_get_categories() & static_cast<uint32_t>(cat))) { \
        mpay::log_debug(cat, msg); \
    } \
} while(0)

#define MPAY_LOG_INFO(cat, msg) do { \
    if (mpay::log_get_level() <= mpay::LogLevel::INFO && \
        (mpay::log_get_categories() & static_cast<uint32_t>(cat))) { \
        mpay::log_info(cat, msg); \
    } \
} while(0)

#define MPAY_LOG_WARN(cat, msg) do { \
    if (mpay::log_get_level() <= mpay::LogLevel::WARN && \
        (mpay::log_get_categories() & static_cast<uint32_t>(cat))) { \
        mpay::log_warn(cat, msg); \
    } \
} while(0)

#define MPAY_LOG_ERROR(cat, msg) do { \
    if (mpay::log_get_level() <= mpay::LogLevel::ERR && \
        (mpay::log_get_categories() & static_cast<uint32_t>(cat))) { \
        mpay::log_error(cat, msg); \
    } \
} while(0)

void log_flush();

void log_init(LogLevel level = LogLevel::INFO,
              uint32_t categories = static_cast<uint32_t>(LogCategory::ALL),
              const std::string& log_file = "");

// Flush and close the file sink
void log_shutdown();

}  // namespace mpay
