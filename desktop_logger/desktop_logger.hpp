#ifndef MAVTRACK_LOGGER_HPP
#define MAVTRACK_LOGGER_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>

/**
 * mavtrack logger - zf_log output backend with std::mutex support and log rotation
 *
 * Basic Usage:
 *   auto ret = mavtrack::start_logging("/var/log/mavtrack.log");
 *   mavtrack::set_log_level(mavtrack::LOG_INFO);
 *
 *   // Use zf_log macros
 *   ZF_LOGI("Bridge started");
 *
 * Log Rotation:
 *   // 5MB files, keep 3 backups
 *   mavtrack::enable_log_rotation(5 * 1024 * 1024, 3);
 *
 *   // Files: log.txt (current), log.txt.1, log.txt.2, log.txt.3
 *   // When rotating: log.txt -> log.txt.1, oldest (log.txt.3) is deleted
 */

namespace mavtrack {

// === Colors for terminal ===
constexpr const char* COLOR_RED = "\x1b[31m";
constexpr const char* COLOR_YELLOW = "\x1b[33m";
constexpr const char* COLOR_WHITE = "\x1b[37m";
constexpr const char* COLOR_GREEN = "\x1b[32m";
constexpr const char* COLOR_BLUE = "\x1b[34m";
constexpr const char* COLOR_RESET = "\x1b[0m";
constexpr const char* COLOR_DARK_RED = "\x1b[31;1m";

struct LogRotationConfig {
    size_t max_file_size = 10 * 1024 * 1024;  // 10MB default
    int max_backup_files = 5;
    bool enabled = false;
};

// === Return codes ===
enum logger_retval_enum {
    LOGGER_SUCCESS = 0,
    LOGGER_FILEPATH_EMPTY,
    LOGGER_ALREADY_STARTED,
    LOGGER_NOT_STARTED,
    LOGGER_COULD_NOT_OPEN_FILE,
    LOGGER_FILE_PTR_IS_NULL,
    LOGGER_FILE_FAILED_FLUSH,
    LOGGER_FILE_INVALID_FD,
    LOGGER_FILE_NOT_SYNCED,
};

// main.cpp @ line: 42 instead of the full build path
inline const char* filename(const char* file) noexcept {
    const char* slash = std::strrchr(file, '/');
    const char* backslash = std::strrchr(file, '\\');
    return slash ? slash + 1 : (backslash ? backslash + 1 : file);
}

// Log level constants (matching zf_log values)
constexpr int LOG_VERBOSE = 1;
constexpr int LOG_DEBUG   = 2;
constexpr int LOG_INFO    = 3;
constexpr int LOG_WARN    = 4;
constexpr int LOG_ERROR   = 5;
constexpr int LOG_FATAL   = 6;

// -v count on the command line: 0 -> WARN, 1 -> INFO, 2+ -> DEBUG
constexpr int log_level_from_verbosity(int verbosity) {
    return verbosity >= 2 ? LOG_DEBUG : (verbosity == 1 ? LOG_INFO : LOG_WARN);
}

// A null or empty path logs to stdout only
logger_retval_enum start_logging(const char *log_filepath = nullptr) noexcept;
logger_retval_enum reset_logfile(const char *log_filepath) noexcept;
void close_log_file() noexcept;
logger_retval_enum verify_logfile() noexcept;
const char* logger_retval_to_cstr(logger_retval_enum enum_val) noexcept;
void set_log_level(int level) noexcept;

void enable_log_rotation(size_t max_file_size = 10 * 1024 * 1024, int max_backups = 5) noexcept;
void disable_log_rotation() noexcept;

} // namespace mavtrack

// Kept as macros for __FILE__ and __LINE__
#if RELEASE_MODE
    #define ZF_ADD_LOCATION(msg, ...) "%s: " msg, mavtrack::filename(__FILE__), ##__VA_ARGS__
#else
    #define ZF_ADD_LOCATION(msg, ...) "%s @ line: %d: " msg, mavtrack::filename(__FILE__), __LINE__, ##__VA_ARGS__
#endif

#endif // MAVTRACK_LOGGER_HPP
