#include "desktop_logger.hpp"
#include "zf_log.h"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>
#include <atomic>
#include <fcntl.h>
#include <unistd.h>

namespace {

FILE* g_log_file = nullptr;
bool g_logger_started = false;
std::mutex g_log_mutex;
std::string g_log_filepath;
mavtrack::LogRotationConfig g_rotation;
std::atomic<bool> g_shutting_down{false};
bool g_stdout_is_tty = false;

void unguarded_close_log_file() noexcept {
    if (g_log_file) {
        fclose(g_log_file);
    }
    g_log_file = nullptr;
}

// bridge.log -> bridge.log.1 -> bridge.log.2 ...; the highest backup is dropped
void rotate_log_files() noexcept {
    if (g_log_filepath.empty() || !g_log_file) return;

    fclose(g_log_file);
    g_log_file = nullptr;

    std::string oldest = g_log_filepath + "." + std::to_string(g_rotation.max_backup_files);
    std::remove(oldest.c_str());

    for (int i = g_rotation.max_backup_files - 1; i > 0; --i) {
        std::string from = g_log_filepath + "." + std::to_string(i);
        std::string to = g_log_filepath + "." + std::to_string(i + 1);
        std::rename(from.c_str(), to.c_str());
    }
    std::rename(g_log_filepath.c_str(), (g_log_filepath + ".1").c_str());

    // Reopens the same file if the rename failed
    g_log_file = fopen(g_log_filepath.c_str(), "a");
    if (!g_log_file) {
        g_rotation.enabled = false;
    }
}

void rotate_if_needed() noexcept {
    if (!g_rotation.enabled || !g_log_file) return;

    fflush(g_log_file);
    long file_size = -1;
    int fd = fileno(g_log_file);
    if (fd >= 0) {
        off_t end = lseek(fd, 0, SEEK_END);
        file_size = static_cast<long>(end);
    }
    if (file_size < 0) return;

    if (static_cast<size_t>(file_size) >= g_rotation.max_file_size) {
        rotate_log_files();
    }
}

void thread_safe_close_log_file() noexcept {
    g_shutting_down = true;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    unguarded_close_log_file();
}

void zf_output_callback(const zf_log_message *msg, void *arg) {
    (void)arg;

    if (g_shutting_down.load(std::memory_order_relaxed)) {
        return;
    }

    thread_local char time_str[64];
    thread_local struct tm tm_buf;

    time_t t = time(nullptr);
    struct tm *tm = localtime_r(&t, &tm_buf);
    if (tm == nullptr) {
        time_str[0] = '\0';
    } else {
        strftime(time_str, sizeof(time_str), "%Y-%m-%dT%H:%M:%S%z", tm);
    }

    const char *color, *lvl_str;
    switch (msg->lvl) {
        case ZF_LOG_VERBOSE: color = mavtrack::COLOR_GREEN; lvl_str = "VERBOSE"; break;
        case ZF_LOG_DEBUG: color = mavtrack::COLOR_BLUE; lvl_str = "DEBUG"; break;
        case ZF_LOG_INFO: color = mavtrack::COLOR_WHITE; lvl_str = "INFO"; break;
        case ZF_LOG_WARN: color = mavtrack::COLOR_YELLOW; lvl_str = "WARNING"; break;
        case ZF_LOG_ERROR: color = mavtrack::COLOR_RED; lvl_str = "ERROR"; break;
        case ZF_LOG_FATAL: color = mavtrack::COLOR_DARK_RED; lvl_str = "CRITICAL"; break;
        default: color = mavtrack::COLOR_WHITE; lvl_str = "NOTSET"; break;
    }

    const int body_len = static_cast<int>(msg->p - msg->msg_b);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_stdout_is_tty) {
        fprintf(stdout, "%s%s %s:mavtrack: %.*s%s\n",
            color, time_str, lvl_str, body_len, msg->msg_b, mavtrack::COLOR_RESET);
    } else {
        fprintf(stdout, "%s %s:mavtrack: %.*s\n", time_str, lvl_str, body_len, msg->msg_b);
    }
    fflush(stdout);

    if (g_log_file) {
        rotate_if_needed();
        if (g_log_file) {
            fprintf(g_log_file, "%s %s:mavtrack: %.*s\n", time_str, lvl_str, body_len, msg->msg_b);
            fflush(g_log_file);
        }
    }
}

} // namespace

namespace mavtrack {

logger_retval_enum reset_logfile(const char *log_filepath) noexcept {
    if (!log_filepath || log_filepath[0] == '\0') return LOGGER_FILEPATH_EMPTY;
    if (!g_logger_started) return LOGGER_NOT_STARTED;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    unguarded_close_log_file();

    try {
        g_log_filepath = log_filepath;
    } catch (const std::bad_alloc&) {
        return LOGGER_COULD_NOT_OPEN_FILE;
    }
    g_log_file = fopen(log_filepath, "a");
    if (!g_log_file) {
        g_log_filepath.clear();
        return LOGGER_COULD_NOT_OPEN_FILE;
    }

    return LOGGER_SUCCESS;
}

logger_retval_enum verify_logfile() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    if (!g_log_file) {
        return LOGGER_FILE_PTR_IS_NULL;
    }

    if (fflush(g_log_file) != 0) {
        unguarded_close_log_file();
        return LOGGER_FILE_FAILED_FLUSH;
    }

    int fd = fileno(g_log_file);
    if (fd < 0 || fcntl(fd, F_GETFL) == -1) {
        unguarded_close_log_file();
        return LOGGER_FILE_INVALID_FD;
    }

    if (fsync(fd) != 0) {
        unguarded_close_log_file();
        return LOGGER_FILE_NOT_SYNCED;
    }

    return LOGGER_SUCCESS;
}

logger_retval_enum start_logging(const char *log_filepath) noexcept {
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (g_logger_started) {
            return LOGGER_ALREADY_STARTED;
        }

        g_stdout_is_tty = isatty(fileno(stdout)) == 1;
        zf_log_set_output_v(ZF_LOG_PUT_STD, nullptr, zf_output_callback);
        g_logger_started = true;
        atexit(thread_safe_close_log_file);
    }

    if (log_filepath && log_filepath[0] != '\0') {
        return reset_logfile(log_filepath);
    }
    return LOGGER_SUCCESS;
}

const char* logger_retval_to_cstr(logger_retval_enum enum_val) noexcept {
    switch (enum_val) {
        case LOGGER_SUCCESS: return "LOGGER_SUCCESS";
        case LOGGER_FILEPATH_EMPTY: return "LOGGER_FILEPATH_EMPTY";
        case LOGGER_ALREADY_STARTED: return "LOGGER_ALREADY_STARTED";
        case LOGGER_NOT_STARTED: return "LOGGER_NOT_STARTED";
        case LOGGER_COULD_NOT_OPEN_FILE: return "LOGGER_COULD_NOT_OPEN_FILE";
        case LOGGER_FILE_PTR_IS_NULL: return "LOGGER_FILE_PTR_IS_NULL";
        case LOGGER_FILE_FAILED_FLUSH: return "LOGGER_FILE_FAILED_FLUSH";
        case LOGGER_FILE_INVALID_FD: return "LOGGER_FILE_INVALID_FD";
        case LOGGER_FILE_NOT_SYNCED: return "LOGGER_FILE_NOT_SYNCED";
        default: return "UNKNOWN";
    }
}

void close_log_file() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    unguarded_close_log_file();
}

void set_log_level(int level) noexcept {
    zf_log_set_output_level(level);
}

void enable_log_rotation(size_t max_file_size, int max_backups) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    if (max_file_size < 1024) {
        max_file_size = 1024;
    }
    if (max_backups < 1) {
        max_backups = 1;
    } else if (max_backups > 100) {
        max_backups = 100;
    }

    g_rotation.enabled = true;
    g_rotation.max_file_size = max_file_size;
    g_rotation.max_backup_files = max_backups;
}

void disable_log_rotation() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_rotation.enabled = false;
}

} // namespace mavtrack
