#ifndef FILE_LOGGER_HPP
#define FILE_LOGGER_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

/**
 * @brief Asynchronous two-file logger for vnc_guard
 *
 * Callers only enqueue; a single background thread formats, writes, flushes
 * and rotates, so the monitoring loop never blocks on disk I/O.
 *
 * SERVICE_LOG carries operational messages, AUDIT_LOG the attempt-audit trail
 * (bans, unbans, allow-list changes, sub-threshold failures). When the queue
 * overflows, service entries are shed before any audit record is.
 *
 * While the logger is not running, log calls are dropped.
 */
class FileLogger {
public:
    enum class LogLevel : uint8_t {
        LOG_DEBUG = 0,
        LOG_INFO = 1,
        LOG_WARNING = 2,
        LOG_ERROR = 3,
        LOG_CRITICAL = 4
    };

    enum class FileType : uint8_t {
        SERVICE_LOG = 0,
        AUDIT_LOG = 1
    };

    struct FileConfig {
        std::string file_path;
        size_t max_file_size = 20 * 1024 * 1024; // rotate past this many bytes
        int max_backup_files = 5;
        std::chrono::milliseconds flush_interval{2000};
        bool echo_to_console = false; // mirror entries on stderr
        LogLevel min_level = LogLevel::LOG_INFO;
    };

    struct LoggerMetrics {
        uint64_t total_entries;
        uint64_t dropped_entries;
        uint64_t file_rotations;
        size_t current_queue_size;
        bool is_running;
    };

    static constexpr size_t kDefaultMaxQueueSize = 10000;

    explicit FileLogger(size_t max_queue_size = kDefaultMaxQueueSize);
    ~FileLogger();

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    // Replaces the configuration of the given files and creates their
    // directories. Must be called while the logger is stopped.
    bool initialize(const std::unordered_map<FileType, FileConfig>& configs);
    void start();
    void stop();
    bool is_running() const { return running_.load(std::memory_order_acquire); }

    // Blocks until every queued entry has been written and flushed
    void drain(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    void log(LogLevel level, FileType file_type, const std::string& message,
             const char* source_file = nullptr, int line_number = 0);

    // Appends one record to the attempt-audit trail
    void write_audit_record(const std::string& record);

    LoggerMetrics get_metrics() const;

    static const char* log_level_to_string(LogLevel level);
    static const char* file_type_to_string(FileType type);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

private:
    struct LogEntry {
        LogLevel level;
        FileType file_type;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        const char* source_file;
        int line_number;
    };

    // One output file; only the writer thread touches stream/bytes/last_flush
    struct LogSink {
        FileConfig config;
        std::unique_ptr<std::ofstream> stream;
        uint64_t bytes_written = 0;
        bool dirty = false;
        std::chrono::steady_clock::time_point last_flush;
    };

    std::array<LogSink, 2> sinks_;
    const size_t max_queue_size_;

    std::atomic<bool> running_{false};
    bool stop_requested_ = false;  // guarded by queue_mutex_
    bool writing_ = false;         // a batch is being written; guarded by queue_mutex_
    std::thread writer_thread_;

    mutable std::mutex queue_mutex_;
    std::deque<LogEntry> queue_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;

    std::mutex console_mutex_;

    std::atomic<uint64_t> total_entries_{0};
    std::atomic<uint64_t> dropped_entries_{0};
    std::atomic<uint64_t> file_rotations_{0};

    LogSink& sink(FileType type) { return sinks_[static_cast<size_t>(type)]; }
    const LogSink& sink(FileType type) const { return sinks_[static_cast<size_t>(type)]; }

    void writer_loop();
    void write_entry(const LogEntry& entry);
    bool open_sink(LogSink& target);
    void close_sink(LogSink& target);
    void flush_sink(LogSink& target);
    void rotate_sink(LogSink& target);
    void shed_queue_locked();
    std::string format_entry(const LogEntry& entry) const;

    static bool ensure_parent_directory(const std::string& file_path);
};

// Macros for convenient logging with file/line information
#define FILE_LOG_DEBUG(logger, file_type, message) \
    (logger).log(FileLogger::LogLevel::LOG_DEBUG, file_type, message, __FILE__, __LINE__)

#define FILE_LOG_INFO(logger, file_type, message) \
    (logger).log(FileLogger::LogLevel::LOG_INFO, file_type, message, __FILE__, __LINE__)

#define FILE_LOG_WARNING(logger, file_type, message) \
    (logger).log(FileLogger::LogLevel::LOG_WARNING, file_type, message, __FILE__, __LINE__)

#define FILE_LOG_ERROR(logger, file_type, message) \
    (logger).log(FileLogger::LogLevel::LOG_ERROR, file_type, message, __FILE__, __LINE__)

// Service-log shorthands used throughout the engine
#define GUARD_LOG_DEBUG(message) \
    FILE_LOG_DEBUG(g_file_logger, FileLogger::FileType::SERVICE_LOG, message)
#define GUARD_LOG_INFO(message) \
    FILE_LOG_INFO(g_file_logger, FileLogger::FileType::SERVICE_LOG, message)
#define GUARD_LOG_WARNING(message) \
    FILE_LOG_WARNING(g_file_logger, FileLogger::FileType::SERVICE_LOG, message)
#define GUARD_LOG_ERROR(message) \
    FILE_LOG_ERROR(g_file_logger, FileLogger::FileType::SERVICE_LOG, message)

// Process-wide logger instance
extern FileLogger g_file_logger;

#endif // FILE_LOGGER_HPP
