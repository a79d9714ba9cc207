#include "file_logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

FileLogger g_file_logger;

FileLogger::FileLogger(size_t max_queue_size)
    : max_queue_size_(max_queue_size == 0 ? 1 : max_queue_size) {
    LogSink& service = sink(FileType::SERVICE_LOG);
    service.config.file_path = "/var/log/vnc-guard/vnc-guard.log";

    // The audit trail is small and precious: keep more history, flush sooner
    LogSink& audit = sink(FileType::AUDIT_LOG);
    audit.config.file_path = "/var/log/vnc-protection.log";
    audit.config.max_file_size = 50 * 1024 * 1024;
    audit.config.max_backup_files = 10;
    audit.config.flush_interval = std::chrono::milliseconds(500);
    audit.config.min_level = LogLevel::LOG_DEBUG;
}

FileLogger::~FileLogger() {
    stop();
}

bool FileLogger::initialize(const std::unordered_map<FileType, FileConfig>& configs) {
    if (is_running()) {
        return false;
    }

    bool ok = true;
    for (const auto& [type, config] : configs) {
        sink(type).config = config;
        if (!ensure_parent_directory(config.file_path)) {
            ok = false;
        }
    }
    return ok;
}

void FileLogger::start() {
    if (running_.load(std::memory_order_acquire)) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    for (auto& target : sinks_) {
        target.last_flush = now;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_requested_ = false;
    }
    running_.store(true, std::memory_order_release);
    writer_thread_ = std::thread(&FileLogger::writer_loop, this);
}

void FileLogger::stop() {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_requested_ = true;
    }
    queue_cv_.notify_all();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    running_.store(false, std::memory_order_release);

    for (auto& target : sinks_) {
        close_sink(target);
    }
}

void FileLogger::drain(std::chrono::milliseconds timeout) {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.notify_one();
    drained_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !writing_; });
}

void FileLogger::log(LogLevel level, FileType file_type, const std::string& message,
                     const char* source_file, int line_number) {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    // Config is frozen while running, so no lock is needed to read it
    if (level < sink(file_type).config.min_level) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.size() >= max_queue_size_) {
            shed_queue_locked();
        }
        queue_.push_back(LogEntry{level, file_type, message, std::chrono::system_clock::now(),
                                  source_file, line_number});
        total_entries_.fetch_add(1, std::memory_order_relaxed);
    }
    queue_cv_.notify_one();
}

void FileLogger::write_audit_record(const std::string& record) {
    log(LogLevel::LOG_INFO, FileType::AUDIT_LOG, record);
}

FileLogger::LoggerMetrics FileLogger::get_metrics() const {
    LoggerMetrics metrics;
    metrics.total_entries = total_entries_.load(std::memory_order_relaxed);
    metrics.dropped_entries = dropped_entries_.load(std::memory_order_relaxed);
    metrics.file_rotations = file_rotations_.load(std::memory_order_relaxed);
    metrics.is_running = running_.load(std::memory_order_acquire);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        metrics.current_queue_size = queue_.size();
    }
    return metrics;
}

const char* FileLogger::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG: return "DEBUG";
        case LogLevel::LOG_INFO: return "INFO";
        case LogLevel::LOG_WARNING: return "WARNING";
        case LogLevel::LOG_ERROR: return "ERROR";
        case LogLevel::LOG_CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

const char* FileLogger::file_type_to_string(FileType type) {
    switch (type) {
        case FileType::SERVICE_LOG: return "SERVICE_LOG";
        case FileType::AUDIT_LOG: return "AUDIT_LOG";
        default: return "UNKNOWN";
    }
}

std::string FileLogger::format_timestamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    struct tm local {};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void FileLogger::writer_loop() {
    std::deque<LogEntry> batch;

    for (;;) {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, std::chrono::milliseconds(100), [this] {
                return !queue_.empty() || stop_requested_;
            });
            batch.swap(queue_);
            writing_ = !batch.empty();
            stopping = stop_requested_ && batch.empty();
        }

        for (const auto& entry : batch) {
            write_entry(entry);
        }
        batch.clear();

        // Flush on going idle; under sustained load, every flush_interval
        bool idle = false;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            idle = queue_.empty();
        }

        auto now = std::chrono::steady_clock::now();
        for (auto& target : sinks_) {
            if (target.dirty &&
                (idle || now - target.last_flush >= target.config.flush_interval)) {
                flush_sink(target);
                target.last_flush = now;
            }
            if (target.stream && target.config.max_file_size > 0 &&
                target.bytes_written >= target.config.max_file_size) {
                rotate_sink(target);
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty()) {
                writing_ = false;
                drained_cv_.notify_all();
            }
        }

        if (stopping) {
            break;
        }
    }
}

void FileLogger::write_entry(const LogEntry& entry) {
    LogSink& target = sink(entry.file_type);
    std::string line = format_entry(entry);

    if (target.config.echo_to_console) {
        std::lock_guard<std::mutex> console_lock(console_mutex_);
        std::cerr << line << '\n';
    }

    if (!open_sink(target)) {
        dropped_entries_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    *target.stream << line << '\n';
    if (!*target.stream) {
        std::cerr << "FileLogger: write to " << target.config.file_path << " failed\n";
        dropped_entries_.fetch_add(1, std::memory_order_relaxed);
        close_sink(target);
        return;
    }
    target.bytes_written += line.size() + 1;
    target.dirty = true;

    // Failures are flushed at once so they survive a crash
    if (entry.level >= LogLevel::LOG_ERROR) {
        flush_sink(target);
    }
}

bool FileLogger::open_sink(LogSink& target) {
    if (target.stream && target.stream->is_open()) {
        return true;
    }
    if (target.config.file_path.empty()) {
        return false;
    }

    ensure_parent_directory(target.config.file_path);
    auto stream = std::make_unique<std::ofstream>(target.config.file_path, std::ios::app);
    if (!stream->is_open()) {
        std::cerr << "FileLogger: cannot open " << target.config.file_path << ": "
                  << std::strerror(errno) << '\n';
        return false;
    }

    std::error_code ec;
    auto existing = std::filesystem::file_size(target.config.file_path, ec);
    target.bytes_written = ec ? 0 : static_cast<uint64_t>(existing);
    target.stream = std::move(stream);
    return true;
}

void FileLogger::close_sink(LogSink& target) {
    if (target.stream) {
        target.stream->flush();
        target.stream->close();
        target.stream.reset();
    }
    target.dirty = false;
}

void FileLogger::flush_sink(LogSink& target) {
    if (target.stream) {
        target.stream->flush();
    }
    target.dirty = false;
}

void FileLogger::rotate_sink(LogSink& target) {
    close_sink(target);

    const std::string& base = target.config.file_path;
    const int keep = target.config.max_backup_files;
    auto backup = [&base](int n) { return base + "." + std::to_string(n); };

    // base.N falls off, base.(N-1) -> base.N, ..., base -> base.1
    std::error_code ec;
    if (keep > 0) {
        std::error_code missing_ok; // gaps in the backup chain are expected
        std::filesystem::remove(backup(keep), missing_ok);
        for (int n = keep - 1; n >= 1; --n) {
            std::filesystem::rename(backup(n), backup(n + 1), missing_ok);
        }
        std::filesystem::rename(base, backup(1), ec);
    } else {
        std::filesystem::remove(base, ec);
    }
    if (ec) {
        std::cerr << "FileLogger: rotation of " << base << " incomplete: " << ec.message() << '\n';
    }

    target.bytes_written = 0;
    file_rotations_.fetch_add(1, std::memory_order_relaxed);
}

void FileLogger::shed_queue_locked() {
    // Make room for a fifth of the queue, oldest service chatter first
    size_t to_drop = std::max<size_t>(1, max_queue_size_ / 5);
    size_t dropped = 0;

    for (auto it = queue_.begin(); it != queue_.end() && dropped < to_drop;) {
        if (it->file_type == FileType::SERVICE_LOG) {
            it = queue_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    while (dropped < to_drop && !queue_.empty()) {
        queue_.pop_front();
        ++dropped;
    }

    dropped_entries_.fetch_add(dropped, std::memory_order_relaxed);
    std::cerr << "FileLogger: queue full, dropped " << dropped << " entries\n";
}

std::string FileLogger::format_entry(const LogEntry& entry) const {
    std::ostringstream oss;
    oss << '[' << format_timestamp(entry.timestamp) << "] ";

    // The audit trail reads "<date> <event>", one event per line
    if (entry.file_type == FileType::AUDIT_LOG) {
        oss << entry.message;
        return oss.str();
    }

    oss << '[' << log_level_to_string(entry.level) << "] ";
    if (entry.source_file != nullptr) {
        const char* base = std::strrchr(entry.source_file, '/');
        oss << '[' << (base ? base + 1 : entry.source_file) << ':' << entry.line_number << "] ";
    }
    oss << entry.message;
    return oss.str();
}

bool FileLogger::ensure_parent_directory(const std::string& file_path) {
    std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        std::cerr << "FileLogger: cannot create " << parent.string() << ": " << ec.message() << '\n';
        return false;
    }
    return true;
}
