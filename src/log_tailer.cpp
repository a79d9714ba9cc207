#include "log_tailer.hpp"
#include "guard_errors.hpp"
#include "file_logger.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

LogTailer::LogTailer(std::string path)
    : LogTailer(std::move(path), Options{}) {}

LogTailer::LogTailer(std::string path, Options options)
    : path_(std::move(path)), options_(options), backoff_(options.poll_interval) {}

LogTailer::~LogTailer() {
    close_source();
}

std::optional<std::string> LogTailer::next_line() {
    for (;;) {
        if (is_cancelled()) {
            return std::nullopt;
        }

        std::string line;
        if (pop_line(line)) {
            lines_emitted_.fetch_add(1, std::memory_order_relaxed);
            return line;
        }

        if (fd_ < 0) {
            OpenMode mode = OpenMode::FROM_START;
            if (first_open_ && options_.start_at_end) {
                mode = OpenMode::FROM_END;
            } else if (resume_pending_) {
                mode = OpenMode::RESUME;
            }
            first_open_ = false;
            try {
                open_source(mode);
                resume_pending_ = false;
                backoff_ = options_.poll_interval;
                if (outage_reported_) {
                    GUARD_LOG_INFO("Log source " + path_ + " is available again");
                    outage_reported_ = false;
                }
            } catch (const SourceUnavailableError& e) {
                if (!outage_reported_) {
                    GUARD_LOG_WARNING(std::string(e.what()) + "; retrying with backoff");
                    outage_reported_ = true;
                }
                if (!wait_for(backoff_)) {
                    return std::nullopt;
                }
                backoff_ = std::min(backoff_ * 2, options_.max_backoff);
            }
            continue;
        }

        if (read_available()) {
            // A failed read drops the handle; pause before reopening it
            if (fd_ < 0 && !wait_for(options_.poll_interval)) {
                return std::nullopt;
            }
            continue;
        }

        if (check_rotation()) {
            continue;
        }

        if (!wait_for(options_.poll_interval)) {
            return std::nullopt;
        }
    }
}

void LogTailer::cancel() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    wait_cv_.notify_all();
}

LogTailer::Stats LogTailer::get_stats() const {
    Stats stats;
    stats.lines_emitted = lines_emitted_.load(std::memory_order_relaxed);
    stats.reopen_count = reopen_count_.load(std::memory_order_relaxed);
    stats.truncations = truncations_.load(std::memory_order_relaxed);
    stats.discarded_lines = discarded_lines_.load(std::memory_order_relaxed);
    return stats;
}

ssize_t LogTailer::read_source(int fd, char* buffer, size_t size) {
    return read(fd, buffer, size);
}

void LogTailer::open_source(OpenMode mode) {
    int fd = open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int open_errno = errno;
        throw SourceUnavailableError("Cannot open log source " + path_ + ": " +
                                     std::strerror(open_errno), open_errno);
    }

    struct stat st;
    if (fstat(fd, &st) != 0) {
        int stat_errno = errno;
        close(fd);
        throw SourceUnavailableError("Cannot stat log source " + path_ + ": " +
                                     std::strerror(stat_errno), stat_errno);
    }

    if (mode == OpenMode::RESUME &&
        (st.st_dev != device_ || st.st_ino != inode_ || st.st_size < offset_)) {
        GUARD_LOG_INFO("Log source " + path_ + " was replaced while unreadable");
        mode = OpenMode::FROM_START;
        buffer_.clear();
        discarding_ = false;
    }

    off_t offset = 0;
    if (mode == OpenMode::FROM_END) {
        offset = lseek(fd, 0, SEEK_END);
    } else if (mode == OpenMode::RESUME) {
        offset = lseek(fd, offset_, SEEK_SET);
    }
    if (offset < 0) {
        int seek_errno = errno;
        close(fd);
        throw SourceUnavailableError("Cannot seek in log source " + path_ + ": " +
                                     std::strerror(seek_errno), seek_errno);
    }

    fd_ = fd;
    device_ = st.st_dev;
    inode_ = st.st_ino;
    offset_ = offset;
    if (mode == OpenMode::FROM_END) {
        buffer_.clear();
        discarding_ = false;
    }

    switch (mode) {
        case OpenMode::FROM_END:
            GUARD_LOG_INFO("Following " + path_ + " from end of file");
            break;
        case OpenMode::FROM_START:
            GUARD_LOG_INFO("Following " + path_ + " from the beginning");
            break;
        case OpenMode::RESUME:
            GUARD_LOG_INFO("Resumed " + path_ + " at offset " + std::to_string(offset));
            break;
    }
}

void LogTailer::close_source() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

bool LogTailer::read_available() {
    char chunk[8192];
    bool got_data = false;

    for (;;) {
        ssize_t bytes_read = read_source(fd_, chunk, sizeof(chunk));
        if (bytes_read > 0) {
            got_data = true;
            offset_ += bytes_read;
            buffer_.append(chunk, static_cast<size_t>(bytes_read));
            if (buffer_.size() >= sizeof(chunk) * 8) {
                break; // let pop_line() work through what we have
            }
            continue;
        }
        if (bytes_read == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }

        int read_errno = errno;
        GUARD_LOG_ERROR("Read from " + path_ + " failed: " + std::strerror(read_errno) +
                        "; reopening");
        close_source();
        resume_pending_ = true;
        reopen_count_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    return got_data;
}

bool LogTailer::check_rotation() {
    struct stat path_st;
    if (stat(path_.c_str(), &path_st) != 0 ||
        path_st.st_dev != device_ || path_st.st_ino != inode_) {
        // Lines may have landed in the old file since the last EOF
        if (read_available()) {
            return true;
        }
        if (fd_ < 0) {
            return true; // read error while draining; resume handles it
        }

        if (discarding_) {
            buffer_.clear();
            discarding_ = false;
        } else if (!buffer_.empty()) {
            buffer_.push_back('\n');
        }

        GUARD_LOG_INFO("Log source " + path_ + " was rotated; switching to the new file");
        close_source();
        reopen_count_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    if (path_st.st_size < offset_) {
        GUARD_LOG_INFO("Log source " + path_ + " was truncated; rewinding");
        if (lseek(fd_, 0, SEEK_SET) < 0) {
            close_source();
        }
        offset_ = 0;
        buffer_.clear();
        discarding_ = false;
        truncations_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    return false;
}

bool LogTailer::pop_line(std::string& line) {
    for (;;) {
        size_t newline = buffer_.find('\n');
        if (newline == std::string::npos) {
            if (buffer_.size() > options_.max_line_length) {
                if (!discarding_) {
                    GUARD_LOG_WARNING("Discarding over-long line from " + path_);
                    discarded_lines_.fetch_add(1, std::memory_order_relaxed);
                }
                discarding_ = true;
                buffer_.clear();
            }
            return false;
        }

        if (discarding_) {
            // Tail end of an over-long line
            buffer_.erase(0, newline + 1);
            discarding_ = false;
            continue;
        }

        line.assign(buffer_, 0, newline);
        buffer_.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() > options_.max_line_length) {
            discarded_lines_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        return true;
    }
}

bool LogTailer::wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, duration, [this] {
        return cancelled_.load(std::memory_order_acquire);
    });
    return !cancelled_.load(std::memory_order_acquire);
}
