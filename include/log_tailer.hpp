#ifndef LOG_TAILER_HPP
#define LOG_TAILER_HPP

#include "line_source.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <sys/types.h>

/**
 * @brief Follows an append-only log file like "tail -F"
 *
 * The first open starts at end-of-file, so history is never replayed. When
 * the file is truncated the tailer rewinds; when it is rotated (the path now
 * names another file, or is gone) the old handle is drained, a trailing
 * unterminated line is emitted as it stands, and the replacement is read from
 * its beginning once it appears. After a read error the same file is reopened
 * at the last offset. A missing source is
 * retried with exponential backoff and never ends the stream; only cancel()
 * does.
 */
class LogTailer : public LineSource {
public:
    struct Options {
        std::chrono::milliseconds poll_interval{250};
        std::chrono::milliseconds max_backoff{30000};
        size_t max_line_length = 64 * 1024; // longer lines are discarded
        bool start_at_end = true;
    };

    struct Stats {
        uint64_t lines_emitted;
        uint64_t reopen_count;
        uint64_t truncations;
        uint64_t discarded_lines;
    };

    explicit LogTailer(std::string path);
    LogTailer(std::string path, Options options);
    ~LogTailer() override;

    LogTailer(const LogTailer&) = delete;
    LogTailer& operator=(const LogTailer&) = delete;

    std::optional<std::string> next_line() override;
    void cancel() override;

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    bool is_open() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }
    Stats get_stats() const;

protected:
    // read(2) on the source handle
    virtual ssize_t read_source(int fd, char* buffer, size_t size);

private:
    enum class OpenMode : uint8_t {
        FROM_END,
        FROM_START,
        RESUME      // same file at offset_, or from the start if it was replaced
    };

    std::string path_;
    Options options_;

    int fd_ = -1;
    dev_t device_ = 0;
    ino_t inode_ = 0;
    off_t offset_ = 0;

    std::string buffer_;
    bool discarding_ = false;  // inside an over-long line
    bool first_open_ = true;
    bool resume_pending_ = false;  // handle dropped after a read error
    bool outage_reported_ = false;
    std::chrono::milliseconds backoff_;

    std::atomic<bool> cancelled_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::atomic<uint64_t> lines_emitted_{0};
    std::atomic<uint64_t> reopen_count_{0};
    std::atomic<uint64_t> truncations_{0};
    std::atomic<uint64_t> discarded_lines_{0};

    void open_source(OpenMode mode);
    void close_source();
    bool read_available();
    bool check_rotation();
    bool pop_line(std::string& line);
    bool wait_for(std::chrono::milliseconds duration);
};

#endif // LOG_TAILER_HPP
