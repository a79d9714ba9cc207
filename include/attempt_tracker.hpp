#ifndef ATTEMPT_TRACKER_HPP
#define ATTEMPT_TRACKER_HPP

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * @brief In-memory failed-authentication counters per source address
 *
 * Pure bookkeeping: the promotion threshold is applied by the caller. Records
 * are never persisted, so a restart starts every address from zero. The table
 * is bounded; when full, the least recently updated address is evicted.
 */
class AttemptTracker {
public:
    static constexpr size_t kDefaultMaxTracked = 100000;

    explicit AttemptTracker(size_t max_tracked = kDefaultMaxTracked);

    // Counts one more failure for ip and returns the updated count
    unsigned int record_failure(const std::string& ip);

    void clear(const std::string& ip);
    void clear_all();

    // Zero when ip is untracked
    unsigned int count(const std::string& ip) const;

    size_t tracked_count() const;
    size_t evicted_count() const;

private:
    struct AttemptRecord {
        unsigned int failures = 0;
        std::list<std::string>::iterator recency;
    };

    size_t max_tracked_;
    size_t evicted_ = 0;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, AttemptRecord> records_;
    std::list<std::string> recency_; // front = most recently updated
};

#endif // ATTEMPT_TRACKER_HPP
