#include "attempt_tracker.hpp"

AttemptTracker::AttemptTracker(size_t max_tracked)
    : max_tracked_(max_tracked == 0 ? 1 : max_tracked) {}

unsigned int AttemptTracker::record_failure(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(ip);
    if (it != records_.end()) {
        auto& record = it->second;
        record.failures++;
        recency_.splice(recency_.begin(), recency_, record.recency);
        return record.failures;
    }

    if (records_.size() >= max_tracked_) {
        records_.erase(recency_.back());
        recency_.pop_back();
        evicted_++;
    }

    recency_.push_front(ip);
    AttemptRecord record;
    record.failures = 1;
    record.recency = recency_.begin();
    records_.emplace(ip, record);
    return 1;
}

void AttemptTracker::clear(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(ip);
    if (it != records_.end()) {
        recency_.erase(it->second.recency);
        records_.erase(it);
    }
}

void AttemptTracker::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    recency_.clear();
}

unsigned int AttemptTracker::count(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(ip);
    return it != records_.end() ? it->second.failures : 0;
}

size_t AttemptTracker::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t AttemptTracker::evicted_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}
