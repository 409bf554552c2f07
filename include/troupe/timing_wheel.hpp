#pragma once

#include <cstddef>
#include <unordered_set>
#include <vector>

namespace troupe {

// Ring of buckets, one per tick. An id inserted now is returned by expire()
// after `slots` ticks unless it was removed (or reset) in between.
// Accuracy is +/- one tick.
template<typename Id>
class TimingWheel {
public:
    explicit TimingWheel(size_t slots)
        : buckets_(slots == 0 ? 1 : slots)
    {}

    // Place id in the freshest bucket, returns its slot
    size_t insert(const Id& id) {
        buckets_[current_].insert(id);
        return current_;
    }

    // Returns false if the id was not in that slot
    bool remove(const Id& id, size_t slot) {
        if (slot >= buckets_.size()) {
            return false;
        }
        return buckets_[slot].erase(id) > 0;
    }

    // remove + insert, used whenever a connection proves liveness
    size_t reset(const Id& id, size_t slot) {
        remove(id, slot);
        return insert(id);
    }

    // Advance one tick and drain the bucket that has become the oldest
    std::unordered_set<Id> expire() {
        current_ = (current_ + 1) % buckets_.size();
        std::unordered_set<Id> expired;
        expired.swap(buckets_[current_]);
        return expired;
    }

    size_t slots() const noexcept { return buckets_.size(); }
    size_t current_slot() const noexcept { return current_; }

    size_t size() const noexcept {
        size_t n = 0;
        for (const auto& bucket : buckets_) {
            n += bucket.size();
        }
        return n;
    }

private:
    std::vector<std::unordered_set<Id>> buckets_;
    size_t current_ = 0;
};

}  // namespace troupe
