#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace dcp {
// Barrier over acknowledged work units. Each worker owns one counter slot and
// only ever increments its own; waiters block until the sum reaches a target.
class ProgressMonitor {
public:
    explicit ProgressMonitor(int num_units)
        : n_(num_units), counts_(std::make_unique<std::atomic<uint64_t>[]>(num_units)) {
        for (int i = 0; i < n_; ++i) counts_[i].store(0);
    }

    int size() const { return n_; }

    void increment(int unit, uint64_t by = 1) {
        counts_[unit].fetch_add(by);
        // Taking the lock orders this update against a waiter's predicate check.
        { std::lock_guard<std::mutex> lk(mu_); }
        cv_.notify_all();
    }

    void reset() {
        for (int i = 0; i < n_; ++i) counts_[i].store(0);
    }

    uint64_t value(int unit) const { return counts_[unit].load(); }

    uint64_t total() const {
        uint64_t sum = 0;
        for (int i = 0; i < n_; ++i) sum += counts_[i].load();
        return sum;
    }

    void wait_for_total(uint64_t target) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return total() >= target; });
    }

    // Returns false if the target was not reached within `timeout`.
    template <typename Rep, typename Period>
    bool wait_for_total(uint64_t target, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, timeout, [&] { return total() >= target; });
    }

private:
    int n_;
    std::unique_ptr<std::atomic<uint64_t>[]> counts_;
    std::mutex mu_;
    std::condition_variable cv_;
};
}
