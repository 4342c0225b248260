#pragma once
#include "image_stack.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace dcp {
// Ownership tag of a slot.
//   Segment: owned by the segmenter, awaiting label data (S)
//   Extract: labels ready, waiting for the extraction coordinator (E)
//   Working: claimed by the coordinator, extraction in progress (W)
enum class SlotState : int { Segment = 0, Extract = 1, Working = 2 };

char to_char(SlotState state);

// Fixed set of reusable label buffers handed back and forth between one
// segmenter and one extraction coordinator. Buffers are allocated once; the
// state tag decides which side may touch a slot's contents.
class SlotArray {
public:
    SlotArray(int num_slots, int chunk_size, cv::Size frame_size);
    SlotArray(const SlotArray&) = delete;
    SlotArray& operator=(const SlotArray&) = delete;

    int size() const { return static_cast<int>(slots_.size()); }
    int chunk_size() const { return chunk_size_; }

    SlotState state(int slot) const { return slots_[slot]->state.load(); }
    int chunk(int slot) const { return slots_[slot]->chunk; }
    // chunk_size x (H*W) CV_16S label images. Only the owner may write.
    ImageStack& labels(int slot) { return slots_[slot]->labels; }
    const ImageStack& labels(int slot) const { return slots_[slot]->labels; }
    // Number of labels per frame; its size is the number of valid frames.
    std::vector<int>& label_counts(int slot) { return slots_[slot]->label_counts; }
    const std::vector<int>& label_counts(int slot) const { return slots_[slot]->label_counts; }

    // S -> E, called by the segmenter after filling labels and label counts.
    void publish(int slot, int chunk);
    // E -> W; false if the slot is not ready for extraction.
    bool try_claim(int slot);
    // W -> S, hands the slot back to the segmenter.
    void release(int slot);

    // First slot in `state`, scanning round-robin from `start`; -1 if none.
    int find(SlotState state, int start) const;

    // Every transition bumps the version. Waits until it differs from `seen`.
    uint64_t version() const;
    bool wait_for_change(uint64_t seen, std::chrono::milliseconds timeout);

    // Wakes all waiters for good; used when either side fails.
    void abort();
    bool aborted() const { return aborted_.load(); }

private:
    struct Slot {
        std::atomic<SlotState> state{SlotState::Segment};
        int chunk = -1;
        ImageStack labels;
        std::vector<int> label_counts;
    };

    void transition(int slot, SlotState from, SlotState to);
    void notify();

    int chunk_size_;
    std::vector<std::unique_ptr<Slot>> slots_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    uint64_t version_ = 0;
    std::atomic<bool> aborted_{false};
};
}
