#include "dcp/slots.hpp"
#include "dcp/errors.hpp"
#include <stdexcept>
#include <string>

namespace dcp {
char to_char(SlotState state) {
    switch (state) {
    case SlotState::Segment: return 's';
    case SlotState::Extract: return 'e';
    case SlotState::Working: return 'w';
    }
    return '?';
}

SlotArray::SlotArray(int num_slots, int chunk_size, cv::Size frame_size) : chunk_size_(chunk_size) {
    if (num_slots <= 0) throw ConfigError("num_slots must be > 0, got " + std::to_string(num_slots));
    for (int i = 0; i < num_slots; ++i) {
        auto slot = std::make_unique<Slot>();
        slot->labels = ImageStack(chunk_size, frame_size, CV_16S);
        slot->label_counts.reserve(chunk_size);
        slots_.push_back(std::move(slot));
    }
}

void SlotArray::transition(int slot, SlotState from, SlotState to) {
    SlotState expected = from;
    if (!slots_[slot]->state.compare_exchange_strong(expected, to))
        throw std::logic_error("Slot " + std::to_string(slot) + " is in state '" + to_char(expected) +
                               "', expected '" + to_char(from) + "'");
    notify();
}

void SlotArray::notify() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++version_;
    }
    cv_.notify_all();
}

void SlotArray::publish(int slot, int chunk) {
    if (static_cast<int>(slots_[slot]->label_counts.size()) > chunk_size_)
        throw std::logic_error("Slot " + std::to_string(slot) + " holds more frames than a chunk");
    slots_[slot]->chunk = chunk;
    transition(slot, SlotState::Segment, SlotState::Extract);
}

bool SlotArray::try_claim(int slot) {
    SlotState expected = SlotState::Extract;
    if (!slots_[slot]->state.compare_exchange_strong(expected, SlotState::Working)) return false;
    notify();
    return true;
}

void SlotArray::release(int slot) {
    transition(slot, SlotState::Working, SlotState::Segment);
}

int SlotArray::find(SlotState state, int start) const {
    const int n = size();
    for (int k = 0; k < n; ++k) {
        int slot = ((start + k) % n + n) % n;
        if (slots_[slot]->state.load() == state) return slot;
    }
    return -1;
}

uint64_t SlotArray::version() const {
    std::lock_guard<std::mutex> lk(mu_);
    return version_;
}

bool SlotArray::wait_for_change(uint64_t seen, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, timeout, [&] { return version_ != seen || aborted_.load(); });
}

void SlotArray::abort() {
    aborted_.store(true);
    notify();
}
}
