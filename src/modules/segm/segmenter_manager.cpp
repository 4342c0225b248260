#include "dcp/logger.hpp"
#include "dcp/segmenter.hpp"
#include <chrono>

namespace dcp {
SegmenterManager::SegmenterManager(SegmenterThresh segmenter, CorrectedImageCache& image_corr,
                                   SlotArray& slots)
    : segmenter_(std::move(segmenter)), image_corr_(image_corr), slots_(slots) {}

SegmenterManager::~SegmenterManager() {
    if (thread_.joinable()) thread_.join();
}

void SegmenterManager::start() {
    thread_ = std::thread([this] {
        try {
            run();
        } catch (...) {
            error_ = std::current_exception();
            slots_.abort();
        }
    });
}

void SegmenterManager::join() {
    if (thread_.joinable()) thread_.join();
    if (error_) std::rethrow_exception(error_);
}

void SegmenterManager::run() {
    for (int chunk : image_corr_.iter_chunks()) {
        int slot = wait_for_free_slot();
        if (slot < 0) {
            Logger::warn("[segment] Handoff aborted at chunk %d", chunk);
            return;
        }
        const ImageStack& corr = image_corr_.get_chunk(chunk);
        segmenter_.segment_chunk(corr, slots_.labels(slot), slots_.label_counts(slot));
        slots_.publish(slot, chunk);
        ++chunks_segmented_;
        Logger::debug("[segment] Segmented chunk %d into slot %d", chunk, slot);
    }
    Logger::debug("[segment] Finished segmentation");
}

int SegmenterManager::wait_for_free_slot() {
    while (!slots_.aborted()) {
        uint64_t seen = slots_.version();
        int slot = slots_.find(SlotState::Segment, last_slot_ + 1);
        if (slot >= 0) {
            last_slot_ = slot;
            return slot;
        }
        slots_.wait_for_change(seen, std::chrono::milliseconds(100));
    }
    return -1;
}
}
