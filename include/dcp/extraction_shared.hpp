#pragma once
#include "blocking_queue.hpp"
#include "features.hpp"
#include "image_stack.hpp"
#include "progress_monitor.hpp"
#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

namespace dcp {
// One frame of the chunk currently in the shared label array.
struct WorkItem {
    int chunk;
    int frame;
};

// Result for one dispatched frame. Exactly one is produced per work item;
// `events` is empty for skipped frames, frames without masks and failures.
struct FrameEvents {
    int index;
    std::optional<EventBatch> events;
    bool failed = false;
};

// State shared by the extraction coordinator and its workers. The coordinator
// alone writes `label_array` and `finalize`; worker i alone increments unit i
// of `worker_monitor`.
struct ExtractionShared {
    ExtractionShared(int length, int chunk_size, cv::Size frame_size, int num_workers)
        : feat_nevents(length), label_array(chunk_size, frame_size, CV_16S),
          worker_monitor(num_workers) {
        for (auto& n : feat_nevents) n.store(-1);
    }
    ExtractionShared(const ExtractionShared&) = delete;
    ExtractionShared& operator=(const ExtractionShared&) = delete;

    int num_workers() const { return worker_monitor.size(); }
    int length() const { return static_cast<int>(feat_nevents.size()); }

    BlockingQueue<WorkItem> raw_queue;
    BlockingQueue<FrameEvents> event_queue;
    // Events per input frame, -1 until the frame was processed.
    std::vector<std::atomic<int>> feat_nevents;
    ImageStack label_array;
    std::atomic<bool> finalize{false};
    std::atomic<uint64_t> invalid_masks{0};
    std::atomic<uint64_t> failed_items{0};
    ProgressMonitor worker_monitor;
};
}
