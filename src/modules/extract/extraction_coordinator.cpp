#include "dcp/extraction_coordinator.hpp"
#include "dcp/errors.hpp"
#include "dcp/logger.hpp"
#include "dcp/tracer.hpp"
#include <algorithm>
#include <chrono>

namespace dcp {
ExtractionCoordinator::ExtractionCoordinator(SlotArray& slots, const MeasurementData& data,
                                             std::shared_ptr<const Gate> gate,
                                             ExtractionShared& shared,
                                             std::unique_ptr<ExecutionContext> context,
                                             std::function<size_t()> writer_depth,
                                             ExtractParams params, FeatureFunctions functions,
                                             Metrics* metrics)
    : slots_(slots), data_(data), gate_(std::move(gate)), shared_(shared),
      context_(std::move(context)), writer_depth_(std::move(writer_depth)), params_(params),
      functions_(std::move(functions)), metrics_(metrics ? metrics : &own_metrics_) {
    if (shared_.label_array.size() != data_.image().chunk_size())
        throw ConfigError("Shared label array does not match the chunk size");
}

ExtractionCoordinator::~ExtractionCoordinator() {
    if (thread_.joinable()) thread_.join();
}

void ExtractionCoordinator::start() {
    thread_ = std::thread([this] {
        try {
            run();
        } catch (...) {
            error_ = std::current_exception();
        }
    });
}

void ExtractionCoordinator::join() {
    if (thread_.joinable()) thread_.join();
    if (error_) std::rethrow_exception(error_);
}

void ExtractionCoordinator::run() {
    std::vector<std::unique_ptr<EventExtractor>> workers;
    for (int ii = 0; ii < shared_.num_workers(); ++ii)
        workers.push_back(std::make_unique<EventExtractor>(ii, data_.clone(), gate_, shared_,
                                                           params_, functions_));
    context_->start(std::move(workers));
    Logger::debug("[extract] Started %d workers (%s)", shared_.num_workers(), context_->name());

    const int num_chunks = data_.image().num_chunks();
    uint64_t frames_processed = 0;
    try {
        while (chunks_processed_ < num_chunks) {
            if (slots_.aborted()) throw PipelineAborted("Slot handoff aborted before all chunks were extracted");
            apply_backpressure();
            int slot = claim_next_slot();
            auto t1 = std::chrono::steady_clock::now();
            int chunk = slots_.chunk(slot);
            {
                DCP_TRACE_METRICS(*metrics_, "extract", chunk);
                load_labels(slot);

                const int chunk_size = data_.image().get_chunk_size(chunk);
                for (int ii = 0; ii < chunk_size; ++ii) shared_.raw_queue.push({chunk, ii});
                context_->pump();

                frames_processed += chunk_size;
                shared_.worker_monitor.wait_for_total(frames_processed);
            }
            slots_.release(slot);
            Logger::debug("[extract] Extracted one chunk: %d", chunk);
            t_count_ += std::chrono::duration<double>(std::chrono::steady_clock::now() - t1).count();
            ++chunks_processed_;
        }
    } catch (...) {
        slots_.abort();
        shutdown_workers();
        throw;
    }

    uint64_t inv_masks = shared_.invalid_masks.load();
    if (inv_masks) {
        Logger::info("[extract] Encountered %llu invalid masks", static_cast<unsigned long long>(inv_masks));
        double inv_frac = static_cast<double>(inv_masks) / data_.length();
        if (inv_frac > 0.005)
            Logger::warn("[extract] Discarded %.1f%% of the masks, please check segmenter applicability",
                         inv_frac * 100);
    }
    uint64_t failed = shared_.failed_items.load();
    if (failed) Logger::warn("[extract] %llu frames failed during extraction", static_cast<unsigned long long>(failed));

    shutdown_workers();
    Logger::debug("[extract] Finished extraction");
    Logger::info("[extract] Extraction time: %.1fs", t_count_);
}

void ExtractionCoordinator::apply_backpressure() {
    if (!writer_depth_) return;
    size_t ldq = writer_depth_();
    if (ldq <= kWriterBacklog) return;
    double stallsec = ldq / 100.0;
    Logger::warn("[extract] Stalling %.1fs for slow writer", stallsec);
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::duration<double>(stallsec));
    // An abort ends the stall early.
    while (!slots_.aborted()) {
        auto left = deadline - std::chrono::steady_clock::now();
        if (left <= std::chrono::steady_clock::duration::zero()) return;
        slots_.wait_for_change(slots_.version(),
                               std::min(std::chrono::duration_cast<std::chrono::milliseconds>(left) +
                                            std::chrono::milliseconds(1),
                                        std::chrono::milliseconds(100)));
    }
    throw PipelineAborted("Slot handoff aborted while waiting for the writer");
}

int ExtractionCoordinator::claim_next_slot() {
    while (true) {
        uint64_t seen = slots_.version();
        for (int k = 1; k <= slots_.size(); ++k) {
            int slot = (last_slot_ + k) % slots_.size();
            if (slots_.try_claim(slot)) {
                last_slot_ = slot;
                return slot;
            }
        }
        if (slots_.aborted()) throw PipelineAborted("Slot handoff aborted before all chunks were extracted");
        // Nothing to do, wait for the segmenter.
        slots_.wait_for_change(seen, std::chrono::milliseconds(100));
    }
}

void ExtractionCoordinator::load_labels(int slot) {
    const auto& counts = slots_.label_counts(slot);
    const int frames = static_cast<int>(counts.size());
    ImageStack& dst = shared_.label_array;
    if (frames > dst.size())
        throw ConfigError("Slot " + std::to_string(slot) + " holds " + std::to_string(frames) +
                          " label images, more than a chunk of " + std::to_string(dst.size()));
    slots_.labels(slot).data.rowRange(0, frames).copyTo(dst.data.rowRange(0, frames));
    if (frames < dst.size()) dst.data.rowRange(frames, dst.size()).setTo(0);
}

void ExtractionCoordinator::shutdown_workers() {
    Logger::debug("[extract] Requesting extraction workers to join");
    shared_.finalize.store(true);
    context_->join();
}
}
