#pragma once
#include "data.hpp"
#include "event_extractor.hpp"
#include "execution_context.hpp"
#include "extraction_shared.hpp"
#include "gate.hpp"
#include "metrics.hpp"
#include "slots.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <thread>

namespace dcp {
// Consumer side of the slot handoff. Claims labeled chunks, hands their
// frames to the extraction workers and returns each slot to the segmenter
// once every frame of its chunk has been acknowledged.
class ExtractionCoordinator {
public:
    static constexpr size_t kWriterBacklog = 100;

    ExtractionCoordinator(SlotArray& slots, const MeasurementData& data,
                          std::shared_ptr<const Gate> gate, ExtractionShared& shared,
                          std::unique_ptr<ExecutionContext> context,
                          std::function<size_t()> writer_depth, ExtractParams params = {},
                          FeatureFunctions functions = {}, Metrics* metrics = nullptr);
    ~ExtractionCoordinator();

    void start();
    // Rethrows an exception raised on the coordinator thread.
    void join();
    // The coordinator loop; start() runs it on a thread.
    void run();

    int chunks_processed() const { return chunks_processed_; }
    double extraction_seconds() const { return t_count_; }
    const Metrics& metrics() const { return *metrics_; }

private:
    void apply_backpressure();
    int claim_next_slot();
    void load_labels(int slot);
    void shutdown_workers();

    SlotArray& slots_;
    const MeasurementData& data_;
    std::shared_ptr<const Gate> gate_;
    ExtractionShared& shared_;
    std::unique_ptr<ExecutionContext> context_;
    std::function<size_t()> writer_depth_;
    ExtractParams params_;
    FeatureFunctions functions_;
    Metrics own_metrics_;
    Metrics* metrics_;

    int last_slot_ = -1;
    int chunks_processed_ = 0;
    double t_count_ = 0;
    std::thread thread_;
    std::exception_ptr error_;
};
}
