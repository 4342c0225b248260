#pragma once
#include "config.hpp"
#include "data.hpp"
#include "event_extractor.hpp"
#include "gate.hpp"
#include "metrics.hpp"
#include "segmenter.hpp"
#include "writer.hpp"
#include <cstdint>
#include <string>

namespace dcp {
struct PipelineSummary {
    int frames = 0;
    uint64_t events = 0;
    uint64_t invalid_masks = 0;
    uint64_t failed_frames = 0;
    double extraction_seconds = 0;
    std::string hash;
};

struct ExtractionOptions {
    int workers = 0;  // 0: one per hardware thread
    int slots = 3;
    bool debug = false;
};

// Segments and extracts all frames of `data` into `sink` using the slot
// handoff between one segmenter thread and the extraction coordinator.
PipelineSummary run_extraction(MeasurementData& data, const SegmenterThresh& segmenter,
                               const Gate& gate, const ExtractParams& params, EventSink& sink,
                               const ExtractionOptions& options, FeatureFunctions functions = {},
                               Metrics* metrics = nullptr);

// Full run from an input HDF5 file to an output HDF5 file: background,
// segmentation, extraction and the pipeline identifiers of all stages.
PipelineSummary run_pipeline(const PipelineConfig& config, Metrics* metrics = nullptr);
}
