#pragma once
#include "data.hpp"
#include "extraction_shared.hpp"
#include "features.hpp"
#include "gate.hpp"
#include "ppid.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dcp {
struct ExtractParams {
    bool brightness = true;
    bool haralick = true;

    static const KwargSpec& spec();
    static ExtractParams from_kwargs(const Kwargs& kwargs);
    Kwargs to_kwargs() const;
};

// Work loop of one extraction worker. It knows nothing about where it runs:
// an ExecutionContext either gives it a thread or calls process_next inline.
class EventExtractor {
public:
    EventExtractor(int worker_index, std::unique_ptr<MeasurementData> data,
                   std::shared_ptr<const Gate> gate, ExtractionShared& shared,
                   ExtractParams params = {}, FeatureFunctions functions = {});

    // Processes items until `finalize` is set and the input queue is empty.
    void run();
    // Handles at most one work item; false if none arrived within `timeout`.
    bool process_next(std::chrono::milliseconds timeout);

    // Events of one label image at global frame `index`, or nothing if the
    // raw frame repeats the previous one or no mask survives mask gating.
    std::optional<EventBatch> process_label(const cv::Mat& label, int index);
    std::vector<cv::Mat> get_masks_from_label(const cv::Mat& label) const;
    EventBatch get_events_from_masks(std::vector<cv::Mat> masks, int index);

    int worker_index() const { return worker_index_; }
    const std::string& tag() const { return tag_; }

    static std::string get_ppid_code() { return "legacy"; }
    std::string get_ppid() const;
    static std::string get_ppid_from_ppkw(const Kwargs& kwargs);
    static Kwargs get_ppkw_from_ppid(const std::string& ppid);

private:
    int worker_index_;
    std::string tag_;
    std::unique_ptr<MeasurementData> data_;
    std::shared_ptr<const Gate> gate_;
    ExtractionShared& shared_;
    ExtractParams params_;
    FeatureFunctions functions_;
};
}
