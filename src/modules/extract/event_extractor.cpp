#include "dcp/event_extractor.hpp"
#include "dcp/errors.hpp"
#include "dcp/logger.hpp"

namespace dcp {
namespace {
void merge(FeatureMap& into, FeatureMap from) {
    for (auto& kv : from) into[kv.first] = std::move(kv.second);
}
}  // namespace

const KwargSpec& ExtractParams::spec() {
    static const KwargSpec s = {{"brightness", true}, {"haralick", true}};
    return s;
}

ExtractParams ExtractParams::from_kwargs(const Kwargs& kwargs) {
    Kwargs full = defaults_of(spec());
    for (auto& kv : kwargs) full[kv.first] = kv.second;
    ExtractParams p;
    p.brightness = kwarg<bool>(full, "brightness");
    p.haralick = kwarg<bool>(full, "haralick");
    return p;
}

Kwargs ExtractParams::to_kwargs() const {
    return {{"brightness", brightness}, {"haralick", haralick}};
}

EventExtractor::EventExtractor(int worker_index, std::unique_ptr<MeasurementData> data,
                               std::shared_ptr<const Gate> gate, ExtractionShared& shared,
                               ExtractParams params, FeatureFunctions functions)
    : worker_index_(worker_index), tag_("[extract-" + std::to_string(worker_index) + "]"),
      data_(std::move(data)), gate_(std::move(gate)), shared_(shared), params_(params),
      functions_(std::move(functions)) {
    if (worker_index_ < 0 || worker_index_ >= shared_.num_workers())
        throw std::invalid_argument("Worker index " + std::to_string(worker_index_) +
                                    " outside the worker monitor");
}

void EventExtractor::run() {
    Logger::info("%s Ready", tag_.c_str());
    while (true) {
        if (!process_next(std::chrono::milliseconds(30)) && shared_.finalize.load()) break;
    }
    Logger::debug("%s Finalizing", tag_.c_str());
}

bool EventExtractor::process_next(std::chrono::milliseconds timeout) {
    auto item = shared_.raw_queue.pop(timeout);
    if (!item) return false;

    const int index = item->chunk * data_->image().chunk_size() + item->frame;
    try {
        auto events = process_label(shared_.label_array.frame(item->frame), index);
        shared_.feat_nevents[index].store(events ? static_cast<int>(events->size()) : 0);
        shared_.event_queue.push({index, std::move(events), false});
    } catch (const std::exception& e) {
        Logger::error("%s Frame %d failed: %s", tag_.c_str(), index, describe(e).c_str());
        shared_.failed_items.fetch_add(1);
        shared_.event_queue.push({index, std::nullopt, true});
    }
    shared_.worker_monitor.increment(worker_index_);
    return true;
}

std::optional<EventBatch> EventExtractor::process_label(const cv::Mat& label, int index) {
    if (index > 0) {
        cv::Mat prev = data_->image().get(index - 1);
        cv::Mat cur = data_->image().get(index);
        // frames already analyzed
        if (cv::countNonZero(prev != cur) == 0) return std::nullopt;
    }
    auto masks = get_masks_from_label(label);
    if (masks.empty()) return std::nullopt;
    return get_events_from_masks(std::move(masks), index);
}

std::vector<cv::Mat> EventExtractor::get_masks_from_label(const cv::Mat& label) const {
    double lmax;
    cv::minMaxLoc(label, nullptr, &lmax);
    std::vector<cv::Mat> masks;
    for (int jj = 1; jj <= static_cast<int>(lmax); ++jj) {
        cv::Mat mask = label == jj;
        int mask_sum = cv::countNonZero(mask);
        if (mask_sum && gate_->gate_mask(mask, mask_sum)) masks.push_back(mask);
    }
    return masks;
}

EventBatch EventExtractor::get_events_from_masks(std::vector<cv::Mat> masks, int index) {
    EventBatch batch;
    batch.masks = std::move(masks);
    cv::Mat image = data_->image().get(index);
    cv::Mat image_bg = data_->image_bg().get(index);
    cv::Mat image_corr = data_->image_corr().get(index);

    batch.features = functions_.moments(batch.masks, data_->pixel_size());
    if (params_.brightness) merge(batch.features, functions_.brightness(batch.masks, image, image_bg, image_corr));
    if (params_.haralick) merge(batch.features, functions_.haralick(batch.masks, image_corr));

    if (gate_->has_box_gates()) batch.filter(gate_->gate_events(batch.features));

    auto it = batch.features.find("valid");
    if (it == batch.features.end()) throw std::logic_error("Moment features lack the 'valid' column");
    std::vector<bool> valid;
    uint64_t invalid = 0;
    for (double v : it->second) {
        valid.push_back(v != 0);
        if (v == 0) ++invalid;
    }
    batch.features.erase(it);
    if (invalid) {
        shared_.invalid_masks.fetch_add(invalid);
        batch.filter(valid);
    }
    return batch;
}

std::string EventExtractor::get_ppid() const {
    return get_ppid_from_ppkw(params_.to_kwargs());
}

std::string EventExtractor::get_ppid_from_ppkw(const Kwargs& kwargs) {
    return get_ppid_code() + ":" + kwargs_to_ppid(ExtractParams::spec(), kwargs);
}

Kwargs EventExtractor::get_ppkw_from_ppid(const std::string& ppid) {
    return ppid_to_kwargs(ExtractParams::spec(), split_ppid(ppid, get_ppid_code()));
}
}
