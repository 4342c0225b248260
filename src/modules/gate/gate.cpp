#include "dcp/gate.hpp"
#include "dcp/errors.hpp"
#include "dcp/logger.hpp"
#include <cmath>

namespace dcp {
const KwargSpec& GateParams::spec() {
    static const KwargSpec s = {{"online_gates", false}, {"size_thresh_mask", 0}};
    return s;
}

GateParams GateParams::from_kwargs(const Kwargs& kwargs) {
    Kwargs full = defaults_of(spec());
    for (auto& kv : kwargs) full[kv.first] = kv.second;
    GateParams p;
    p.online_gates = kwarg<bool>(full, "online_gates");
    p.size_thresh_mask = kwarg<int>(full, "size_thresh_mask");
    if (p.size_thresh_mask < 0) throw ConfigError("size_thresh_mask must be >= 0");
    return p;
}

Kwargs GateParams::to_kwargs() const {
    return {{"online_gates", online_gates}, {"size_thresh_mask", size_thresh_mask}};
}

Gate::Gate(GateParams params, std::map<std::string, BoxGate> box_gates)
    : params_(params), box_(std::move(box_gates)) {
    for (auto& kv : box_) {
        if (kv.second.min && kv.second.max && *kv.second.min > *kv.second.max)
            throw ConfigError("Box gate for '" + kv.first + "' has min > max");
    }
}

bool Gate::gate_mask(const cv::Mat&, int pixel_sum) const {
    return pixel_sum > params_.size_thresh_mask;
}

bool Gate::has_box_gates() const {
    if (!params_.online_gates) return false;
    for (auto& kv : box_)
        if (kv.second.min || kv.second.max) return true;
    return false;
}

std::vector<bool> Gate::gate_events(const FeatureMap& features) const {
    size_t n = features.empty() ? 0 : features.begin()->second.size();
    std::vector<bool> keep(n, true);
    if (!has_box_gates()) return keep;

    for (auto& kv : box_) {
        auto it = features.find(kv.first);
        if (it == features.end()) {
            Logger::warn("[gate] Feature '%s' not computed, box gate ignored", kv.first.c_str());
            continue;
        }
        const auto& values = it->second;
        for (size_t i = 0; i < n; ++i) {
            double v = values[i];
            // NaN compares false against every bound and is therefore removed
            if (kv.second.min && !(v >= *kv.second.min)) keep[i] = false;
            if (kv.second.max && !(v <= *kv.second.max)) keep[i] = false;
        }
    }
    return keep;
}

std::string Gate::get_ppid() const {
    return get_ppid_code() + ":" + kwargs_to_ppid(GateParams::spec(), params_.to_kwargs());
}

Kwargs Gate::get_ppkw_from_ppid(const std::string& ppid) {
    return ppid_to_kwargs(GateParams::spec(), split_ppid(ppid, get_ppid_code()));
}
}
