#pragma once
#include "features.hpp"
#include "ppid.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace dcp {
struct GateParams {
    bool online_gates = false;
    int size_thresh_mask = 0;

    static const KwargSpec& spec();
    static GateParams from_kwargs(const Kwargs& kwargs);
    Kwargs to_kwargs() const;
};

// Inclusive [min, max] range on one feature; either bound may be open.
struct BoxGate {
    std::optional<double> min;
    std::optional<double> max;
};

class Gate {
public:
    explicit Gate(GateParams params = {}, std::map<std::string, BoxGate> box_gates = {});

    // Masks with `pixel_sum` pixels or fewer are discarded before feature extraction.
    bool gate_mask(const cv::Mat& mask, int pixel_sum) const;
    // One flag per event; all true unless online box gating is active.
    std::vector<bool> gate_events(const FeatureMap& features) const;
    bool has_box_gates() const;

    const GateParams& params() const { return params_; }
    const std::map<std::string, BoxGate>& box_gates() const { return box_; }

    static std::string get_ppid_code() { return "norm"; }
    std::string get_ppid() const;
    static Kwargs get_ppkw_from_ppid(const std::string& ppid);

private:
    GateParams params_;
    std::map<std::string, BoxGate> box_;
};
}
