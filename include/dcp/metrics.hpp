#pragma once
#include <chrono>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace dcp {
struct Stamp { std::string name; double ms; int index; };

// Thread-safe record of stage entry/exit stamps. Stages are marked as
// "<stage>:in" and "<stage>:out" by ScopeStamp.
class Metrics {
public:
    void mark(const std::string& name, int index) {
        using clk = std::chrono::steady_clock;
        auto now = clk::now();
        double ms = std::chrono::duration<double, std::milli>(now.time_since_epoch()).count();
        std::lock_guard<std::mutex> lk(mu_);
        stamps_.push_back({name, ms, index});
    }

    // Sum of (out - in) over all indices of one stage, in seconds.
    double total_seconds(const std::string& stage) const {
        std::lock_guard<std::mutex> lk(mu_);
        std::map<int, double> open;
        double total_ms = 0;
        for (auto& s : stamps_) {
            if (s.name == stage + ":in") open[s.index] = s.ms;
            else if (s.name == stage + ":out") {
                auto it = open.find(s.index);
                if (it == open.end()) continue;
                total_ms += s.ms - it->second;
                open.erase(it);
            }
        }
        return total_ms / 1000.0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return stamps_.size();
    }

    bool dump_csv(const std::string& path) const {
        std::ofstream f(path);
        if (!f) return false;
        std::lock_guard<std::mutex> lk(mu_);
        f << "index,stage,timestamp_ms\n";
        for (auto& s : stamps_) f << s.index << "," << s.name << "," << s.ms << "\n";
        return static_cast<bool>(f);
    }

private:
    mutable std::mutex mu_;
    std::vector<Stamp> stamps_;
};
}   // namespace dcp
