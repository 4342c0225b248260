#pragma once
#include "metrics.hpp"
#include <string>
#include <utility>

#define DCP_CONCAT_(a, b) a##b
#define DCP_CONCAT(a, b) DCP_CONCAT_(a, b)

#define DCP_TRACE_METRICS(metrics, stage, index) \
    dcp::ScopeStamp DCP_CONCAT(_scope_stamp_, __LINE__)(metrics, stage, index)

namespace dcp {
struct ScopeStamp {
    Metrics& m;
    std::string stage;
    int index;

    ScopeStamp(Metrics& met, std::string s, int i) : m(met), stage(std::move(s)), index(i) {
        m.mark(stage + ":in", index);
    }

    ~ScopeStamp() { m.mark(stage + ":out", index); }
};
}
