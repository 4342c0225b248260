#pragma once
#include "gate.hpp"
#include "logger.hpp"
#include <map>
#include <string>

namespace dcp {
struct PipelineConfig {
    std::string input_path;
    std::string output_path;

    // Stage configuration as pipeline identifiers.
    std::string background = "sparsemed:k=200^s=1^t=0^f=0.8";
    std::string segmenter = "thresh:t=-6:cle=1^f=1^clo=2";
    std::string features = "legacy:b=1^h=1";
    std::string gate = "norm:o=0^s=10";
    std::map<std::string, BoxGate> box_gates;

    int workers = 0;  // 0: one per hardware thread
    int slots = 3;
    int chunk_size = 1000;
    int cache_size = 2;
    double pixel_size = 0;  // 0: read from the input file
    bool debug = false;
    LogLevel log_level = LogLevel::Info;
    std::string metrics_path;
};

std::string usage();

// Throws ConfigError on unknown options or bad values. "--help" yields an
// empty input path.
PipelineConfig parse_args(int argc, char** argv);

// "name=min:max" with either bound optionally empty.
std::pair<std::string, BoxGate> parse_box_gate(const std::string& text);
}
