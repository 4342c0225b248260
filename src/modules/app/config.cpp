#include "dcp/config.hpp"
#include "dcp/errors.hpp"
#include <vector>

namespace dcp {
namespace {
int to_int(const std::string& opt, const std::string& value) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(value, &pos);
    } catch (const std::logic_error&) {
        std::throw_with_nested(ConfigError("Option " + opt + " expects an integer, got '" + value + "'"));
    }
    if (pos != value.size()) throw ConfigError("Option " + opt + " expects an integer, got '" + value + "'");
    return v;
}

double to_double(const std::string& opt, const std::string& value) {
    size_t pos = 0;
    double v = 0;
    try {
        v = std::stod(value, &pos);
    } catch (const std::logic_error&) {
        std::throw_with_nested(ConfigError("Option " + opt + " expects a number, got '" + value + "'"));
    }
    if (pos != value.size()) throw ConfigError("Option " + opt + " expects a number, got '" + value + "'");
    return v;
}
}  // namespace

std::string usage() {
    return "usage: dcp_run INPUT.h5 OUTPUT.h5 [options]\n"
           "  --background PPID   background stage (default sparsemed:k=200^s=1^t=0^f=0.8)\n"
           "  --segmenter PPID    segmentation stage (default thresh:t=-6:cle=1^f=1^clo=2)\n"
           "  --features PPID     feature stage (default legacy:b=1^h=1)\n"
           "  --gate PPID         gating stage (default norm:o=0^s=10)\n"
           "  --box NAME=MIN:MAX  box gate on a feature, repeatable (needs o=1)\n"
           "  --workers N         extraction workers (default: hardware threads)\n"
           "  --slots N           segmenter/extractor slots (default 3)\n"
           "  --chunk-size N      frames per chunk (default 1000)\n"
           "  --cache-size N      cached chunks per array (default 2)\n"
           "  --pixel-size X      pixel size [um] (default: from input)\n"
           "  --debug             single inline worker, debug logging\n"
           "  --log-level L       debug|info|warning|error\n"
           "  --metrics FILE      write stage timings as CSV\n";
}

std::pair<std::string, BoxGate> parse_box_gate(const std::string& text) {
    auto eq = text.find('=');
    auto colon = text.find(':', eq == std::string::npos ? 0 : eq);
    if (eq == std::string::npos || eq == 0 || colon == std::string::npos)
        throw ConfigError("Box gate must look like name=min:max, got '" + text + "'");
    BoxGate box;
    std::string lo = text.substr(eq + 1, colon - eq - 1);
    std::string hi = text.substr(colon + 1);
    if (!lo.empty()) box.min = to_double("--box", lo);
    if (!hi.empty()) box.max = to_double("--box", hi);
    return {text.substr(0, eq), box};
}

PipelineConfig parse_args(int argc, char** argv) {
    PipelineConfig cfg;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string opt = argv[i];
        if (opt == "-h" || opt == "--help") return PipelineConfig{};
        if (opt.rfind("--", 0) != 0) {
            positional.push_back(opt);
            continue;
        }
        if (opt == "--debug") {
            cfg.debug = true;
            cfg.log_level = LogLevel::Debug;
            continue;
        }
        if (i + 1 >= argc) throw ConfigError("Option " + opt + " needs a value");
        std::string value = argv[++i];
        if (opt == "--background") cfg.background = value;
        else if (opt == "--segmenter") cfg.segmenter = value;
        else if (opt == "--features") cfg.features = value;
        else if (opt == "--gate") cfg.gate = value;
        else if (opt == "--box") cfg.box_gates.insert(parse_box_gate(value));
        else if (opt == "--workers") cfg.workers = to_int(opt, value);
        else if (opt == "--slots") cfg.slots = to_int(opt, value);
        else if (opt == "--chunk-size") cfg.chunk_size = to_int(opt, value);
        else if (opt == "--cache-size") cfg.cache_size = to_int(opt, value);
        else if (opt == "--pixel-size") cfg.pixel_size = to_double(opt, value);
        else if (opt == "--log-level") cfg.log_level = parse_log_level(value);
        else if (opt == "--metrics") cfg.metrics_path = value;
        else throw ConfigError("Unknown option " + opt);
    }
    if (positional.size() != 2) throw ConfigError("Expected an input and an output file");
    cfg.input_path = positional[0];
    cfg.output_path = positional[1];

    if (cfg.workers < 0) throw ConfigError("--workers must be >= 0");
    if (cfg.slots <= 0) throw ConfigError("--slots must be > 0");
    if (cfg.chunk_size <= 0) throw ConfigError("--chunk-size must be > 0");
    if (cfg.cache_size <= 0) throw ConfigError("--cache-size must be > 0");
    if (cfg.pixel_size < 0) throw ConfigError("--pixel-size must be >= 0");
    if (cfg.input_path == cfg.output_path) throw ConfigError("Input and output must differ");
    return cfg;
}
}
