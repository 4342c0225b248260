#include "dcp/config.hpp"
#include "dcp/errors.hpp"
#include "dcp/logger.hpp"
#include "dcp/metrics.hpp"
#include "dcp/runner.hpp"
#include <cstdio>

using namespace dcp;

int main(int argc, char** argv) {
    PipelineConfig cfg;
    try {
        cfg = parse_args(argc, argv);
    } catch (const ConfigError& e) {
        Logger::error("%s", describe(e).c_str());
        fprintf(stderr, "%s", usage().c_str());
        return 2;
    }
    if (cfg.input_path.empty()) { fprintf(stdout, "%s", usage().c_str()); return 0; }
    Logger::set_level(cfg.log_level);

    Metrics metrics;
    try {
        PipelineSummary s = run_pipeline(cfg, &metrics);
        if (s.failed_frames) Logger::warn("%llu frames could not be processed", (unsigned long long)s.failed_frames);
    } catch (const std::exception& e) {
        Logger::error("pipeline failed: %s", describe(e).c_str());
        return 1;
    }

    if (!cfg.metrics_path.empty()) {
        if (!metrics.dump_csv(cfg.metrics_path)) { Logger::error("fail write %s", cfg.metrics_path.c_str()); return 1; }
        Logger::info("done. %s saved", cfg.metrics_path.c_str());
    }
    return 0;
}
