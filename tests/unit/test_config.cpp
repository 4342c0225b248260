#include <doctest/doctest.h>
#include "dcp/config.hpp"
#include "dcp/errors.hpp"
#include <vector>

using namespace dcp;

namespace {
PipelineConfig parse(std::vector<std::string> args) {
  args.insert(args.begin(), "dcp_run");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(&a[0]);
  return parse_args(static_cast<int>(argv.size()), argv.data());
}
}  // namespace

TEST_CASE("defaults with two positional paths"){
  auto cfg = parse({"in.h5", "out.h5"});
  CHECK(cfg.input_path == "in.h5");
  CHECK(cfg.output_path == "out.h5");
  CHECK(cfg.background == "sparsemed:k=200^s=1^t=0^f=0.8");
  CHECK(cfg.segmenter == "thresh:t=-6:cle=1^f=1^clo=2");
  CHECK(cfg.features == "legacy:b=1^h=1");
  CHECK(cfg.gate == "norm:o=0^s=10");
  CHECK(cfg.workers == 0);
  CHECK(cfg.slots == 3);
  CHECK(cfg.chunk_size == 1000);
  CHECK_FALSE(cfg.debug);
  CHECK(cfg.log_level == LogLevel::Info);
}

TEST_CASE("options override defaults"){
  auto cfg = parse({"--workers", "4", "in.h5", "--slots", "2", "--chunk-size", "50",
                    "--pixel-size", "0.26", "--gate", "norm:o=1^s=5", "--box", "deform=:0.1",
                    "--box", "area_um=20:200", "out.h5", "--metrics", "m.csv", "--debug"});
  CHECK(cfg.workers == 4);
  CHECK(cfg.slots == 2);
  CHECK(cfg.chunk_size == 50);
  CHECK(cfg.pixel_size == doctest::Approx(0.26));
  CHECK(cfg.gate == "norm:o=1^s=5");
  CHECK(cfg.metrics_path == "m.csv");
  CHECK(cfg.debug);
  CHECK(cfg.log_level == LogLevel::Debug);
  REQUIRE(cfg.box_gates.size() == 2);
  CHECK_FALSE(cfg.box_gates["deform"].min.has_value());
  CHECK(*cfg.box_gates["deform"].max == doctest::Approx(0.1));
  CHECK(*cfg.box_gates["area_um"].min == doctest::Approx(20));
  CHECK(*cfg.box_gates["area_um"].max == doctest::Approx(200));
}

TEST_CASE("help yields an empty config"){
  auto cfg = parse({"in.h5", "--help"});
  CHECK(cfg.input_path.empty());
  CHECK_FALSE(usage().empty());
}

TEST_CASE("bad command lines are rejected"){
  CHECK_THROWS_AS(parse({"in.h5"}), ConfigError);
  CHECK_THROWS_AS(parse({"a.h5", "b.h5", "c.h5"}), ConfigError);
  CHECK_THROWS_AS(parse({"in.h5", "in.h5"}), ConfigError);
  CHECK_THROWS_AS(parse({"in.h5", "out.h5", "--frobnicate", "1"}), ConfigError);
  CHECK_THROWS_AS(parse({"in.h5", "out.h5", "--workers"}), ConfigError);
  CHECK_THROWS_AS(parse({"in.h5", "out.h5", "--workers", "four"}), ConfigError);
  CHECK_THROWS_AS(parse({"in.h5", "out.h5", "--workers", "4x"}), ConfigError);
  CHECK_THROWS_AS(parse({"in.h5", "out.h5", "--workers", "-1"}), ConfigError);
  CHECK_THROWS_AS(parse({"in.h5", "out.h5", "--slots", "0"}), ConfigError);
  CHECK_THROWS_AS(parse({"in.h5", "out.h5", "--pixel-size", "-0.1"}), ConfigError);
  CHECK_THROWS_AS(parse({"in.h5", "out.h5", "--log-level", "loud"}), ConfigError);
}

TEST_CASE("nested parse errors keep the cause"){
  try {
    parse({"in.h5", "out.h5", "--chunk-size", "many"});
    FAIL("no exception");
  } catch (const ConfigError& e) {
    std::string msg = describe(e);
    CHECK(msg.find("--chunk-size") != std::string::npos);
    CHECK(msg.find("stoi") != std::string::npos);
  }
}

TEST_CASE("box gate syntax"){
  auto g = parse_box_gate("bright_avg=-1.5:");
  CHECK(g.first == "bright_avg");
  CHECK(*g.second.min == doctest::Approx(-1.5));
  CHECK_FALSE(g.second.max.has_value());
  CHECK_THROWS_AS(parse_box_gate("bright_avg"), ConfigError);
  CHECK_THROWS_AS(parse_box_gate("=1:2"), ConfigError);
  CHECK_THROWS_AS(parse_box_gate("x=1"), ConfigError);
  CHECK_THROWS_AS(parse_box_gate("x=a:2"), ConfigError);
}

TEST_CASE("log level names"){
  CHECK(parse_log_level("debug") == LogLevel::Debug);
  CHECK(parse_log_level("INFO") == LogLevel::Info);
  CHECK(parse_log_level("warn") == LogLevel::Warning);
  CHECK(parse_log_level("Warning") == LogLevel::Warning);
  CHECK(parse_log_level("error") == LogLevel::Error);
  CHECK_THROWS_AS(parse_log_level("verbose"), ConfigError);
}
