#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <opencv2/imgproc.hpp>
#include "dcp/errors.hpp"
#include "dcp/hdf5_array.hpp"
#include "dcp/runner.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>

using namespace dcp;

namespace {
const cv::Size kSize(32, 32);

int expected_events(int i) { return 1 + (i % 3 == 0); }

// One dark cell moving along the channel in every frame, a second one in every
// third frame. Consecutive frames always differ.
ImageStack make_frames(int n) {
  ImageStack raw(n, kSize, CV_8U);
  raw.data.setTo(100);
  for (int i = 0; i < n; ++i) {
    cv::Mat f = raw.frame(i);
    cv::circle(f, cv::Point(6 + (7 * i) % 20, 10), 3, cv::Scalar(80), cv::FILLED);
    if (i % 3 == 0) cv::circle(f, cv::Point(16, 22), 3, cv::Scalar(75), cv::FILLED);
  }
  return raw;
}

std::unique_ptr<MeasurementData> make_data(int n, int chunk_size) {
  ImageStack bg(n, kSize, CV_8U);
  bg.data.setTo(100);
  return std::make_unique<MeasurementData>(std::make_shared<MemoryArray>("raw", make_frames(n)),
                                           std::make_shared<MemoryArray>("bg", bg), 0.34, chunk_size, 2);
}

void check_sink(const MemoryEventSink& sink, int n) {
  std::vector<int> per_frame(n, 0);
  for (size_t k = 0; k < sink.frames.size(); ++k) {
    if (k > 0) CHECK(sink.frames[k] >= sink.frames[k - 1]);
    per_frame[sink.frames[k]]++;
  }
  for (int i = 0; i < n; ++i) CHECK(per_frame[i] == expected_events(i));
  REQUIRE(sink.features.count("area_um") == 1);
  CHECK(sink.features.at("area_um").size() == sink.size());
  CHECK(sink.features.count("valid") == 0);
}

struct TempFile {
  std::string path;
  explicit TempFile(const std::string& name)
      : path((std::filesystem::temp_directory_path() / name).string()) { std::remove(path.c_str()); }
  ~TempFile() { std::remove(path.c_str()); }
};

void write_input(const std::string& path, int n) {
  auto file = std::make_shared<Hdf5File>(path, Hdf5File::Mode::Truncate);
  auto ds = Hdf5ImageDataset::create(file, "events/image", kSize, CV_8U, n);
  ds->write(0, make_frames(n));
  file->set_attr("imaging:pixel size", 0.26);
}
}  // namespace

TEST_CASE("threaded extraction over several chunks and slots"){
  const int n = 23;
  auto data = make_data(n, 5);
  MemoryEventSink sink;
  ExtractionOptions opt;
  opt.workers = 3;
  opt.slots = 2;
  Metrics metrics;
  auto summary = run_extraction(*data, SegmenterThresh(), Gate(), ExtractParams{}, sink, opt, {}, &metrics);

  int total = 0;
  for (int i = 0; i < n; ++i) total += expected_events(i);
  CHECK(summary.frames == n);
  CHECK(summary.events == static_cast<uint64_t>(total));
  CHECK(summary.failed_frames == 0);
  CHECK(summary.invalid_masks == 0);
  CHECK(sink.size() == static_cast<size_t>(total));
  check_sink(sink, n);
  CHECK(metrics.size() == 10);
}

TEST_CASE("debug mode runs the worker inline"){
  const int n = 11;
  auto data = make_data(n, 4);
  MemoryEventSink sink;
  ExtractionOptions opt;
  opt.debug = true;
  opt.workers = 8;
  opt.slots = 1;
  auto summary = run_extraction(*data, SegmenterThresh(), Gate(), ExtractParams{false, false}, sink, opt);
  CHECK(summary.frames == n);
  check_sink(sink, n);
  CHECK(sink.features.count("bright_avg") == 0);
}

TEST_CASE("a failing frame does not stall the run"){
  const int n = 9;
  auto data = make_data(n, 4);
  MemoryEventSink sink;
  FeatureFunctions f;
  f.brightness = [](const std::vector<cv::Mat>& masks, const cv::Mat& image, const cv::Mat& bg,
                    const cv::Mat& corr) -> FeatureMap {
    // frame 4 is the only one whose cell ends at x=17
    if (image.at<uchar>(10, 17) == 80 && image.at<uchar>(10, 18) == 100) throw std::runtime_error("broken frame");
    return brightness_features(masks, image, bg, corr);
  };
  ExtractionOptions opt;
  opt.workers = 2;
  auto summary = run_extraction(*data, SegmenterThresh(), Gate(), ExtractParams{}, sink, opt, f);
  CHECK(summary.failed_frames == 1);
  CHECK(std::count(sink.frames.begin(), sink.frames.end(), 4) == 0);
  CHECK(std::count(sink.frames.begin(), sink.frames.end(), 5) == expected_events(5));
}

namespace {
struct FailingSink : EventSink {
  int calls = 0;
  void write(int, const EventBatch&) override {
    ++calls;
    throw IoError("disk full");
  }
};
}  // namespace

TEST_CASE("a failing sink ends the run promptly with its own error"){
  const int n = 400;
  auto data = make_data(n, 50);
  FailingSink sink;
  ExtractionOptions opt;
  opt.workers = 2;
  opt.slots = 2;
  auto t0 = std::chrono::steady_clock::now();
  std::string message;
  try {
    run_extraction(*data, SegmenterThresh(), Gate(), ExtractParams{false, false}, sink, opt);
  } catch (const IoError& e) {
    message = e.what();
  }
  double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  CHECK(message == "disk full");
  CHECK(sink.calls == 1);
  CHECK(seconds < 5.0);
}

TEST_CASE("online box gates reduce the event count"){
  const int n = 6;
  auto data = make_data(n, 6);
  MemoryEventSink sink;
  GateParams gp;
  gp.online_gates = true;
  BoxGate darker;
  darker.max = -22;  // only the second cell is darker than the background by more than 22
  Gate gate(gp, {{"bright_bc_avg", darker}});
  auto summary = run_extraction(*data, SegmenterThresh(), gate, ExtractParams{}, sink, ExtractionOptions{});
  CHECK(summary.events == 2);
  CHECK(sink.frames == std::vector<int>{0, 3});
}

TEST_CASE("full run from HDF5 input to HDF5 output"){
  TempFile in("dcp_it_input.h5"), out("dcp_it_output.h5");
  const int n = 30;
  write_input(in.path, n);

  PipelineConfig cfg;
  cfg.input_path = in.path;
  cfg.output_path = out.path;
  cfg.background = "sparsemed:k=30^f=1";
  cfg.gate = "norm:s=5";
  cfg.workers = 2;
  cfg.slots = 2;
  cfg.chunk_size = 8;
  auto summary = run_pipeline(cfg);
  CHECK(summary.events == 40);
  CHECK(summary.hash.size() == 32);

  auto f = std::make_shared<Hdf5File>(out.path, Hdf5File::Mode::ReadOnly);
  CHECK(f->attr_string("pipeline:hash") == summary.hash);
  CHECK(f->attr_string("pipeline:generation") == "7");
  CHECK(f->attr_string("pipeline:data") == "hdf:p=0.26");
  CHECK(f->attr_string("pipeline:background") == "sparsemed:k=30^s=1^t=0^f=1");
  CHECK(f->attr_string("pipeline:segmenter") == "thresh:t=-6:cle=1^f=1^clo=2");
  CHECK(f->attr_string("pipeline:feature") == "legacy:b=1^h=1");
  CHECK(f->attr_string("pipeline:gate") == "norm:o=0^s=5");
  CHECK(f->attr_double("imaging:pixel size") == doctest::Approx(0.26));
  CHECK(summary.hash == compute_pipeline_hash("7", "hdf:p=0.26", "sparsemed:k=30^s=1^t=0^f=1",
                                              "thresh:t=-6:cle=1^f=1^clo=2", "legacy:b=1^h=1",
                                              "norm:o=0^s=5"));

  CHECK(f->dims("events/mask") == std::vector<hsize_t>{40, 32, 32});
  auto frames = f->read_vector("events/frame");
  REQUIRE(frames.size() == 40);
  CHECK(std::is_sorted(frames.begin(), frames.end()));
  CHECK(f->read_vector("events/deform").size() == 40);

  Hdf5ImageDataset bg(f, "events/image_bg");
  CHECK(bg.length() == n);
  double lo, hi;
  cv::minMaxLoc(bg.read(0, n).data, &lo, &hi);
  CHECK(lo == 100);
  CHECK(hi == 100);
}

TEST_CASE("a stored background with the same identifier is reused"){
  TempFile in("dcp_it_reuse_in.h5"), out("dcp_it_reuse_out.h5");
  const int n = 12;
  {
    write_input(in.path, n);
    auto file = std::make_shared<Hdf5File>(in.path, Hdf5File::Mode::ReadWrite);
    auto bg = Hdf5ImageDataset::create(file, "events/image_bg", kSize, CV_8U, n);
    ImageStack rows(n, kSize, CV_8U);
    rows.data.setTo(100);
    bg->write(0, rows);
    file->set_attr("pipeline:background", std::string("sparsemed:k=12^s=1^t=0^f=1"));
  }
  PipelineConfig cfg;
  cfg.input_path = in.path;
  cfg.output_path = out.path;
  cfg.background = "sparsemed:k=12^f=1";
  cfg.debug = true;
  auto summary = run_pipeline(cfg);
  CHECK(summary.frames == n);

  Hdf5File f(out.path, Hdf5File::Mode::ReadOnly);
  CHECK_FALSE(f.has("events/image_bg"));
  CHECK(f.attr_string("pipeline:background") == "sparsemed:k=12^s=1^t=0^f=1");
  CHECK(f.attr_string("pipeline:hash") == summary.hash);
}

TEST_CASE("input without images is rejected"){
  TempFile in("dcp_it_empty_in.h5"), out("dcp_it_empty_out.h5");
  { Hdf5File f(in.path, Hdf5File::Mode::Truncate); }
  PipelineConfig cfg;
  cfg.input_path = in.path;
  cfg.output_path = out.path;
  CHECK_THROWS_AS(run_pipeline(cfg), IoError);
}
