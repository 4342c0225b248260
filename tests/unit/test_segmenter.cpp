#include <doctest/doctest.h>
#include "dcp/errors.hpp"
#include "dcp/segmenter.hpp"
#include <chrono>

using namespace dcp;
using namespace std::chrono_literals;

static cv::Mat scene() {
  cv::Mat corr(30, 40, CV_16S, cv::Scalar(0));
  cv::circle(corr, {12, 15}, 5, cv::Scalar(-20), cv::FILLED);
  corr.at<short>(15, 12) = 0;                                 // hole
  cv::rectangle(corr, {0, 2}, {3, 6}, cv::Scalar(-20), cv::FILLED);  // touches the border
  cv::circle(corr, {30, 15}, 3, cv::Scalar(-30), cv::FILLED);
  return corr;
}

TEST_CASE("threshold segmentation labels inner objects"){
  SegmenterThresh seg;
  cv::Mat labels;
  int n = seg.segment_frame(scene(), labels);
  CHECK(n == 2);
  CHECK(labels.type() == CV_16S);
  CHECK(labels.at<short>(15, 12) > 0);  // hole filled
  CHECK(labels.at<short>(4, 1) == 0);   // cleared
  CHECK(labels.at<short>(15, 30) > 0);
  CHECK(labels.at<short>(15, 30) != labels.at<short>(15, 12));
}

TEST_CASE("mask post-processing can be disabled"){
  SegmenterThresh seg(ThreshParams{}, MaskPostParams{false, false, 0});
  cv::Mat mask = seg.segment_mask(scene());
  CHECK(mask.at<uchar>(15, 12) == 0);
  CHECK(mask.at<uchar>(4, 1) == 255);
  cv::Mat labels;
  CHECK(seg.segment_frame(scene(), labels) == 3);
}

TEST_CASE("positive thresholds are rejected"){
  CHECK_THROWS_AS(SegmenterThresh(ThreshParams{1}), ConfigError);
  CHECK_THROWS_AS(MaskPostParams::from_kwargs({{"closing_disk", -1}}), ConfigError);
}

TEST_CASE("segmenter manager fills free slots in chunk order"){
  cv::Size sz(40, 30);
  ImageStack raw(5, sz, CV_8U), bg(5, sz, CV_8U);
  raw.data.setTo(100);
  bg.data.setTo(100);
  cv::Mat f2 = raw.frame(2);
  cv::circle(f2, {20, 15}, 4, cv::Scalar(50), cv::FILLED);
  auto ri = std::make_shared<ChunkedArrayCache>(std::make_shared<MemoryArray>("raw", raw), 2, 2);
  auto bi = std::make_shared<ChunkedArrayCache>(std::make_shared<MemoryArray>("bg", bg), 2, 2);
  CorrectedImageCache corr(ri, bi);

  SlotArray slots(2, 2, sz);
  SegmenterManager mgr(SegmenterThresh{}, corr, slots);
  mgr.start();

  std::vector<int> chunks;
  int last = -1;
  while ((int)chunks.size() < 3) {
    uint64_t seen = slots.version();
    int slot = slots.find(SlotState::Extract, last + 1);
    if (slot < 0) { slots.wait_for_change(seen, 100ms); continue; }
    REQUIRE(slots.try_claim(slot));
    int chunk = slots.chunk(slot);
    chunks.push_back(chunk);
    if (chunk == 1) CHECK(slots.label_counts(slot) == std::vector<int>{1, 0});
    if (chunk == 2) CHECK(slots.label_counts(slot).size() == 1);
    slots.release(slot);
    last = slot;
  }
  mgr.join();
  CHECK(chunks == std::vector<int>{0, 1, 2});
  CHECK(mgr.chunks_segmented() == 3);
}
