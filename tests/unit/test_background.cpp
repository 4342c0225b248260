#include <doctest/doctest.h>
#include "dcp/background.hpp"
#include "dcp/errors.hpp"
#include "dcp/stats.hpp"
#include <algorithm>

using namespace dcp;

TEST_CASE("time axis preference"){
  TimeInfo rec;
  rec.time = {5, 6, 7.5};
  rec.frame_rate = 100;
  CHECK(BackgroundSparseMedian::build_time_axis(3, rec) == std::vector<double>{0, 1, 2.5});

  TimeInfo fr;
  fr.frame = {10, 12, 20};
  fr.frame_rate = 2;
  CHECK(BackgroundSparseMedian::build_time_axis(3, fr) == std::vector<double>{0, 1, 5});

  TimeInfo rate;
  rate.frame_rate = 2;
  auto t = BackgroundSparseMedian::build_time_axis(5, rate);
  REQUIRE(t.size() == 5);
  CHECK(t.front() == 0);
  CHECK(t.back() == doctest::Approx(3.75));

  auto g = BackgroundSparseMedian::build_time_axis(3600, TimeInfo{});
  CHECK(g.back() == doctest::Approx(1.5));
}

TEST_CASE("step times and windows"){
  CHECK(BackgroundSparseMedian::make_step_times(2.5, 1) == std::vector<double>{0, 1, 2});
  CHECK(BackgroundSparseMedian::make_step_times(3, 1) == std::vector<double>{0, 1, 2});
  CHECK(BackgroundSparseMedian::make_step_times(0, 1) == std::vector<double>{0});

  std::vector<double> time{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
  CHECK(BackgroundSparseMedian::window_start(time, 2, 4) == 2);
  CHECK(BackgroundSparseMedian::window_start(time, 8, 4) == 6);
  CHECK(BackgroundSparseMedian::window_start(time, 100, 10) == 0);
}

TEST_CASE("nearest background with ties to the earlier image"){
  std::vector<double> time{0, 0.4, 0.5, 0.6, 1.5, 3, 10};
  auto idx = BackgroundSparseMedian::assign_background(time, {0, 1, 2});
  CHECK(idx == std::vector<int>{0, 0, 0, 1, 1, 2, 2});
  CHECK_THROWS_AS(BackgroundSparseMedian::assign_background(time, {}), ConfigError);
}

TEST_CASE("median worker pool matches a sorted median"){
  cv::RNG rng(42);
  cv::Mat window(7, 1234, CV_8U);
  rng.fill(window, cv::RNG::UNIFORM, 0, 256);
  MedianWorkerPool pool(3, 7, 1234, 100);
  cv::Mat med = pool.median(window);
  for (int p = 0; p < 1234; p += 37) {
    std::vector<uchar> col;
    for (int r = 0; r < 7; ++r) col.push_back(window.at<uchar>(r, p));
    std::sort(col.begin(), col.end());
    CHECK(med.at<uchar>(0, p) == col[3]);
  }
  CHECK_THROWS_AS(pool.median(cv::Mat(6, 1234, CV_8U)), ConfigError);
}

TEST_CASE("sparse median writes the assigned background per frame"){
  cv::Size sz(6, 4);
  ImageStack in(12, sz, CV_8U);
  for (int i = 0; i < 12; ++i) in.data.row(i).setTo(50 + i);
  auto src = std::make_shared<MemoryArray>("image", in);
  auto dst = std::make_shared<MemoryArray>("image_bg", sz, CV_8U);

  SparseMedianParams p;
  p.kernel_size = 5;
  p.split_time = 4;
  p.frac_cleansing = 1;
  TimeInfo ti;
  for (int i = 0; i < 12; ++i) ti.time.push_back(i);
  BackgroundSparseMedian bg(src, dst, p, ti, 2);
  bg.process();

  CHECK(bg.step_times() == std::vector<double>{0, 4, 8});
  REQUIRE(dst->length() == 12);
  int expect[12] = {52, 52, 52, 56, 56, 56, 56, 59, 59, 59, 59, 59};
  for (int i = 0; i < 12; ++i) CHECK(dst->frame(i).at<uchar>(3, 5) == expect[i]);
  CHECK(bg.get_ppid() == "sparsemed:k=5^s=4^t=0^f=1");
}

TEST_CASE("kernel size is clamped to the input"){
  auto src = std::make_shared<MemoryArray>("image", cv::Size(3, 3), CV_8U, 5);
  auto dst = std::make_shared<MemoryArray>("image_bg", cv::Size(3, 3), CV_8U);
  BackgroundSparseMedian bg(src, dst, SparseMedianParams{}, {}, 1);
  CHECK(bg.params().kernel_size == 5);
  CHECK_THROWS_AS(BackgroundSparseMedian(src, dst, SparseMedianParams{0}, {}, 1), ConfigError);
}

TEST_CASE("ppid round trip of the background parameters"){
  auto kw = BackgroundSparseMedian::get_ppkw_from_ppid("sparsemed:k=150^f=0.9");
  auto p = SparseMedianParams::from_kwargs(kw);
  CHECK(p.kernel_size == 150);
  CHECK(p.split_time == 1);
  CHECK(p.frac_cleansing == doctest::Approx(0.9));
  CHECK(BackgroundSparseMedian::get_ppid_from_ppkw(kw) == "sparsemed:k=150^s=1^t=0^f=0.9");
}

static std::vector<cv::Mat> series_with_objects() {
  std::vector<cv::Mat> images;
  for (int i = 0; i < 20; ++i) {
    cv::Mat im(40, 10, CV_8U, cv::Scalar(100));
    if (i == 5 || i == 13) im(cv::Rect(3, 15, 4, 10)).setTo(20);
    images.push_back(im);
  }
  return images;
}

TEST_CASE("cleansing removes images with objects"){
  auto used = BackgroundSparseMedian::cleanse(series_with_objects(), 0, 0.9);
  REQUIRE(used.size() == 20);
  CHECK_FALSE(used[5]);
  CHECK_FALSE(used[13]);
  CHECK(std::count(used.begin(), used.end(), true) == 18);

  used = BackgroundSparseMedian::cleanse(series_with_objects(), 1e9, 0.8);
  CHECK(std::count(used.begin(), used.end(), true) == 18);
}

TEST_CASE("cleansing falls back to the quantile cutoff"){
  // 1e9 would remove 10%, more than frac_cleansing = 0.95 allows
  auto used = BackgroundSparseMedian::cleanse(series_with_objects(), 1e9, 0.95);
  CHECK(std::count(used.begin(), used.end(), true) == 20);
  used = BackgroundSparseMedian::cleanse(series_with_objects(), 0, 1);
  CHECK(std::count(used.begin(), used.end(), true) == 20);
}

TEST_CASE("stats helpers"){
  CHECK(median({3, 1, 2}) == 2);
  CHECK(median({4, 1, 2, 3}) == 2.5);
  CHECK(quantile({0, 10}, 0.25) == 2.5);
  auto f = median_filter_1d({0, 0, 9, 0, 0}, 3);
  CHECK(f == std::vector<double>{0, 0, 0, 0, 0});
  CHECK(median_filter_1d({1, 2, 3}, 2) == std::vector<double>{1, 2, 3});
}
