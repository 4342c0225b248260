#include <doctest/doctest.h>
#include "dcp/chunk_cache.hpp"
#include "dcp/errors.hpp"
#include "dcp/hdf5_array.hpp"
#include <cstdio>
#include <filesystem>

using namespace dcp;

namespace {
struct TempFile {
  std::string path;
  explicit TempFile(const std::string& name)
      : path((std::filesystem::temp_directory_path() / name).string()) { std::remove(path.c_str()); }
  ~TempFile() { std::remove(path.c_str()); }
};
}  // namespace

TEST_CASE("image dataset write and slice read"){
  TempFile tmp("dcp_test_images.h5");
  auto file = std::make_shared<Hdf5File>(tmp.path, Hdf5File::Mode::Truncate);
  auto ds = Hdf5ImageDataset::create(file, "events/image", cv::Size(6, 4), CV_8U, 5);
  CHECK(ds->length() == 5);
  CHECK(ds->frame_size() == cv::Size(6, 4));
  CHECK(ds->type() == CV_8U);
  CHECK(file->has("events/image"));
  CHECK(file->has("/events"));
  CHECK_FALSE(file->has("events/image_bg"));

  ImageStack rows(5, cv::Size(6, 4), CV_8U);
  for (int i = 0; i < 5; ++i) rows.data.row(i).setTo(10 * i);
  rows.frame(2).at<uchar>(3, 5) = 255;
  ds->write(0, rows);

  ImageStack part = ds->read(1, 3);
  REQUIRE(part.size() == 2);
  CHECK(part.frame(0).at<uchar>(0, 0) == 10);
  CHECK(part.frame(1).at<uchar>(3, 5) == 255);
  CHECK(part.frame(1).at<uchar>(3, 4) == 20);
  CHECK(ds->read(3, 100).size() == 2);
  CHECK_THROWS_AS(ds->read(4, 2), OutOfBounds);
  CHECK_THROWS_AS(ds->write(4, rows.rows(0, 2)), OutOfBounds);
}

TEST_CASE("image dataset resize and reopen"){
  TempFile tmp("dcp_test_resize.h5");
  {
    auto file = std::make_shared<Hdf5File>(tmp.path, Hdf5File::Mode::Truncate);
    auto ds = Hdf5ImageDataset::create(file, "events/image_bg", cv::Size(3, 2), CV_16S, 0);
    CHECK(ds->length() == 0);
    ds->resize(4);
    ImageStack rows(4, cv::Size(3, 2), CV_16S);
    rows.data.setTo(-7);
    ds->write(0, rows);
  }
  auto file = std::make_shared<Hdf5File>(tmp.path, Hdf5File::Mode::ReadOnly);
  CHECK_FALSE(file->writable());
  Hdf5ImageDataset ds(file, "events/image_bg");
  CHECK(ds.length() == 4);
  CHECK(ds.type() == CV_16S);
  CHECK(ds.read(3, 4).frame(0).at<short>(1, 2) == -7);
  std::vector<hsize_t> dims = file->dims("events/image_bg");
  CHECK(dims == std::vector<hsize_t>{4, 2, 3});
}

TEST_CASE("chunk cache over an HDF5 dataset"){
  TempFile tmp("dcp_test_cache.h5");
  auto file = std::make_shared<Hdf5File>(tmp.path, Hdf5File::Mode::Truncate);
  auto ds = Hdf5ImageDataset::create(file, "events/image", cv::Size(4, 4), CV_8U, 7);
  ImageStack rows(7, cv::Size(4, 4), CV_8U);
  for (int i = 0; i < 7; ++i) rows.data.row(i).setTo(i + 1);
  ds->write(0, rows);

  ChunkedArrayCache cache(ds, 3, 2);
  CHECK(cache.num_chunks() == 3);
  CHECK(cache.get_chunk_size(2) == 1);
  CHECK(cache.get(-1).at<uchar>(0, 0) == 7);
  CHECK(cache.get(4).at<uchar>(2, 2) == 5);
}

TEST_CASE("vectors and attributes"){
  TempFile tmp("dcp_test_attrs.h5");
  auto file = std::make_shared<Hdf5File>(tmp.path, Hdf5File::Mode::Truncate);
  file->append_vector("events/frame", {1, 2, 3});
  file->append_vector("events/frame", {});
  file->append_vector("events/frame", {4});
  CHECK(file->read_vector("events/frame") == std::vector<double>{1, 2, 3, 4});

  CHECK_FALSE(file->has_attr("imaging:pixel size"));
  file->set_attr("imaging:pixel size", 0.34);
  file->set_attr("pipeline:hash", std::string("abc"));
  file->set_attr("pipeline:hash", std::string("ec11977f"));
  file->set_attr("pipeline:empty", std::string());
  file->flush();
  CHECK(file->has_attr("imaging:pixel size"));
  CHECK(file->attr_double("imaging:pixel size") == doctest::Approx(0.34));
  CHECK(file->attr_string("pipeline:hash") == "ec11977f");
  CHECK(file->attr_string("pipeline:empty").empty());
  CHECK_THROWS_AS(file->attr_string("imaging:pixel size"), IoError);
  CHECK_THROWS_AS(file->attr_double("pipeline:missing"), IoError);
}

TEST_CASE("opening a missing file fails"){
  TempFile tmp("dcp_test_missing.h5");
  CHECK_THROWS_AS(Hdf5File(tmp.path, Hdf5File::Mode::ReadOnly), IoError);
}

TEST_CASE("boolean enum datasets read as 0/1 uint8"){
  TempFile tmp("dcp_test_bool.h5");
  auto file = std::make_shared<Hdf5File>(tmp.path, Hdf5File::Mode::Truncate);
  {
    // Same layout h5py uses for numpy bool arrays.
    signed char no = 0, yes = 1;
    hid_t etype = H5Tenum_create(H5T_NATIVE_INT8);
    H5Tenum_insert(etype, "FALSE", &no);
    H5Tenum_insert(etype, "TRUE", &yes);
    hsize_t dims[3] = {2, 3, 4};
    hid_t space = H5Screate_simple(3, dims, nullptr);
    hid_t ds = H5Dcreate2(file->id(), "mask", etype, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    REQUIRE(ds >= 0);
    signed char values[24] = {0};
    values[5] = 1;
    values[12 + 11] = 1;
    CHECK(H5Dwrite(ds, etype, H5S_ALL, H5S_ALL, H5P_DEFAULT, values) >= 0);
    H5Dclose(ds);
    H5Sclose(space);
    H5Tclose(etype);
  }

  auto ds = std::make_shared<Hdf5ImageDataset>(file, "mask");
  CHECK(ds->type() == CV_8U);
  CHECK(ds->frame_size() == cv::Size(4, 3));
  ImageStack all = ds->read(0, 2);
  CHECK(all.frame(0).at<uchar>(1, 1) == 1);
  CHECK(all.frame(1).at<uchar>(2, 3) == 1);
  CHECK(cv::countNonZero(all.data) == 2);

  ImageStack rows(1, cv::Size(4, 3), CV_8U);
  rows.frame(0).at<uchar>(0, 2) = 255;
  ds->write(1, rows);
  ImageStack back = ds->read(1, 2);
  CHECK(back.frame(0).at<uchar>(0, 2) == 1);
  CHECK(cv::countNonZero(back.data) == 1);

  ChunkedArrayCache cache(ds, 2, 1, true);
  CHECK(cache.get(0).at<uchar>(1, 1) == 1);
}
