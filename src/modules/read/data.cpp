#include "dcp/data.hpp"
#include "dcp/ppid.hpp"

namespace dcp {
MeasurementData::MeasurementData(SourcePtr image, SourcePtr image_bg, double pixel_size,
                                 int chunk_size, int cache_size)
    : image_src_(std::move(image)), image_bg_src_(std::move(image_bg)), pixel_size_(pixel_size) {
    image_ = std::make_shared<ChunkedArrayCache>(image_src_, chunk_size, cache_size);
    image_bg_ = std::make_shared<ChunkedArrayCache>(image_bg_src_, chunk_size, cache_size);
    image_corr_ = std::make_shared<CorrectedImageCache>(image_, image_bg_);
}

std::unique_ptr<MeasurementData> MeasurementData::clone() const {
    return std::make_unique<MeasurementData>(image_src_, image_bg_src_, pixel_size_,
                                             image_->chunk_size(), image_->cache_size());
}

std::string MeasurementData::get_ppid() const {
    return get_ppid_code() + ":" + kwargs_to_ppid({{"pixel_size", 0.0}}, {{"pixel_size", pixel_size_}});
}
}
