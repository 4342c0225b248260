#pragma once
#include "array_source.hpp"
#include "chunk_cache.hpp"
#include <memory>
#include <string>

namespace dcp {
// Image, background and corrected-image access for one measurement. Caches are
// not shared between threads: every worker works on its own clone().
class MeasurementData {
public:
    MeasurementData(SourcePtr image, SourcePtr image_bg, double pixel_size,
                    int chunk_size = 1000, int cache_size = 2);

    int length() const { return image_->length(); }
    double pixel_size() const { return pixel_size_; }
    void set_pixel_size(double px) { pixel_size_ = px; }

    ChunkedArrayCache& image() { return *image_; }
    ChunkedArrayCache& image_bg() { return *image_bg_; }
    CorrectedImageCache& image_corr() { return *image_corr_; }
    const ChunkedArrayCache& image() const { return *image_; }

    // Same sources and settings, fresh caches.
    std::unique_ptr<MeasurementData> clone() const;

    static std::string get_ppid_code() { return "hdf"; }
    std::string get_ppid() const;

private:
    SourcePtr image_src_;
    SourcePtr image_bg_src_;
    double pixel_size_;
    std::shared_ptr<ChunkedArrayCache> image_;
    std::shared_ptr<ChunkedArrayCache> image_bg_;
    std::shared_ptr<CorrectedImageCache> image_corr_;
};
}
