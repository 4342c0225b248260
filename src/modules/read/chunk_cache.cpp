#include "dcp/chunk_cache.hpp"
#include "dcp/errors.hpp"
#include <algorithm>

namespace dcp {
ChunkCacheBase::ChunkCacheBase(std::string name, int length, cv::Size frame_size, int chunk_size,
                               int cache_size)
    : name_(std::move(name)), length_(length), frame_size_(frame_size),
      chunk_size_(chunk_size), cache_size_(cache_size) {
    if (chunk_size <= 0) throw ConfigError(name_ + ": chunk_size must be positive");
    if (cache_size <= 0) throw ConfigError(name_ + ": cache_size must be positive");
}

int ChunkCacheBase::resolve(int index) const {
    int resolved = index < 0 ? length_ + index : index;
    if (resolved < 0 || resolved >= length_)
        throw OutOfBounds("Index " + std::to_string(index) + " out of bounds for " + name_ +
                          " of size " + std::to_string(length_));
    return resolved;
}

cv::Mat ChunkCacheBase::get(int index) {
    int i = resolve(index);
    return get_chunk(i / chunk_size_).frame(i % chunk_size_);
}

const ImageStack& ChunkCacheBase::get_chunk(int chunk_index) {
    if (chunk_index < 0 || chunk_index >= num_chunks())
        throw OutOfBounds("Chunk " + std::to_string(chunk_index) + " out of bounds for " + name_ +
                          " with " + std::to_string(num_chunks()) + " chunks");
    for (auto& entry : cache_)
        if (entry.first == chunk_index) return entry.second;

    cache_.emplace_back(chunk_index, load_chunk(chunk_index));
    ++loads_;
    if (static_cast<int>(cache_.size()) > cache_size_) cache_.pop_front();
    return cache_.back().second;
}

int ChunkCacheBase::get_chunk_size(int chunk_index) const {
    if (chunk_index < 0 || chunk_index >= num_chunks())
        throw OutOfBounds(name_ + " only has " + std::to_string(num_chunks()) + " chunks");
    if (chunk_index < num_chunks() - 1) return chunk_size_;
    int rest = length_ % chunk_size_;
    return rest == 0 ? chunk_size_ : rest;
}

bool ChunkCacheBase::is_cached(int chunk_index) const {
    return std::any_of(cache_.begin(), cache_.end(),
                       [&](const auto& e) { return e.first == chunk_index; });
}

std::vector<int> ChunkCacheBase::cached_chunks() const {
    std::vector<int> out;
    for (auto& e : cache_) out.push_back(e.first);
    return out;
}

ChunkedArrayCache::ChunkedArrayCache(SourcePtr source, int chunk_size, int cache_size, bool boolean)
    : ChunkCacheBase("ChunkedArrayCache", source->length(), source->frame_size(), chunk_size,
                     cache_size),
      source_(std::move(source)), boolean_(boolean) {}

ImageStack ChunkedArrayCache::load_chunk(int chunk_index) {
    int start = chunk_index * chunk_size();
    ImageStack data = source_->read(start, start + chunk_size());
    if (boolean_) {
        cv::Mat mask;
        cv::compare(data.data, 0, mask, cv::CMP_NE);
        data.data = mask / 255;
    }
    return data;
}

CorrectedImageCache::CorrectedImageCache(std::shared_ptr<ChunkedArrayCache> image,
                                         std::shared_ptr<ChunkedArrayCache> image_bg)
    : ChunkCacheBase("CorrectedImageCache", image->length(), image->frame_size(),
                     image->chunk_size(), image->cache_size()),
      image_(std::move(image)), image_bg_(std::move(image_bg)) {
    if (image_bg_->length() != image_->length() || image_bg_->frame_size() != image_->frame_size())
        throw ConfigError("Background image stack does not match the image stack");
    if (image_bg_->chunk_size() != image_->chunk_size())
        throw ConfigError("Background cache must use the image cache's chunk size");
}

ImageStack CorrectedImageCache::load_chunk(int chunk_index) {
    // Hold the headers: the cache entries may be evicted by later lookups.
    ImageStack raw = image_->get_chunk(chunk_index);
    ImageStack bg = image_bg_->get_chunk(chunk_index);
    ImageStack corr;
    corr.frame_size = raw.frame_size;
    cv::subtract(raw.data, bg.data, corr.data, cv::noArray(), CV_16S);
    return corr;
}
}
