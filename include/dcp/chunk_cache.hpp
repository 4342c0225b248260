#pragma once
#include "array_source.hpp"
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dcp {
// Lazy, restartable range of chunk indices [0, n).
class IndexRange {
public:
    class iterator {
    public:
        explicit iterator(int i) : i_(i) {}
        int operator*() const { return i_; }
        iterator& operator++() { ++i_; return *this; }
        bool operator!=(const iterator& o) const { return i_ != o.i_; }
        bool operator==(const iterator& o) const { return i_ == o.i_; }
    private:
        int i_;
    };

    explicit IndexRange(int n) : n_(n) {}
    iterator begin() const { return iterator(0); }
    iterator end() const { return iterator(n_); }
    int size() const { return n_; }

private:
    int n_;
};

// Chunk bookkeeping shared by the raw and corrected caches: index resolution,
// bounds checks and a first-in-first-out store of materialized chunks.
// Accessing a resident chunk never changes its eviction position.
class ChunkCacheBase {
public:
    ChunkCacheBase(std::string name, int length, cv::Size frame_size, int chunk_size, int cache_size);
    virtual ~ChunkCacheBase() = default;

    // Frame at a global index; negative indices count from the end.
    cv::Mat get(int index);
    const ImageStack& get_chunk(int chunk_index);
    int get_chunk_size(int chunk_index) const;
    IndexRange iter_chunks() const { return IndexRange(num_chunks()); }

    int num_chunks() const { return (length_ + chunk_size_ - 1) / chunk_size_; }
    int length() const { return length_; }
    int chunk_size() const { return chunk_size_; }
    int cache_size() const { return cache_size_; }
    cv::Size frame_size() const { return frame_size_; }
    // (chunk_size, height, width)
    std::vector<int> chunk_shape() const { return {chunk_size_, frame_size_.height, frame_size_.width}; }

    bool is_cached(int chunk_index) const;
    std::vector<int> cached_chunks() const;
    int loads() const { return loads_; }

protected:
    virtual ImageStack load_chunk(int chunk_index) = 0;

private:
    int resolve(int index) const;

    std::string name_;
    int length_;
    cv::Size frame_size_;
    int chunk_size_;
    int cache_size_;
    std::deque<std::pair<int, ImageStack>> cache_;
    int loads_ = 0;
};

class ChunkedArrayCache : public ChunkCacheBase {
public:
    ChunkedArrayCache(SourcePtr source, int chunk_size = 1000, int cache_size = 5, bool boolean = false);

    const SourcePtr& source() const { return source_; }
    bool boolean() const { return boolean_; }

protected:
    ImageStack load_chunk(int chunk_index) override;

private:
    SourcePtr source_;
    bool boolean_;
};

// Background-corrected frames (raw - background, CV_16S), derived per chunk
// on first access and cached with the raw cache's capacity.
class CorrectedImageCache : public ChunkCacheBase {
public:
    CorrectedImageCache(std::shared_ptr<ChunkedArrayCache> image,
                        std::shared_ptr<ChunkedArrayCache> image_bg);

protected:
    ImageStack load_chunk(int chunk_index) override;

private:
    std::shared_ptr<ChunkedArrayCache> image_;
    std::shared_ptr<ChunkedArrayCache> image_bg_;
};
}
