#include "dcp/errors.hpp"
#include "dcp/logger.hpp"
#include "dcp/writer.hpp"
#include <opencv2/imgproc.hpp>
#include <limits>

namespace dcp {
void MemoryEventSink::write(int frame, const EventBatch& events) {
    const size_t before = frames.size();
    for (size_t i = 0; i < events.size(); ++i) {
        frames.push_back(frame);
        masks.push_back(events.masks[i]);
    }
    for (auto& kv : events.features) {
        auto& column = features[kv.first];
        // columns that appear late are padded for the earlier events
        column.resize(before, std::numeric_limits<double>::quiet_NaN());
        column.insert(column.end(), kv.second.begin(), kv.second.end());
    }
}

Hdf5EventSink::Hdf5EventSink(FilePtr file, cv::Size frame_size, int batch_size)
    : file_(std::move(file)), frame_size_(frame_size), batch_size_(batch_size) {
    if (!file_->writable()) throw IoError(file_->path() + " is not writable");
    if (file_->has("events/mask")) throw IoError(file_->path() + " already contains events");
}

Hdf5EventSink::~Hdf5EventSink() {
    try {
        flush();
    } catch (const std::exception& e) {
        Logger::error("[writer] Could not flush events to %s: %s", file_->path().c_str(),
                      describe(e).c_str());
    }
}

void Hdf5EventSink::write(int frame, const EventBatch& events) {
    pending_.write(frame, events);
    if (static_cast<int>(pending_.size()) >= batch_size_) flush();
}

void Hdf5EventSink::flush() {
    const int n = static_cast<int>(pending_.size());
    if (n == 0) return;
    if (!masks_out_) masks_out_ = Hdf5ImageDataset::create(file_, "events/mask", frame_size_, CV_8U, 0);

    ImageStack rows(n, frame_size_, CV_8U);
    for (int i = 0; i < n; ++i) {
        cv::Mat dst = rows.frame(i);
        // stored as 0/1
        cv::threshold(pending_.masks[i], dst, 0, 1, cv::THRESH_BINARY);
    }
    masks_out_->resize(written_ + n);
    masks_out_->write(written_, rows);

    std::vector<double> frames(pending_.frames.begin(), pending_.frames.end());
    file_->append_vector("events/frame", frames);
    for (auto& kv : pending_.features) {
        kv.second.resize(n, std::numeric_limits<double>::quiet_NaN());
        file_->append_vector("events/" + kv.first, kv.second);
    }
    written_ += n;
    pending_ = MemoryEventSink();
    file_->flush();
}
}
