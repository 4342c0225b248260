#pragma once
#include "blocking_queue.hpp"
#include "extraction_shared.hpp"
#include "hdf5_array.hpp"
#include <atomic>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace dcp {
using WriterDeque = BlockingQueue<FrameEvents>;

// Destination of the extracted events, frame by frame in input order.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void write(int frame, const EventBatch& events) = 0;
    virtual void flush() {}
};

class MemoryEventSink : public EventSink {
public:
    void write(int frame, const EventBatch& events) override;

    size_t size() const { return frames.size(); }

    std::vector<int> frames;  // input frame of every event
    std::vector<cv::Mat> masks;
    FeatureMap features;
};

// Appends events to "events/<feature>", "events/frame" and the (N, H, W)
// "events/mask" stack of an HDF5 file, in batches of `batch_size` events.
class Hdf5EventSink : public EventSink {
public:
    Hdf5EventSink(FilePtr file, cv::Size frame_size, int batch_size = 1000);
    ~Hdf5EventSink() override;

    void write(int frame, const EventBatch& events) override;
    void flush() override;

    int events_written() const { return written_; }

private:
    FilePtr file_;
    cv::Size frame_size_;
    int batch_size_;
    std::shared_ptr<Hdf5ImageDataset> masks_out_;
    MemoryEventSink pending_;
    int written_ = 0;
};

// Drains the unordered event queue of the extraction workers and forwards
// frames to the writer deque in input order.
class QueueCollector {
public:
    QueueCollector(ExtractionShared& shared, WriterDeque& writer_dq, int num_frames);
    ~QueueCollector();

    void start();
    void join();
    void run();
    void request_stop() { stop_.store(true); }
    // Called on the collector thread right after it failed.
    void set_on_error(std::function<void()> callback) { on_error_ = std::move(callback); }

    int frames_forwarded() const { return next_; }

private:
    ExtractionShared& shared_;
    WriterDeque& writer_dq_;
    int num_frames_;
    int next_ = 0;
    std::map<int, FrameEvents> buffer_;
    std::atomic<bool> stop_{false};
    std::function<void()> on_error_;
    std::thread thread_;
    std::exception_ptr error_;
};

// Writes the frames of the writer deque to a sink.
class DequeWriter {
public:
    DequeWriter(WriterDeque& writer_dq, EventSink& sink, int num_frames);
    ~DequeWriter();

    void start();
    // Rethrows an exception raised on the writer thread.
    void join();
    void run();
    void request_stop() { stop_.store(true); }
    // Called on the writer thread right after it failed, so that the
    // producers stop instead of filling the deque.
    void set_on_error(std::function<void()> callback) { on_error_ = std::move(callback); }

    int frames_written() const { return frames_; }
    uint64_t events_written() const { return events_; }

private:
    WriterDeque& writer_dq_;
    EventSink& sink_;
    int num_frames_;
    int frames_ = 0;
    uint64_t events_ = 0;
    std::atomic<bool> stop_{false};
    std::function<void()> on_error_;
    std::thread thread_;
    std::exception_ptr error_;
};
}
