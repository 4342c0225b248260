#include "dcp/logger.hpp"
#include "dcp/writer.hpp"
#include <chrono>

namespace dcp {
QueueCollector::QueueCollector(ExtractionShared& shared, WriterDeque& writer_dq, int num_frames)
    : shared_(shared), writer_dq_(writer_dq), num_frames_(num_frames) {}

QueueCollector::~QueueCollector() {
    request_stop();
    if (thread_.joinable()) thread_.join();
}

void QueueCollector::start() {
    thread_ = std::thread([this] {
        try {
            run();
        } catch (...) {
            error_ = std::current_exception();
            if (on_error_) on_error_();
        }
    });
}

void QueueCollector::join() {
    if (thread_.joinable()) thread_.join();
    if (error_) std::rethrow_exception(error_);
}

void QueueCollector::run() {
    while (next_ < num_frames_ && !stop_.load()) {
        auto item = shared_.event_queue.pop(std::chrono::milliseconds(100));
        if (!item) continue;
        int index = item->index;
        if (index < next_ || buffer_.count(index))
            throw std::logic_error("Frame " + std::to_string(index) + " was reported twice");
        buffer_.emplace(index, std::move(*item));
        for (auto it = buffer_.find(next_); it != buffer_.end(); it = buffer_.find(next_)) {
            writer_dq_.push(std::move(it->second));
            buffer_.erase(it);
            ++next_;
        }
    }
    Logger::debug("[collector] Forwarded %d of %d frames", next_, num_frames_);
}

DequeWriter::DequeWriter(WriterDeque& writer_dq, EventSink& sink, int num_frames)
    : writer_dq_(writer_dq), sink_(sink), num_frames_(num_frames) {}

DequeWriter::~DequeWriter() {
    request_stop();
    if (thread_.joinable()) thread_.join();
}

void DequeWriter::start() {
    thread_ = std::thread([this] {
        try {
            run();
        } catch (...) {
            error_ = std::current_exception();
            if (on_error_) on_error_();
        }
    });
}

void DequeWriter::join() {
    if (thread_.joinable()) thread_.join();
    if (error_) std::rethrow_exception(error_);
}

void DequeWriter::run() {
    while (frames_ < num_frames_) {
        auto item = writer_dq_.pop(std::chrono::milliseconds(100));
        if (!item) {
            if (stop_.load()) break;
            continue;
        }
        if (item->events && !item->events->empty()) {
            sink_.write(item->index, *item->events);
            events_ += item->events->size();
        }
        ++frames_;
    }
    sink_.flush();
    Logger::debug("[writer] Wrote %llu events from %d frames", static_cast<unsigned long long>(events_), frames_);
}
}
