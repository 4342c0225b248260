#include "dcp/execution_context.hpp"
#include "dcp/logger.hpp"

namespace dcp {
ThreadContext::~ThreadContext() {
    for (auto& t : threads_)
        if (t.joinable()) t.join();
}

void ThreadContext::start(std::vector<std::unique_ptr<EventExtractor>> workers) {
    workers_ = std::move(workers);
    for (auto& w : workers_) {
        EventExtractor* worker = w.get();
        threads_.emplace_back([worker] { worker->run(); });
    }
}

void ThreadContext::join() {
    for (auto& t : threads_)
        if (t.joinable()) t.join();
    threads_.clear();
}

void InlineContext::start(std::vector<std::unique_ptr<EventExtractor>> workers) {
    workers_ = std::move(workers);
    for (auto& w : workers_) Logger::info("%s Ready (inline)", w->tag().c_str());
}

void InlineContext::pump() {
    for (auto& w : workers_)
        while (w->process_next(std::chrono::milliseconds(0))) {
        }
}

void InlineContext::join() {
    pump();
}

std::unique_ptr<ExecutionContext> make_execution_context(bool debug) {
    if (debug) return std::make_unique<InlineContext>();
    return std::make_unique<ThreadContext>();
}
}
