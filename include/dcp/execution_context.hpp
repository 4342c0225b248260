#pragma once
#include "event_extractor.hpp"
#include <memory>
#include <thread>
#include <vector>

namespace dcp {
// Decides where extraction workers run.
class ExecutionContext {
public:
    virtual ~ExecutionContext() = default;

    virtual void start(std::vector<std::unique_ptr<EventExtractor>> workers) = 0;
    // Called after work was queued; inline contexts process it right here.
    virtual void pump() = 0;
    // Returns once every worker has left its loop (finalize must be set).
    virtual void join() = 0;
    virtual const char* name() const = 0;
};

// One std::thread per worker.
class ThreadContext : public ExecutionContext {
public:
    ~ThreadContext() override;
    void start(std::vector<std::unique_ptr<EventExtractor>> workers) override;
    void pump() override {}
    void join() override;
    const char* name() const override { return "threads"; }

private:
    std::vector<std::unique_ptr<EventExtractor>> workers_;
    std::vector<std::thread> threads_;
};

// Debug mode: workers run on the caller's thread whenever pump() is called.
class InlineContext : public ExecutionContext {
public:
    void start(std::vector<std::unique_ptr<EventExtractor>> workers) override;
    void pump() override;
    void join() override;
    const char* name() const override { return "inline"; }

private:
    std::vector<std::unique_ptr<EventExtractor>> workers_;
};

std::unique_ptr<ExecutionContext> make_execution_context(bool debug);
}
