#pragma once

#include "vrpassist/context/context_store.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace vrpassist::context {

// Background thread that periodically evicts stale sessions from a store
class SessionJanitor {
public:
    SessionJanitor(ContextStore& store,
                   std::chrono::seconds interval,
                   std::chrono::seconds max_age);
    ~SessionJanitor();

    SessionJanitor(const SessionJanitor&) = delete;
    SessionJanitor& operator=(const SessionJanitor&) = delete;

    void start();

    // Wakes the thread and joins it
    void stop();

    bool is_running() const { return thread_ != nullptr; }

    // Total entries removed since start()
    size_t total_evicted() const;

private:
    ContextStore& store_;
    std::chrono::seconds interval_;
    std::chrono::seconds max_age_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    size_t total_evicted_ = 0;
    std::unique_ptr<std::jthread> thread_;

    void run(std::stop_token stop);
};

}  // namespace vrpassist::context
