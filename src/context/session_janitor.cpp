#include "vrpassist/context/session_janitor.hpp"

#include <spdlog/spdlog.h>

namespace vrpassist::context {

SessionJanitor::SessionJanitor(ContextStore& store,
                               std::chrono::seconds interval,
                               std::chrono::seconds max_age)
    : store_(store)
    , interval_(interval)
    , max_age_(max_age)
{
}

SessionJanitor::~SessionJanitor() {
    stop();
}

void SessionJanitor::start() {
    if (thread_) {
        return;
    }

    spdlog::info("Session janitor evicting entries older than {}s every {}s",
                 max_age_.count(), interval_.count());
    thread_ = std::make_unique<std::jthread>([this](std::stop_token stop) { run(stop); });
}

void SessionJanitor::stop() {
    if (!thread_) {
        return;
    }

    thread_->request_stop();
    cv_.notify_all();
    if (thread_->joinable()) {
        thread_->join();
    }
    thread_.reset();
}

size_t SessionJanitor::total_evicted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_evicted_;
}

void SessionJanitor::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Sleeps the full interval unless a stop is requested
            cv_.wait_for(lock, stop, interval_, [] { return false; });
            if (stop.stop_requested()) {
                break;
            }
        }

        const size_t removed = store_.evict_older_than(max_age_);

        std::lock_guard<std::mutex> lock(mutex_);
        total_evicted_ += removed;
    }
}

}  // namespace vrpassist::context
