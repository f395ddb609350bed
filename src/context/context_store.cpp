#include "vrpassist/context/context_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace vrpassist::context {

namespace {

// Longest age the clock's duration can hold
constexpr auto kMaxComparableAge = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max());

}  // namespace

Json SessionContext::to_json() const {
    return Json{
        {"sessionId", session_id},
        {"request", problem.to_json()},
        {"solution", solution ? solution->to_json() : Json(nullptr)},
        {"updatedAt", to_unix_seconds(updated_at)}
    };
}

ContextStore::ContextStore()
    : now_([] { return Clock::now(); })
{
}

ContextStore::ContextStore(NowFn now)
    : now_(std::move(now))
{
}

void ContextStore::save(const SessionId& id, vrp::Problem problem,
                        std::optional<vrp::Solution> solution) {
    const size_t job_count = problem.jobs.size();
    const size_t resource_count = problem.resources.size();
    const bool has_solution = solution.has_value();
    size_t total = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        contexts_[id] = SessionContext{
            .session_id = id,
            .problem = std::move(problem),
            .solution = std::move(solution),
            .updated_at = now_()
        };
        total = contexts_.size();
    }

    spdlog::info("Saved VRP context for session {} (jobs={}, resources={}, solution={}, sessions={})",
                 id, job_count, resource_count, has_solution, total);
}

std::optional<SessionContext> ContextStore::get(const SessionId& id) const {
    std::optional<SessionContext> snapshot;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(id);
        if (it != contexts_.end()) {
            snapshot = it->second;
        }
    }

    if (!snapshot) {
        spdlog::debug("No VRP context for session {}", id);
    }
    return snapshot;
}

bool ContextStore::update_solution(const SessionId& id, vrp::Solution solution) {
    bool updated = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(id);
        if (it != contexts_.end()) {
            it->second.solution = std::move(solution);
            it->second.updated_at = now_();
            updated = true;
        }
    }

    if (updated) {
        spdlog::info("Updated solution for session {}", id);
    } else {
        spdlog::warn("Attempted to update solution of unknown session {}", id);
    }
    return updated;
}

bool ContextStore::remove(const SessionId& id) {
    size_t erased = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        erased = contexts_.erase(id);
    }

    if (erased > 0) {
        spdlog::info("Deleted VRP context for session {}", id);
    }
    return erased > 0;
}

std::vector<SessionId> ContextStore::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SessionId> ids;
    ids.reserve(contexts_.size());
    for (const auto& [id, ctx] : contexts_) {
        ids.push_back(id);
    }
    return ids;
}

size_t ContextStore::evict_older_than(std::chrono::seconds max_age) {
    size_t removed = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const TimePoint now = now_();
        const Clock::duration limit = std::min(max_age, kMaxComparableAge);

        for (auto it = contexts_.begin(); it != contexts_.end();) {
            if (now - it->second.updated_at > limit) {
                it = contexts_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        spdlog::info("Evicted {} session(s) older than {}s", removed, max_age.count());
    }
    return removed;
}

size_t ContextStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

}  // namespace vrpassist::context
