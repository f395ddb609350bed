#pragma once

#include "vrpassist/core/types.hpp"
#include "vrpassist/vrp/model.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vrpassist::context {

using namespace vrpassist::core;

// Most recent problem/solution pair for one session
struct SessionContext {
    SessionId session_id;
    vrp::Problem problem;
    std::optional<vrp::Solution> solution;
    TimePoint updated_at;

    bool has_solution() const { return solution.has_value(); }

    Json to_json() const;
};

// Process-lifetime cache of session contexts.
//
// Every operation holds one mutex for its whole critical section, so
// operations are serialized and never observe a partial write. Callers only
// ever receive copies. Entries leave the store through remove() or
// evict_older_than(); nothing expires on its own.
class ContextStore {
public:
    using NowFn = std::function<TimePoint()>;

    ContextStore();
    explicit ContextStore(NowFn now);

    ContextStore(const ContextStore&) = delete;
    ContextStore& operator=(const ContextStore&) = delete;

    // Insert or fully replace the context for a session
    void save(const SessionId& id, vrp::Problem problem,
              std::optional<vrp::Solution> solution = std::nullopt);

    // Snapshot of the context, or nullopt if the session is unknown
    std::optional<SessionContext> get(const SessionId& id) const;

    // Replace the solution of an existing session. Returns false, and leaves
    // the store untouched, when the session does not exist.
    bool update_solution(const SessionId& id, vrp::Solution solution);

    // Remove a session; returns whether it existed
    bool remove(const SessionId& id);

    // Session ids at call time, sorted
    std::vector<SessionId> list_sessions() const;

    // Remove every entry last written more than max_age ago
    size_t evict_older_than(std::chrono::seconds max_age);

    size_t size() const;

private:
    NowFn now_;
    mutable std::mutex mutex_;
    std::map<SessionId, SessionContext> contexts_;
};

}  // namespace vrpassist::context
