#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <memory>
#include <optional>
#include <functional>
#include <chrono>
#include "session.h"

namespace scriptbox {

// Authoritative map from session id to session record.
//
// Two levels of locking: a map mutex held only for lookups and structural
// changes, and a per-session mutex that serializes every operation on the
// same id (a poll that caches logs and a cleanup that deletes the record
// never interleave). Operations on different ids run concurrently.
class SessionRegistry {
private:
    struct Entry {
        std::mutex mutex;
        Session session;
        bool removed = false;
    };

public:
    // Exclusive access to one live session for the lifetime of the lease
    class Lease {
    public:
        Lease() = default;
        Lease(Lease&&) = default;
        Lease& operator=(Lease&&) = default;

        explicit operator bool() const { return entry_ != nullptr; }
        Session& operator*() { return entry_->session; }
        Session* operator->() { return &entry_->session; }

    private:
        friend class SessionRegistry;
        Lease(std::shared_ptr<Entry> entry, std::unique_lock<std::mutex> lock)
            : entry_(std::move(entry)), lock_(std::move(lock)) {}

        std::shared_ptr<Entry> entry_;
        std::unique_lock<std::mutex> lock_;
    };

    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Returns false if a live session already has this id
    bool insert(Session session);

    // Blocks while another operation holds the same session.
    // An empty lease means the id is unknown or already removed.
    Lease acquire(const std::string& id);

    // Snapshot copy of the record
    std::optional<Session> get(const std::string& id);

    // Apply a mutation under the session lock; false if not found
    bool update(const std::string& id, const std::function<void(Session&)>& mutate);

    // Detach the record and return it. Waits for in-flight operations on the
    // same id; exactly one caller gets the session, the rest get nullopt.
    std::optional<Session> remove(const std::string& id);

    bool contains(const std::string& id) const;
    size_t size() const;
    std::vector<std::string> ids() const;

    // Ids of sessions created before created_cutoff, or whose last activity
    // is before idle_cutoff
    std::vector<std::string> expired(std::chrono::steady_clock::time_point created_cutoff,
                                     std::optional<std::chrono::steady_clock::time_point> idle_cutoff);

    // Count of live sessions per status
    std::map<SessionStatus, size_t> count_by_status();

private:
    std::shared_ptr<Entry> find(const std::string& id) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> sessions_;
};

} // namespace scriptbox
