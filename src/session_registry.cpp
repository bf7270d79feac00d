#include "session_registry.h"

namespace scriptbox {

std::shared_ptr<SessionRegistry::Entry> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionRegistry::insert(Session session) {
    auto entry = std::make_shared<Entry>();
    std::string id = session.id;
    entry->session = std::move(session);

    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.emplace(id, std::move(entry)).second;
}

SessionRegistry::Lease SessionRegistry::acquire(const std::string& id) {
    std::shared_ptr<Entry> entry = find(id);
    if (!entry) {
        return Lease();
    }

    std::unique_lock<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        // Lost the race with remove()
        return Lease();
    }
    return Lease(std::move(entry), std::move(lock));
}

std::optional<Session> SessionRegistry::get(const std::string& id) {
    Lease lease = acquire(id);
    if (!lease) {
        return std::nullopt;
    }
    return *lease;
}

bool SessionRegistry::update(const std::string& id, const std::function<void(Session&)>& mutate) {
    Lease lease = acquire(id);
    if (!lease) {
        return false;
    }
    mutate(*lease);
    return true;
}

std::optional<Session> SessionRegistry::remove(const std::string& id) {
    std::shared_ptr<Entry> entry = find(id);
    if (!entry) {
        return std::nullopt;
    }

    Session detached;
    {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        if (entry->removed) {
            return std::nullopt;
        }
        entry->removed = true;
        detached = entry->session;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end() && it->second == entry) {
        sessions_.erase(it);
    }
    return detached;
}

bool SessionRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(id) > 0;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(sessions_.size());
    for (const auto& [id, entry] : sessions_) {
        result.push_back(id);
    }
    return result;
}

std::vector<std::string> SessionRegistry::expired(
    std::chrono::steady_clock::time_point created_cutoff,
    std::optional<std::chrono::steady_clock::time_point> idle_cutoff) {

    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : sessions_) {
            entries.push_back(entry);
        }
    }

    std::vector<std::string> result;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        if (entry->removed) continue;

        const Session& session = entry->session;
        bool too_old = session.created_at < created_cutoff;
        bool idle = idle_cutoff && session.last_activity() < *idle_cutoff;
        if (too_old || idle) {
            result.push_back(session.id);
        }
    }
    return result;
}

std::map<SessionStatus, size_t> SessionRegistry::count_by_status() {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : sessions_) {
            entries.push_back(entry);
        }
    }

    std::map<SessionStatus, size_t> counts;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        if (!entry->removed) {
            counts[entry->session.status]++;
        }
    }
    return counts;
}

} // namespace scriptbox
