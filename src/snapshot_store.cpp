#include "snapshot_store.hpp"
#include <exception>
#include <iostream>

const DecodedValue* Snapshot::find(const std::string& key) const {
    auto it = values.find(key);
    if (it == values.end()) {
        return nullptr;
    }
    return &it->second;
}

SnapshotStore::SnapshotStore()
    : snapshot(std::make_shared<const Snapshot>()) {}

std::shared_ptr<const Snapshot> SnapshotStore::currentSnapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    return snapshot;
}

Snapshot SnapshotStore::merge(const Snapshot& previous, const CycleResult& results) {
    Snapshot merged;
    merged.values = previous.values;
    merged.cycle = previous.cycle + 1;
    merged.completed_at = results.completed_at;
    merged.groups_attempted = results.groups_attempted;
    merged.groups_failed = results.groups_failed;
    merged.errors = results.failed;

    for (const auto& [key, value] : results.decoded) {
        DecodedValue fresh = value;
        fresh.stale = false;
        merged.values[key] = std::move(fresh);
    }

    // Known values survive a failed read; they only lose their freshness.
    for (const auto& [key, error] : results.failed) {
        auto it = merged.values.find(key);
        if (it == merged.values.end()) {
            continue;
        }
        it->second.stale = true;
        it->second.last_error = error;
    }
    return merged;
}

std::shared_ptr<const Snapshot> SnapshotStore::update(const CycleResult& results) {
    auto next = std::make_shared<const Snapshot>(merge(*currentSnapshot(), results));
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex);
        snapshot = next;
    }

    std::vector<Listener> to_notify;
    {
        std::lock_guard<std::mutex> lock(listener_mutex);
        to_notify = listeners;
    }
    for (const auto& listener : to_notify) {
        try {
            listener(next);
        } catch (const std::exception& e) {
            std::cerr << "Snapshot listener failed: " << e.what() << std::endl;
        }
    }
    return next;
}

void SnapshotStore::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex);
    listeners.push_back(std::move(listener));
}
