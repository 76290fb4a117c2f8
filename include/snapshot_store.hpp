#ifndef SNAPSHOT_STORE_H
#define SNAPSHOT_STORE_H

#include "decoded_value.hpp"
#include "poll_error.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @struct Snapshot
 * @brief Latest known value of every register that has ever been decoded.
 */
struct Snapshot {
    std::map<std::string, DecodedValue> values;
    std::map<std::string, PollError> errors; ///< Keys that failed in the latest cycle
    uint64_t cycle = 0;
    std::chrono::system_clock::time_point completed_at;
    size_t groups_attempted = 0;
    size_t groups_failed = 0;

    /// @brief The value for @p key, or nullptr if it was never decoded.
    const DecodedValue* find(const std::string& key) const;
};

/**
 * @struct CycleResult
 * @brief Everything one poll cycle learned, collected before it is committed.
 */
struct CycleResult {
    std::map<std::string, DecodedValue> decoded;
    std::map<std::string, PollError> failed;
    size_t groups_attempted = 0;
    size_t groups_failed = 0;
    std::chrono::system_clock::time_point completed_at;
};

/**
 * @class SnapshotStore
 * @brief Owns the latest snapshot and hands out immutable views of it.
 *
 * update() builds the merged snapshot off to the side and publishes it with a
 * pointer swap, so a reader either sees the previous snapshot or the new one.
 * The mutex is held only for the swap. There is a single writer, the poll loop.
 */
class SnapshotStore {
public:
    using Listener = std::function<void(const std::shared_ptr<const Snapshot>&)>;

    SnapshotStore();

    /// @brief The latest snapshot. The view never changes after it is returned.
    std::shared_ptr<const Snapshot> currentSnapshot() const;

    /**
     * @brief Merges a cycle's results into the latest snapshot and publishes it.
     *
     * Registers that failed keep their previous value marked stale; registers
     * never decoded stay absent. Listeners are called after the swap.
     * @return The snapshot just published.
     */
    std::shared_ptr<const Snapshot> update(const CycleResult& results);

    /**
     * @brief Registers a callback run after every update, on the poll thread.
     *
     * Listeners should return quickly; they delay the next request while they run.
     */
    void subscribe(Listener listener);

    /// @brief The merge rule on its own, without publishing.
    static Snapshot merge(const Snapshot& previous, const CycleResult& results);

private:
    mutable std::mutex snapshot_mutex;
    std::shared_ptr<const Snapshot> snapshot;
    std::mutex listener_mutex;
    std::vector<Listener> listeners;
};

#endif // SNAPSHOT_STORE_H
