#ifndef POLL_SCHEDULER_H
#define POLL_SCHEDULER_H

#include "connection_descriptor.hpp"
#include "register_map.hpp"
#include "snapshot_store.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

enum class SchedulerState { Idle, Polling, BackingOff, Stopped };

const char* toString(SchedulerState state);

/**
 * @struct CycleReport
 * @brief What a single poll cycle did.
 */
struct CycleReport {
    size_t groups_planned = 0;
    size_t groups_attempted = 0;
    size_t groups_failed = 0;
    size_t transport_failures = 0;
    bool aborted = false; ///< stop() arrived before every group was issued
    std::chrono::steady_clock::time_point started_at;
    std::chrono::steady_clock::time_point finished_at;

    /// True when groups were attempted and every one of them hit a link failure.
    bool allTransportFailed() const {
        return groups_attempted > 0 && transport_failures == groups_attempted;
    }
};

/**
 * @class PollScheduler
 * @brief Runs poll cycles against one device in a dedicated thread.
 *
 * Each cycle plans the request groups, reads them one after another, decodes
 * them and commits the collected results to the snapshot store in one step.
 * The next cycle starts one poll interval after the previous one ended, so
 * cycles never overlap. When every group of a cycle fails on the link, the
 * wait is stretched to the transport's reconnect backoff.
 */
class PollScheduler {
public:
    /**
     * @param register_map The validated register map.
     * @param transport The link to the device; owned by the scheduler.
     * @param store Where decoded snapshots are published.
     * @param options Request planning and pacing options.
     */
    PollScheduler(std::shared_ptr<const RegisterMap> register_map,
                  std::unique_ptr<Transport> transport,
                  std::shared_ptr<SnapshotStore> store,
                  PollingOptions options = PollingOptions());

    /**
     * @brief Destructor, ensures the poll thread is stopped.
     */
    ~PollScheduler();

    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    /**
     * @brief Starts polling @p descriptor in a new thread, stopping any previous run first.
     * @throw std::invalid_argument if the descriptor does not validate.
     */
    void start(const ConnectionDescriptor& descriptor);

    /**
     * @brief Stops polling and closes the transport.
     *
     * A request already on the wire is allowed to finish; no further request
     * is issued and no new cycle is scheduled. Must not be called from a
     * snapshot listener, which runs on the poll thread.
     */
    void stop();

    /**
     * @brief Applies new connection settings.
     *
     * A change of interval alone is picked up at the next cycle boundary.
     * A change of host, port or unit id restarts the session if polling.
     * @throw std::invalid_argument if the settings do not validate.
     */
    void configure(const std::string& host, int port, int unit_id, std::chrono::milliseconds interval);
    void configure(const ConnectionDescriptor& descriptor);

    /**
     * @brief Executes one poll cycle on the calling thread and commits its results.
     *
     * The poll thread calls this in its loop; it must not run concurrently
     * with a started scheduler.
     */
    CycleReport runCycle();

    SchedulerState state() const { return current_state.load(); }
    ConnectionDescriptor connection() const { return settings.get(); }
    uint64_t cycleCount() const { return cycles.load(); }

private:
    /**
     * @brief The main loop of the poll thread.
     */
    void run();

    void startLocked(const ConnectionDescriptor& descriptor);
    void stopLocked();

    /// @brief Sleeps until the next cycle is due. Returns false when stopped.
    bool waitForNextCycle(std::chrono::steady_clock::time_point cycle_end, std::chrono::milliseconds backoff);

    /// @brief Interruptible sleep. Returns false when stopped.
    bool pause(std::chrono::milliseconds duration);

    /// @brief Enabled registers minus read-once registers already read this session.
    std::vector<RegisterDescriptor> plannedRegisters() const;

    std::shared_ptr<const RegisterMap> register_map;
    std::unique_ptr<Transport> transport;
    std::shared_ptr<SnapshotStore> store;
    PollingOptions options;
    ConnectionSettings settings;

    std::thread poll_thread;
    std::atomic<bool> stop_requested;
    std::atomic<SchedulerState> current_state;
    std::atomic<uint64_t> cycles;
    std::mutex lifecycle_mutex;
    std::mutex wait_mutex;
    std::condition_variable wake;
    std::set<std::string> read_once_done;
};

#endif // POLL_SCHEDULER_H
