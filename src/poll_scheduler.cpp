#include "poll_scheduler.hpp"
#include "decoder.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

const char* toString(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle: return "Idle";
        case SchedulerState::Polling: return "Polling";
        case SchedulerState::BackingOff: return "BackingOff";
        case SchedulerState::Stopped: return "Stopped";
    }
    return "?";
}

PollScheduler::PollScheduler(std::shared_ptr<const RegisterMap> map,
                             std::unique_ptr<Transport> link,
                             std::shared_ptr<SnapshotStore> snapshot_store,
                             PollingOptions polling_options)
    : register_map(std::move(map)), transport(std::move(link)), store(std::move(snapshot_store)),
      options(polling_options), stop_requested(false), current_state(SchedulerState::Stopped), cycles(0) {}

PollScheduler::~PollScheduler() {
    stop();
}

void PollScheduler::start(const ConnectionDescriptor& descriptor) {
    descriptor.validate();
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
    startLocked(descriptor);
}

void PollScheduler::startLocked(const ConnectionDescriptor& descriptor) {
    if (poll_thread.joinable()) {
        stopLocked();
    }
    settings.replace(descriptor);
    read_once_done.clear();
    stop_requested = false;
    current_state = SchedulerState::Idle;
    poll_thread = std::thread(&PollScheduler::run, this);
}

void PollScheduler::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
    stopLocked();
}

void PollScheduler::stopLocked() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex);
        stop_requested = true;
    }
    wake.notify_all();
    if (poll_thread.joinable()) {
        poll_thread.join();
    }
    transport->close();
    current_state = SchedulerState::Stopped;
}

void PollScheduler::configure(const std::string& host, int port, int unit_id, std::chrono::milliseconds interval) {
    ConnectionDescriptor descriptor;
    descriptor.host = host;
    descriptor.port = port;
    descriptor.unit_id = unit_id;
    descriptor.poll_interval = interval;
    configure(descriptor);
}

void PollScheduler::configure(const ConnectionDescriptor& descriptor) {
    descriptor.validate();
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);

    if (settings.get().sameEndpoint(descriptor)) {
        settings.setPollInterval(descriptor.poll_interval);
        {
            std::lock_guard<std::mutex> lock(wait_mutex);
        }
        wake.notify_all();
        std::cout << "Poll interval set to " << descriptor.poll_interval.count() << " ms" << std::endl;
        return;
    }

    const bool was_running = poll_thread.joinable() && !stop_requested;
    std::cout << "Endpoint changed to " << descriptor.host << ":" << descriptor.port << " (unit "
              << descriptor.unit_id << ")" << std::endl;
    if (was_running) {
        startLocked(descriptor);
    } else {
        settings.replace(descriptor);
    }
}

void PollScheduler::run() {
    std::cout << "Poll thread started." << std::endl;
    if (!transport->connect(settings.get())) {
        std::cerr << "Initial connect failed, the first read will retry." << std::endl;
    }

    while (!stop_requested) {
        current_state = SchedulerState::Polling;
        CycleReport report = runCycle();
        if (stop_requested) {
            break;
        }

        std::chrono::milliseconds backoff(0);
        if (report.allTransportFailed()) {
            backoff = transport->retryDelay();
            current_state = SchedulerState::BackingOff;
            std::cerr << "All " << report.groups_attempted << " request(s) failed on the link, next attempt in "
                      << std::max(backoff, settings.pollInterval()).count() << " ms" << std::endl;
        } else {
            current_state = SchedulerState::Idle;
        }

        if (!waitForNextCycle(report.finished_at, backoff)) {
            break;
        }
    }
    std::cout << "Poll thread stopped." << std::endl;
}

CycleReport PollScheduler::runCycle() {
    CycleReport report;
    report.started_at = std::chrono::steady_clock::now();

    const std::vector<RequestGroup> groups =
        groupIntoRequests(plannedRegisters(), transport->maxRegistersPerRequest(), options.max_gap);
    report.groups_planned = groups.size();

    CycleResult results;
    for (size_t i = 0; i < groups.size(); ++i) {
        if (stop_requested || (i > 0 && !pause(options.request_pause))) {
            report.aborted = true;
            break;
        }

        const RequestGroup& group = groups[i];
        ++report.groups_attempted;
        ReadResult read = transport->readRegisters(group.start, group.count);
        const auto now = std::chrono::system_clock::now();

        if (const PollError* error = std::get_if<PollError>(&read)) {
            ++report.groups_failed;
            if (error->isTransport()) {
                ++report.transport_failures;
            }
            std::cerr << "Read of registers " << group.start << "-" << (group.start + group.count - 1)
                      << " failed: " << describe(*error) << std::endl;
            for (const auto& reg : group.registers) {
                results.failed[reg.key] = *error;
            }
            continue;
        }

        const auto& words = std::get<std::vector<uint16_t>>(read);
        for (const auto& reg : group.registers) {
            DecodeResult decoded = Decoder::decode(reg, Decoder::sliceWords(group, words, reg), now);
            if (const PollError* error = std::get_if<PollError>(&decoded)) {
                std::cerr << "Decode of " << reg.key << " failed: " << describe(*error) << std::endl;
                results.failed[reg.key] = *error;
                continue;
            }
            if (reg.once) {
                read_once_done.insert(reg.key);
            }
            results.decoded[reg.key] = std::move(std::get<DecodedValue>(decoded));
        }
    }

    results.groups_attempted = report.groups_attempted;
    results.groups_failed = report.groups_failed;
    results.completed_at = std::chrono::system_clock::now();

    if (report.groups_attempted > 0) {
        std::shared_ptr<const Snapshot> committed = store->update(results);
        std::cout << "Poll cycle " << committed->cycle << " finished: "
                  << (report.groups_attempted - report.groups_failed) << "/" << report.groups_planned
                  << " request(s) ok" << (report.aborted ? " (stopped)" : "") << std::endl;
    }
    if (options.disconnect_between_cycles) {
        transport->close();
    }

    ++cycles;
    report.finished_at = std::chrono::steady_clock::now();
    return report;
}

bool PollScheduler::waitForNextCycle(std::chrono::steady_clock::time_point cycle_end,
                                     std::chrono::milliseconds backoff) {
    std::unique_lock<std::mutex> lock(wait_mutex);
    while (!stop_requested) {
        // Re-read on every wake-up so an interval change shortens or extends the current wait.
        const auto deadline = cycle_end + std::max(settings.pollInterval(), backoff);
        if (std::chrono::steady_clock::now() >= deadline) {
            return true;
        }
        wake.wait_until(lock, deadline);
    }
    return false;
}

bool PollScheduler::pause(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return !stop_requested;
    }
    std::unique_lock<std::mutex> lock(wait_mutex);
    return !wake.wait_for(lock, duration, [this] { return stop_requested.load(); });
}

std::vector<RegisterDescriptor> PollScheduler::plannedRegisters() const {
    std::vector<RegisterDescriptor> planned = register_map->describeEnabled();
    planned.erase(std::remove_if(planned.begin(), planned.end(),
                                 [this](const RegisterDescriptor& reg) {
                                     return reg.once && read_once_done.count(reg.key) != 0;
                                 }),
                  planned.end());
    return planned;
}
