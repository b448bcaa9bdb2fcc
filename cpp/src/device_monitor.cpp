/**
 * @file device_monitor.cpp
 * @brief Implementation of the device monitor
 * @author RegBridge Team
 * @date 2025-09-04
 */

#include "device_monitor.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <set>

namespace regBridge {

namespace {

constexpr double DEFAULT_CHANGE_EPSILON = 0.01;

// Clears the in-flight flag on every exit path of a poll
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_.store(false); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

std::optional<double> numeric(const ParameterValue& value) {
    if (std::holds_alternative<int64_t>(value)) {
        return static_cast<double>(std::get<int64_t>(value));
    }
    if (std::holds_alternative<double>(value)) {
        return std::get<double>(value);
    }
    return std::nullopt;
}

bool valuesDiffer(const ParameterReading& before, const ParameterReading& after) {
    if (before.error.has_value() != after.error.has_value()) {
        return true;
    }
    if (after.error) {
        return false;
    }

    auto a = numeric(before.value);
    auto b = numeric(after.value);
    if (a && b) {
        double epsilon = after.decimals
            ? 0.5 * std::pow(10.0, -*after.decimals)
            : DEFAULT_CHANGE_EPSILON;
        return std::fabs(*a - *b) > epsilon;
    }
    return before.value != after.value;
}

PollResult notFound(const DeviceId& device_id) {
    PollResult result;
    result.status = PollStatus::FAILED;
    result.error = "Device '" + device_id + "' not found";
    result.error_kind = ErrorKind::NOT_FOUND;
    return result;
}

} // namespace

std::string to_string(PollStatus status) {
    switch (status) {
        case PollStatus::COMPLETED: return "completed";
        case PollStatus::SKIPPED: return "skipped";
        case PollStatus::FAILED: return "failed";
        case PollStatus::DISCARDED: return "discarded";
        default: return "unknown";
    }
}

DeviceMonitor::DeviceMonitor(SharedPtr<DeviceConfigSource> source,
                             const MonitorConfig& config,
                             TransportFactory factory)
    : source_(std::move(source)),
      config_(config),
      factory_(std::move(factory)) {
    if (!source_) {
        throw ConfigException("Device monitor requires a device configuration source");
    }
    LOG_INFO("Device monitor initialized (cache max age {}ms, offline after {} failures)",
             config_.cache_max_age.count(), config_.offline_after_failures);
}

DeviceMonitor::~DeviceMonitor() {
    unscheduleAll();

    std::vector<RetiredTimer> timers;
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        timers.swap(retired_timers_);
    }
    for (auto& timer : timers) {
        if (timer.thread.joinable()) {
            timer.thread.join();
        }
    }
    LOG_DEBUG("Device monitor stopped");
}

// ============================================================================
// Polling
// ============================================================================

PollResult DeviceMonitor::poll(const DeviceId& device_id) {
    DeviceState* state = knownState(device_id);
    if (!state) {
        LOG_WARN("Poll of unknown device '{}' rejected", device_id);
        return notFound(device_id);
    }
    return pollDevice(*state, std::nullopt);
}

PollResult DeviceMonitor::pollDevice(DeviceState& state, std::optional<uint64_t> generation) {
    PollResult result;

    bool expected = false;
    if (!state.in_flight.compare_exchange_strong(expected, true)) {
        {
            std::lock_guard<std::mutex> lock(state.data_mutex);
            state.stats.skipped_polls++;
        }
        LOG_DEBUG("Poll of '{}' skipped: previous poll still in flight", state.id);
        result.status = PollStatus::SKIPPED;
        result.error = "Device '" + state.id + "' is busy";
        result.error_kind = ErrorKind::BUSY;
        return result;
    }
    InFlightGuard guard(state.in_flight);

    std::optional<DeviceRecord> record = source_->fetchDevice(state.id);
    if (!record) {
        LOG_WARN("Device '{}' no longer configured", state.id);
        return notFound(state.id);
    }
    if (!record->enabled) {
        result.error = "Device '" + state.id + "' is disabled";
        result.error_kind = ErrorKind::VALIDATION;
        return result;
    }

    SnapshotPtr snapshot;
    {
        std::lock_guard<std::mutex> io_lock(state.io_mutex);
        {
            std::lock_guard<std::mutex> lock(state.data_mutex);
            state.health.last_attempt = std::chrono::system_clock::now();
        }

        try {
            snapshot = readDevice(*record);
        } catch (const RegBridgeException& e) {
            result.error = e.what();
            result.error_kind = e.kind();
        } catch (const std::exception& e) {
            result.error = e.what();
            result.error_kind = ErrorKind::INTERNAL;
        }
    }

    if (generation) {
        std::lock_guard<std::mutex> lock(state.data_mutex);
        if (state.generation != *generation) {
            LOG_DEBUG("Discarding poll result of unscheduled device '{}'", state.id);
            result.status = PollStatus::DISCARDED;
            result.snapshot = snapshot;
            return result;
        }
    }

    if (!snapshot) {
        LOG_WARN("Poll of '{}' failed ({}): {}", state.id, to_string(result.error_kind), result.error);
        recordFailure(state, result.error, result.error_kind);
        result.status = PollStatus::FAILED;
        return result;
    }

    recordSuccess(state, snapshot);
    result.status = PollStatus::COMPLETED;
    result.snapshot = snapshot;
    result.error_kind = ErrorKind::NONE;
    return result;
}

SnapshotPtr DeviceMonitor::readDevice(const DeviceRecord& record) {
    ConnectionManager manager(record.connection, factory_);
    ConnectionHandle handle = manager.connectWithRetries();

    auto snapshot = std::make_shared<ReadingSnapshot>();
    snapshot->device_id = record.id;

    size_t failed_ranges = 0;
    std::exception_ptr last_range_error;

    for (const auto& range : record.ranges) {
        RangeWords raw;
        raw.start_address = range.start_address;
        raw.function = range.function;

        try {
            auto readings = operations_.readParameters(handle, range, range.parameters, &raw.words);
            snapshot->readings.insert(snapshot->readings.end(),
                                      std::make_move_iterator(readings.begin()),
                                      std::make_move_iterator(readings.end()));
        } catch (const RegBridgeException& e) {
            // Mark the range's parameters and carry on with the next range
            LOG_WARN("Range {}+{} of '{}' failed: {}", range.start_address, range.count,
                     record.id, e.what());
            ++failed_ranges;
            last_range_error = std::current_exception();
            raw.error = e.what();

            for (const auto& parameter : range.parameters) {
                ParameterReading reading;
                reading.name = parameter.name;
                reading.unit = parameter.unit;
                reading.data_type = parameter.data_type;
                reading.decimals = parameter.decimals;
                reading.error = e.what();
                reading.error_kind = e.kind();
                snapshot->readings.push_back(std::move(reading));
            }
        }

        snapshot->raw.push_back(std::move(raw));
    }

    handle.release();

    if (!record.ranges.empty() && failed_ranges == record.ranges.size()) {
        std::rethrow_exception(last_range_error);
    }

    snapshot->timestamp = std::chrono::system_clock::now();
    return snapshot;
}

void DeviceMonitor::recordSuccess(DeviceState& state, const SnapshotPtr& snapshot) {
    SnapshotPtr previous;
    DeviceHealth health;
    bool health_changed = false;
    {
        std::lock_guard<std::mutex> lock(state.data_mutex);
        previous = state.last_snapshot;
        state.last_snapshot = snapshot;
        state.last_poll_time = std::chrono::steady_clock::now();
        state.expired = false;

        HealthStatus status = snapshot->errorCount() > 0 ? HealthStatus::DEGRADED : HealthStatus::ONLINE;
        health_changed = !state.health.healthy || state.health.status != status;

        state.health.healthy = true;
        state.health.stale = false;
        state.health.status = status;
        state.health.consecutive_failures = 0;
        state.health.last_success = snapshot->timestamp;
        if (status == HealthStatus::ONLINE) {
            state.health.last_error.clear();
            state.health.last_error_kind = ErrorKind::NONE;
        } else {
            state.health.last_error = std::to_string(snapshot->errorCount()) + " parameter(s) failed";
            state.health.last_error_kind = ErrorKind::PARTIAL_DECODE;
        }
        health = state.health;

        state.stats.total_polls++;
        state.stats.successful_polls++;
        state.stats.last_poll_time = snapshot->timestamp;
    }

    LOG_DEBUG("Poll of '{}' completed: {} readings, {} errors",
              state.id, snapshot->readings.size(), snapshot->errorCount());

    notifySnapshot(snapshot);

    std::vector<std::string> changes = detectChanges(previous.get(), *snapshot);
    if (!changes.empty()) {
        notifyChange(state.id, changes, snapshot);
    }

    if (health_changed) {
        notifyHealth(state.id, health);
    }
}

void DeviceMonitor::recordFailure(DeviceState& state, const std::string& error, ErrorKind kind) {
    DeviceHealth health;
    {
        std::lock_guard<std::mutex> lock(state.data_mutex);
        state.health.healthy = false;
        state.health.consecutive_failures++;
        state.health.last_error = error;
        state.health.last_error_kind = kind;
        state.health.stale = state.last_snapshot != nullptr;
        state.health.status = state.health.consecutive_failures >= config_.offline_after_failures
            ? HealthStatus::OFFLINE
            : HealthStatus::DEGRADED;
        health = state.health;

        state.stats.total_polls++;
        state.stats.failed_polls++;
        state.stats.last_poll_time = std::chrono::system_clock::now();
        state.stats.last_error = error;
    }

    if (health.status == HealthStatus::OFFLINE &&
        health.consecutive_failures == config_.offline_after_failures) {
        LOG_ERROR("Device '{}' is offline after {} consecutive failures", state.id,
                  health.consecutive_failures);
    }

    notifyHealth(state.id, health);
}

// ============================================================================
// Cache
// ============================================================================

PollResult DeviceMonitor::getCached(const DeviceId& device_id, Duration max_age) {
    DeviceState* known = knownState(device_id);
    if (!known) {
        return notFound(device_id);
    }
    DeviceState& state = *known;
    {
        std::lock_guard<std::mutex> lock(state.data_mutex);
        if (state.last_snapshot && !state.expired && state.last_poll_time &&
            std::chrono::steady_clock::now() - *state.last_poll_time <= max_age) {
            PollResult cached;
            cached.status = PollStatus::COMPLETED;
            cached.snapshot = state.last_snapshot;
            return cached;
        }
    }

    PollResult result = pollDevice(state, std::nullopt);
    if (result.ok()) {
        return result;
    }

    SnapshotPtr stale = lastSnapshot(device_id);
    if (stale) {
        LOG_DEBUG("Serving stale snapshot of '{}': {}", device_id, result.error);
        result.snapshot = stale;
        result.stale = true;
    }
    return result;
}

PollResult DeviceMonitor::getCached(const DeviceId& device_id) {
    return getCached(device_id, config_.cache_max_age);
}

SnapshotPtr DeviceMonitor::lastSnapshot(const DeviceId& device_id) const {
    const DeviceState* state = findState(device_id);
    if (!state) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(state->data_mutex);
    return state->last_snapshot;
}

void DeviceMonitor::invalidate(const DeviceId& device_id) {
    DeviceState* state = nullptr;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = devices_.find(device_id);
        if (it == devices_.end()) {
            return;
        }
        state = it->second.get();
    }
    std::lock_guard<std::mutex> lock(state->data_mutex);
    state->expired = true;
}

// ============================================================================
// Change detection
// ============================================================================

std::vector<std::string> DeviceMonitor::detectChanges(const ReadingSnapshot* previous,
                                                      const ReadingSnapshot& current) {
    std::vector<std::string> changes;

    if (!previous) {
        for (const auto& reading : current.readings) {
            changes.push_back(reading.name);
        }
        return changes;
    }

    std::set<std::string> current_names;
    for (const auto& reading : current.readings) {
        current_names.insert(reading.name);
        const ParameterReading* before = previous->find(reading.name);
        if (!before || valuesDiffer(*before, reading)) {
            changes.push_back(reading.name);
        }
    }

    for (const auto& reading : previous->readings) {
        if (current_names.count(reading.name) == 0) {
            changes.push_back(reading.name);
        }
    }

    return changes;
}

// ============================================================================
// Scheduling
// ============================================================================

void DeviceMonitor::schedule(const DeviceId& device_id, Duration interval) {
    if (interval.count() <= 0) {
        throw ValidationException("Poll interval must be positive");
    }

    DeviceState* known = knownState(device_id);
    if (!known) {
        throw RegBridgeException(ErrorKind::NOT_FOUND, "Device '" + device_id + "' not found");
    }

    reapRetiredTimers();

    DeviceState& state = *known;
    std::lock_guard<std::mutex> lock(state.data_mutex);

    if (state.scheduled) {
        state.generation++;
        state.wakeup.notify_all();
        retireTimer(state);
    }

    state.generation++;
    state.scheduled = true;
    state.base_interval = interval;
    state.current_interval = interval;
    state.timer_done = std::make_shared<std::atomic<bool>>(false);
    state.timer = std::thread(&DeviceMonitor::scheduleLoop, this, &state, state.generation,
                              state.timer_done);

    LOG_INFO("Scheduled device '{}' every {}ms", device_id, interval.count());
}

void DeviceMonitor::unschedule(const DeviceId& device_id) {
    reapRetiredTimers();

    DeviceState* state = nullptr;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = devices_.find(device_id);
        if (it == devices_.end()) {
            return;
        }
        state = it->second.get();
    }

    std::lock_guard<std::mutex> lock(state->data_mutex);
    if (!state->scheduled) {
        return;
    }
    state->generation++;
    state->scheduled = false;
    state->wakeup.notify_all();
    retireTimer(*state);

    LOG_INFO("Unscheduled device '{}'", device_id);
}

void DeviceMonitor::unscheduleAll() {
    std::vector<DeviceId> ids;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& [id, state] : devices_) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        unschedule(id);
    }
}

bool DeviceMonitor::isScheduled(const DeviceId& device_id) const {
    const DeviceState* state = findState(device_id);
    if (!state) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state->data_mutex);
    return state->scheduled;
}

Duration DeviceMonitor::currentInterval(const DeviceId& device_id) const {
    const DeviceState* state = findState(device_id);
    if (!state) {
        return Duration(0);
    }
    std::lock_guard<std::mutex> lock(state->data_mutex);
    return state->current_interval;
}

size_t DeviceMonitor::trackedDevices() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return devices_.size();
}

size_t DeviceMonitor::retiredTimerCount() const {
    std::lock_guard<std::mutex> lock(retired_mutex_);
    return retired_timers_.size();
}

void DeviceMonitor::scheduleLoop(DeviceState* state, uint64_t generation,
                                 std::shared_ptr<std::atomic<bool>> done) {
    LOG_DEBUG("Timer for '{}' started", state->id);

    std::unique_lock<std::mutex> lock(state->data_mutex);
    while (state->generation == generation) {
        lock.unlock();
        PollResult result = pollDevice(*state, generation);
        lock.lock();

        if (state->generation != generation) {
            break;
        }

        adjustInterval(*state, result.status);
        state->wakeup.wait_for(lock, state->current_interval,
                               [&] { return state->generation != generation; });
    }

    LOG_DEBUG("Timer for '{}' stopped", state->id);
    done->store(true);
}

void DeviceMonitor::adjustInterval(DeviceState& state, PollStatus status) {
    // Caller holds data_mutex
    if (status == PollStatus::COMPLETED) {
        state.current_interval = state.base_interval;
    } else if (status == PollStatus::FAILED) {
        Duration backoff = state.current_interval * 2;
        Duration ceiling = std::max(config_.max_backoff, state.base_interval);
        state.current_interval = std::min(backoff, ceiling);
        LOG_DEBUG("Backing off '{}' to {}ms", state.id, state.current_interval.count());
    }
}

void DeviceMonitor::retireTimer(DeviceState& state) {
    // Caller holds data_mutex; the thread exits once it sees the new generation
    if (state.timer.joinable()) {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        retired_timers_.push_back(RetiredTimer{std::move(state.timer), std::move(state.timer_done)});
    }
}

void DeviceMonitor::reapRetiredTimers() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        const auto self = std::this_thread::get_id();
        auto first_finished = std::partition(retired_timers_.begin(), retired_timers_.end(),
                                             [&](const RetiredTimer& timer) {
                                                 return !timer.done->load() || timer.thread.get_id() == self;
                                             });
        for (auto it = first_finished; it != retired_timers_.end(); ++it) {
            finished.push_back(std::move(it->thread));
        }
        retired_timers_.erase(first_finished, retired_timers_.end());
    }

    for (auto& thread : finished) {
        thread.join();
    }
    if (!finished.empty()) {
        LOG_TRACE("Joined {} stopped timer(s)", finished.size());
    }
}

// ============================================================================
// Exclusive operations
// ============================================================================

void DeviceMonitor::runExclusive(const DeviceId& device_id, const ExclusiveOperation& operation) {
    std::optional<DeviceRecord> record = source_->fetchDevice(device_id);
    if (!record) {
        throw RegBridgeException(ErrorKind::NOT_FOUND, "Device '" + device_id + "' not found");
    }
    if (!record->enabled) {
        throw ValidationException("Device '" + device_id + "' is disabled");
    }

    DeviceState& state = stateFor(device_id);
    std::lock_guard<std::mutex> io_lock(state.io_mutex);

    ConnectionManager manager(record->connection, factory_);
    ConnectionHandle handle = manager.connectWithRetries();
    operation(handle, *record);
}

// ============================================================================
// Health, statistics, callbacks
// ============================================================================

DeviceHealth DeviceMonitor::getHealth(const DeviceId& device_id) const {
    const DeviceState* state = findState(device_id);
    if (!state) {
        return DeviceHealth{};
    }
    std::lock_guard<std::mutex> lock(state->data_mutex);
    return state->health;
}

PollStatistics DeviceMonitor::getStatistics(const DeviceId& device_id) const {
    const DeviceState* state = findState(device_id);
    if (!state) {
        return PollStatistics{};
    }
    std::lock_guard<std::mutex> lock(state->data_mutex);
    return state->stats;
}

void DeviceMonitor::addSnapshotCallback(SnapshotCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    snapshot_callbacks_.push_back(std::move(callback));
}

void DeviceMonitor::addChangeCallback(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    change_callbacks_.push_back(std::move(callback));
}

void DeviceMonitor::addHealthCallback(HealthCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    health_callbacks_.push_back(std::move(callback));
}

void DeviceMonitor::notifySnapshot(const SnapshotPtr& snapshot) {
    std::vector<SnapshotCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = snapshot_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(snapshot);
        } catch (const std::exception& e) {
            LOG_ERROR("Snapshot callback failed: {}", e.what());
        }
    }
}

void DeviceMonitor::notifyChange(const DeviceId& device_id, const std::vector<std::string>& changes,
                                 const SnapshotPtr& snapshot) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = change_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(device_id, changes, snapshot);
        } catch (const std::exception& e) {
            LOG_ERROR("Change callback failed: {}", e.what());
        }
    }
}

void DeviceMonitor::notifyHealth(const DeviceId& device_id, const DeviceHealth& health) {
    std::vector<HealthCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = health_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(device_id, health);
        } catch (const std::exception& e) {
            LOG_ERROR("Health callback failed: {}", e.what());
        }
    }
}

DeviceMonitor::DeviceState& DeviceMonitor::stateFor(const DeviceId& device_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& state = devices_[device_id];
    if (!state) {
        state = std::make_unique<DeviceState>(device_id);
    }
    return *state;
}

DeviceMonitor::DeviceState* DeviceMonitor::knownState(const DeviceId& device_id) {
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = devices_.find(device_id);
        if (it != devices_.end()) {
            return it->second.get();
        }
    }
    if (!source_->fetchDevice(device_id)) {
        return nullptr;
    }
    return &stateFor(device_id);
}

const DeviceMonitor::DeviceState* DeviceMonitor::findState(const DeviceId& device_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = devices_.find(device_id);
    return it == devices_.end() ? nullptr : it->second.get();
}

} // namespace regBridge
