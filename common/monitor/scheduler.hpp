#pragma once

#include "discovery.hpp"
#include "interfaces.hpp"
#include "refresh.hpp"
#include <types/config.hpp>
#include <types/device.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace battwatch {

enum class RegisterResult {
    Added,
    AlreadyRegistered,
    UnknownDevice,  // Not in the last discovery result
};

const char* to_string(RegisterResult result);

// Owns the registry of monitored devices and drives refresh cycles.
//
// Every cycle refreshes all devices concurrently, one task per device. Each
// task writes only its own registry entry, so entries are committed one by
// one as their refresh finishes; no cycle ever replaces the whole registry.
class Scheduler {
public:
    // `store` may be null, in which case nothing is persisted.
    Scheduler(std::shared_ptr<Transport> transport,
              std::shared_ptr<Notifier> notifier,
              std::shared_ptr<RegistryStore> store,
              Config config = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Read stored devices. Saving stays disabled until this succeeds.
    bool load();
    bool is_loaded() const { return loaded_; }

    std::vector<RegisteredDevice> devices() const;

    // Discover devices, remember them for register_device() and return the
    // ones not registered yet.
    DiscoveryResult discover();

    RegisterResult register_device(const std::string& id);
    bool unregister_device(const std::string& id);

    // On-demand cycle, returns once every device has settled
    void reload();

    // One periodic cycle. Returns false without doing anything when another
    // cycle is still running.
    bool tick();

    // Periodic timer. stop() cancels a pending wait and joins.
    void start();
    void stop();
    bool is_running() const;

    Config config() const;
    void set_config(const Config& config);

    void set_retry_policy(RetryPolicy retry);
    void set_discovery_options(DiscoveryOptions options);

private:
    void refresh_all();
    bool is_current(const std::string& id, uint64_t generation) const;
    void commit(RegisteredDevice device, uint64_t generation);
    void persist();
    void timer_loop();

    std::shared_ptr<Transport> transport_;
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<RegistryStore> store_;

    mutable std::mutex registry_mtx_;
    std::vector<RegisteredDevice> registry_;
    std::vector<Device> discovered_;

    // Bumped on every registration so results of a removed entry never
    // land on a re-registered one with the same id
    std::map<std::string, uint64_t> generations_;
    uint64_t next_generation_ = 0;

    mutable std::mutex config_mtx_;
    Config config_;
    RetryPolicy retry_;
    DiscoveryOptions discovery_;

    std::atomic<bool> loaded_{false};
    std::mutex save_mtx_;
    std::mutex cycle_mtx_;  // Held for the duration of a refresh cycle

    mutable std::mutex timer_mtx_;
    std::condition_variable timer_cv_;
    bool timer_running_ = false;
    bool reschedule_ = false;  // Config changed, restart the wait
    std::thread timer_;
};

} // namespace battwatch
