#include "scheduler.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <future>
#include <iostream>
#include <utility>

namespace battwatch {

namespace {

std::vector<RegisteredDevice>::iterator find_by_id(std::vector<RegisteredDevice>& devices,
                                                  const std::string& id) {
    return std::find_if(devices.begin(), devices.end(),
                        [&id](const RegisteredDevice& d) { return d.id() == id; });
}

std::vector<Device>::iterator find_by_id(std::vector<Device>& devices, const std::string& id) {
    return std::find_if(devices.begin(), devices.end(),
                        [&id](const Device& d) { return d.id == id; });
}

// Forwards a task's notifications only while the entry it refreshes is
// still the one that was registered when the cycle started
class CycleNotifier : public Notifier {
public:
    CycleNotifier(Notifier& target, std::function<bool()> current)
        : target_(target), current_(std::move(current)) {}

    void notify(const std::string& message) override {
        if (!current_()) {
            std::cout << "scheduler: dropping stale notification \"" << message << "\"" << std::endl;
            return;
        }
        target_.notify(message);
    }

private:
    Notifier& target_;
    std::function<bool()> current_;
};

} // namespace

const char* to_string(RegisterResult result) {
    switch (result) {
        case RegisterResult::Added: return "added";
        case RegisterResult::AlreadyRegistered: return "already-registered";
        case RegisterResult::UnknownDevice: return "unknown-device";
    }
    return "unknown";
}

Scheduler::Scheduler(std::shared_ptr<Transport> transport,
                     std::shared_ptr<Notifier> notifier,
                     std::shared_ptr<RegistryStore> store,
                     Config config)
    : transport_(std::move(transport)),
      notifier_(std::move(notifier)),
      store_(std::move(store)),
      config_(config) {}

Scheduler::~Scheduler() {
    stop();
}

bool Scheduler::load() {
    if (!store_) {
        loaded_ = true;
        return true;
    }

    auto stored = store_->load();
    if (!stored) {
        std::cerr << "scheduler: failed to load registry, saving disabled" << std::endl;
        return false;
    }

    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(registry_mtx_);
        std::vector<RegisteredDevice> merged;
        merged.reserve(stored->size() + registry_.size());

        for (auto& device : *stored) {
            if (find_by_id(merged, device.id()) == merged.end()) {
                merged.push_back(std::move(device));
            }
        }
        // Registered while the load was in flight
        for (auto& device : registry_) {
            if (find_by_id(merged, device.id()) == merged.end()) {
                merged.push_back(std::move(device));
            }
        }
        registry_ = std::move(merged);
        for (const auto& device : registry_) {
            if (generations_.find(device.id()) == generations_.end()) {
                generations_[device.id()] = ++next_generation_;
            }
        }
        count = registry_.size();
    }

    loaded_ = true;
    std::cout << "scheduler: loaded " << count << " registered device(s)" << std::endl;
    persist();
    return true;
}

std::vector<RegisteredDevice> Scheduler::devices() const {
    std::lock_guard<std::mutex> lock(registry_mtx_);
    return registry_;
}

DiscoveryResult Scheduler::discover() {
    DiscoveryOptions options;
    {
        std::lock_guard<std::mutex> lock(config_mtx_);
        options = discovery_;
    }

    DiscoveryResult result = battwatch::discover(transport_, options);
    if (!result.ok()) {
        return result;
    }

    std::lock_guard<std::mutex> lock(registry_mtx_);
    discovered_ = result.devices;
    result.devices.erase(
        std::remove_if(result.devices.begin(), result.devices.end(), [this](const Device& d) {
            return find_by_id(registry_, d.id) != registry_.end();
        }),
        result.devices.end());
    return result;
}

RegisterResult Scheduler::register_device(const std::string& id) {
    Device device;
    {
        std::lock_guard<std::mutex> lock(registry_mtx_);
        if (find_by_id(registry_, id) != registry_.end()) {
            return RegisterResult::AlreadyRegistered;
        }
        auto it = find_by_id(discovered_, id);
        if (it == discovered_.end()) {
            std::cerr << "scheduler: " << id << " was not discovered" << std::endl;
            return RegisterResult::UnknownDevice;
        }
        device = *it;
    }

    RegisteredDevice registered = initial_fetch(device, *transport_);

    {
        std::lock_guard<std::mutex> lock(registry_mtx_);
        if (find_by_id(registry_, id) != registry_.end()) {
            return RegisterResult::AlreadyRegistered;
        }
        generations_[id] = ++next_generation_;
        registry_.push_back(std::move(registered));
    }

    std::cout << "scheduler: registered " << device.name << " (" << id << ")" << std::endl;
    persist();
    return RegisterResult::Added;
}

bool Scheduler::unregister_device(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(registry_mtx_);
        auto it = find_by_id(registry_, id);
        if (it == registry_.end()) {
            return false;
        }
        registry_.erase(it);
        generations_.erase(id);
    }

    std::cout << "scheduler: unregistered " << id << std::endl;
    persist();
    return true;
}

void Scheduler::reload() {
    std::lock_guard<std::mutex> cycle(cycle_mtx_);
    std::cout << "scheduler: reload requested" << std::endl;
    refresh_all();
}

bool Scheduler::tick() {
    std::unique_lock<std::mutex> cycle(cycle_mtx_, std::try_to_lock);
    if (!cycle.owns_lock()) {
        std::cout << "scheduler: previous cycle still running, skipping tick" << std::endl;
        return false;
    }
    refresh_all();
    return true;
}

void Scheduler::refresh_all() {
    std::vector<std::pair<RegisteredDevice, uint64_t>> cycle;
    {
        std::lock_guard<std::mutex> lock(registry_mtx_);
        cycle.reserve(registry_.size());
        for (const auto& device : registry_) {
            cycle.emplace_back(device, generations_.at(device.id()));
        }
    }

    RefreshOptions options;
    {
        std::lock_guard<std::mutex> lock(config_mtx_);
        options.notifications = config_.notifications;
        options.retry = retry_;
    }

    std::vector<std::future<void>> pending;
    pending.reserve(cycle.size());

    for (const auto& entry : cycle) {
        const RegisteredDevice& device = entry.first;
        const uint64_t generation = entry.second;
        pending.push_back(std::async(std::launch::async, [this, device, generation, options] {
            CycleNotifier notifier(*notifier_, [this, &device, generation] {
                return is_current(device.id(), generation);
            });
            commit(refresh_device(device, *transport_, notifier, options), generation);
        }));
    }

    for (auto& task : pending) {
        try {
            task.get();
        } catch (const std::exception& e) {
            std::cerr << "scheduler: refresh task failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "scheduler: refresh task failed: unknown exception" << std::endl;
        }
    }

    persist();
}

bool Scheduler::is_current(const std::string& id, uint64_t generation) const {
    std::lock_guard<std::mutex> lock(registry_mtx_);
    auto it = generations_.find(id);
    return it != generations_.end() && it->second == generation;
}

void Scheduler::commit(RegisteredDevice device, uint64_t generation) {
    std::lock_guard<std::mutex> lock(registry_mtx_);
    auto it = find_by_id(registry_, device.id());
    auto current = generations_.find(device.id());

    // Unregistered (and possibly registered again) while in flight
    if (it == registry_.end() || current == generations_.end() || current->second != generation) {
        std::cout << "scheduler: dropping stale result for " << device.id() << std::endl;
        return;
    }
    *it = std::move(device);
}

void Scheduler::persist() {
    if (!store_ || !loaded_) {
        return;
    }

    // Snapshot under the save lock so the newest state is always saved last
    std::lock_guard<std::mutex> lock(save_mtx_);
    try {
        if (!store_->save(devices())) {
            std::cerr << "scheduler: failed to save registry" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "scheduler: failed to save registry: " << e.what() << std::endl;
    }
}

void Scheduler::start() {
    std::lock_guard<std::mutex> lock(timer_mtx_);
    if (timer_running_) {
        return;
    }
    timer_running_ = true;
    timer_ = std::thread(&Scheduler::timer_loop, this);
    std::cout << "scheduler: polling every " << config().poll_interval.count() << "ms" << std::endl;
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(timer_mtx_);
        timer_running_ = false;
    }
    timer_cv_.notify_all();
    if (timer_.joinable()) {
        timer_.join();
    }
}

bool Scheduler::is_running() const {
    std::lock_guard<std::mutex> lock(timer_mtx_);
    return timer_running_;
}

void Scheduler::timer_loop() {
    std::unique_lock<std::mutex> lock(timer_mtx_);
    while (timer_running_) {
        auto interval = config().poll_interval;
        reschedule_ = false;

        timer_cv_.wait_for(lock, interval, [this] { return !timer_running_ || reschedule_; });
        if (!timer_running_) {
            break;
        }
        if (reschedule_) {
            continue;
        }

        lock.unlock();
        try {
            tick();
        } catch (const std::exception& e) {
            std::cerr << "scheduler: periodic cycle failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "scheduler: periodic cycle failed: unknown exception" << std::endl;
        }
        lock.lock();
    }
}

Config Scheduler::config() const {
    std::lock_guard<std::mutex> lock(config_mtx_);
    return config_;
}

void Scheduler::set_config(const Config& config) {
    {
        std::lock_guard<std::mutex> lock(config_mtx_);
        config_ = config;
    }
    // Restart the pending wait with the new interval
    {
        std::lock_guard<std::mutex> lock(timer_mtx_);
        reschedule_ = true;
    }
    timer_cv_.notify_all();
}

void Scheduler::set_retry_policy(RetryPolicy retry) {
    std::lock_guard<std::mutex> lock(config_mtx_);
    retry_ = std::move(retry);
}

void Scheduler::set_discovery_options(DiscoveryOptions options) {
    std::lock_guard<std::mutex> lock(config_mtx_);
    discovery_ = options;
}

} // namespace battwatch
