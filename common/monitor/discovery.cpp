#include "discovery.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

namespace battwatch {

namespace {

// State shared between the waiting caller and the enumeration thread.
// Outlives the caller when the timer wins.
struct Race {
    std::mutex mtx;
    std::condition_variable cv;
    bool finished = false;
    std::optional<std::vector<Device>> devices;
    std::string error;
};

bool mentions_permission(const std::string& message) {
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("permission") != std::string::npos;
}

} // namespace

std::string with_permission_hint(std::string message, bool permission_gated) {
    if (permission_gated && !mentions_permission(message)) {
        message += PERMISSION_HINT;
    }
    return message;
}

DiscoveryResult discover(std::shared_ptr<Transport> transport, const DiscoveryOptions& options) {
    auto race = std::make_shared<Race>();

    std::thread([transport, race] {
        std::optional<std::vector<Device>> devices;
        std::string error;
        try {
            devices = transport->enumerate(error);
        } catch (const std::exception& e) {
            error = e.what();
        } catch (...) {
            error = DISCOVERY_FAILED_MESSAGE;
        }

        std::lock_guard<std::mutex> lock(race->mtx);
        race->devices = std::move(devices);
        race->error = std::move(error);
        race->finished = true;
        race->cv.notify_all();
    }).detach();

    DiscoveryResult result;
    std::unique_lock<std::mutex> lock(race->mtx);

    if (!race->cv.wait_for(lock, options.timeout, [&race] { return race->finished; })) {
        std::cerr << "discovery: timed out after " << options.timeout.count() << "ms" << std::endl;
        result.error = DiscoveryError::Timeout;
        result.message = with_permission_hint(DISCOVERY_FAILED_MESSAGE, options.permission_gated);
        return result;
    }

    if (!race->devices) {
        std::cerr << "discovery: enumeration failed: " << race->error << std::endl;
        result.error = DiscoveryError::Transport;
        result.message = with_permission_hint(
            race->error.empty() ? std::string(DISCOVERY_FAILED_MESSAGE) : race->error,
            options.permission_gated);
        return result;
    }

    result.devices = std::move(*race->devices);
    std::cout << "discovery: found " << result.devices.size() << " device(s)" << std::endl;
    return result;
}

} // namespace battwatch
