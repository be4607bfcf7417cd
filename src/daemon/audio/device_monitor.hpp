#pragma once

#include "platform/device_enumerator.hpp"
#include "scheduler.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

// Keeps the input device list current from both enumerator change events and
// a periodic poll. Publishes only when the set of device uids changes.
class DeviceMonitor {
public:
    using Listener = std::function<void(const std::vector<AudioDevice>&)>;

    DeviceMonitor(DeviceEnumerator& enumerator, Scheduler& scheduler,
                  std::chrono::milliseconds poll_interval = std::chrono::milliseconds(2000),
                  bool verbose = false);
    ~DeviceMonitor();

    DeviceMonitor(const DeviceMonitor&) = delete;
    DeviceMonitor& operator=(const DeviceMonitor&) = delete;

    void start();
    void stop();

    // Re-enumerates and publishes on change. Control context only.
    void refresh();

    void subscribe(Listener listener) { listeners_.push_back(std::move(listener)); }

    const std::vector<AudioDevice>& devices() const { return devices_; }
    bool contains(const std::string& uid) const;

private:
    void schedule_poll();

    DeviceEnumerator& enumerator_;
    Scheduler& scheduler_;
    std::chrono::milliseconds poll_interval_;
    bool verbose_;

    std::vector<AudioDevice> devices_;
    std::set<std::string> published_uids_;
    bool published_ = false;
    std::vector<Listener> listeners_;
    ScopedTimer poll_timer_;
    bool running_ = false;
    // Outlives queued posts from the enumerator thread.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};
