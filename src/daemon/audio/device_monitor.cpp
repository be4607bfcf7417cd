#include "audio/device_monitor.hpp"

#include <algorithm>
#include <print>

DeviceMonitor::DeviceMonitor(DeviceEnumerator& enumerator, Scheduler& scheduler,
                             std::chrono::milliseconds poll_interval, bool verbose)
    : enumerator_(enumerator), scheduler_(scheduler),
      poll_interval_(poll_interval), verbose_(verbose), poll_timer_(scheduler) {}

DeviceMonitor::~DeviceMonitor() {
    stop();
    *alive_ = false;
}

void DeviceMonitor::start() {
    if (running_) return;
    running_ = true;

    refresh();

    std::weak_ptr<bool> alive = alive_;
    bool watching = enumerator_.watch([this, alive]() {
        scheduler_.post([this, alive]() {
            auto a = alive.lock();
            if (a && *a && running_) refresh();
        });
    });
    if (!watching) {
        std::println(stderr, "devices: change events unavailable, polling only");
    }

    schedule_poll();
}

void DeviceMonitor::stop() {
    if (!running_) return;
    running_ = false;
    poll_timer_.reset();
    enumerator_.unwatch();
}

void DeviceMonitor::schedule_poll() {
    poll_timer_.arm(poll_interval_, [this]() {
        refresh();
        if (running_) schedule_poll();
    });
}

void DeviceMonitor::refresh() {
    auto current = enumerator_.input_devices();

    std::set<std::string> uids;
    for (const auto& d : current) uids.insert(d.uid);

    if (published_ && uids == published_uids_) {
        // Same devices; names may still have changed.
        devices_ = std::move(current);
        return;
    }

    devices_ = std::move(current);
    published_uids_ = std::move(uids);
    published_ = true;

    if (verbose_) {
        std::println(stderr, "[mute] devices: {} input device(s)", devices_.size());
    }
    for (auto& listener : listeners_) {
        listener(devices_);
    }
}

bool DeviceMonitor::contains(const std::string& uid) const {
    return std::ranges::any_of(devices_, [&](const AudioDevice& d) { return d.uid == uid; });
}
