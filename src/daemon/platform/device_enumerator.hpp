#pragma once

#include <functional>
#include <string>
#include <vector>

struct AudioDevice {
    std::string uid;
    std::string name;

    bool operator==(const AudioDevice&) const = default;
};

class DeviceEnumerator {
public:
    virtual ~DeviceEnumerator() = default;
    virtual std::vector<AudioDevice> input_devices() const = 0;
    // on_change may fire on any thread, possibly several times per change.
    virtual bool watch(std::function<void()> on_change) = 0;
    virtual void unwatch() = 0;
};
