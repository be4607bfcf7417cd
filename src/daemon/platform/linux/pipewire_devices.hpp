#pragma once

#include "platform/device_enumerator.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <pipewire/pipewire.h>

// Tracks Audio/Source nodes through the PipeWire registry.
class PipeWireDeviceEnumerator : public DeviceEnumerator {
public:
    PipeWireDeviceEnumerator();
    ~PipeWireDeviceEnumerator() override;

    PipeWireDeviceEnumerator(const PipeWireDeviceEnumerator&) = delete;
    PipeWireDeviceEnumerator& operator=(const PipeWireDeviceEnumerator&) = delete;

    std::vector<AudioDevice> input_devices() const override;
    bool watch(std::function<void()> on_change) override;
    void unwatch() override;

    bool connected() const { return core_ != nullptr; }

private:
    static void on_global(void* data, uint32_t id, uint32_t permissions, const char* type,
                          uint32_t version, const struct spa_dict* props);
    static void on_global_remove(void* data, uint32_t id);
    static void on_core_done(void* data, uint32_t id, int seq);
    static void on_core_error(void* data, uint32_t id, int seq, int res, const char* message);

    void notify();
    void disconnect();

    mutable std::mutex mutex_;
    std::map<uint32_t, AudioDevice> nodes_;
    std::function<void()> on_change_;

    pw_thread_loop* loop_ = nullptr;
    pw_context* context_ = nullptr;
    pw_core* core_ = nullptr;
    pw_registry* registry_ = nullptr;
    spa_hook core_listener_{};
    spa_hook registry_listener_{};
    int sync_seq_ = 0;
    bool synced_ = false;

    static constexpr pw_registry_events registry_events_ = {
        .version = PW_VERSION_REGISTRY_EVENTS,
        .global = on_global,
        .global_remove = on_global_remove,
    };

    static constexpr pw_core_events core_events_ = {
        .version = PW_VERSION_CORE_EVENTS,
        .done = on_core_done,
        .error = on_core_error,
    };
};
