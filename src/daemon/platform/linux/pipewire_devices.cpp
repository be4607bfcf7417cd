#include "platform/linux/pipewire_devices.hpp"

#include <cstring>
#include <print>
#include <spa/utils/result.h>

PipeWireDeviceEnumerator::PipeWireDeviceEnumerator() {
    pw_init(nullptr, nullptr);

    loop_ = pw_thread_loop_new("mute-devices", nullptr);
    if (!loop_) {
        std::println(stderr, "devices: failed to create thread loop");
        return;
    }

    context_ = pw_context_new(pw_thread_loop_get_loop(loop_), nullptr, 0);
    if (!context_) {
        std::println(stderr, "devices: failed to create context");
        disconnect();
        return;
    }

    if (pw_thread_loop_start(loop_) < 0) {
        std::println(stderr, "devices: thread loop start failed");
        disconnect();
        return;
    }

    pw_thread_loop_lock(loop_);
    core_ = pw_context_connect(context_, nullptr, 0);
    if (!core_) {
        pw_thread_loop_unlock(loop_);
        std::println(stderr, "devices: cannot connect to PipeWire");
        disconnect();
        return;
    }

    pw_core_add_listener(core_, &core_listener_, &core_events_, this);
    registry_ = pw_core_get_registry(core_, PW_VERSION_REGISTRY, 0);
    pw_registry_add_listener(registry_, &registry_listener_, &registry_events_, this);

    // Wait for the initial batch of globals.
    sync_seq_ = pw_core_sync(core_, PW_ID_CORE, 0);
    for (int i = 0; i < 2 && !synced_; ++i) {
        pw_thread_loop_timed_wait(loop_, 1);
    }
    pw_thread_loop_unlock(loop_);
}

PipeWireDeviceEnumerator::~PipeWireDeviceEnumerator() {
    unwatch();
    disconnect();
    pw_deinit();
}

void PipeWireDeviceEnumerator::disconnect() {
    if (loop_) pw_thread_loop_stop(loop_);

    if (registry_) {
        spa_hook_remove(&registry_listener_);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry_));
        registry_ = nullptr;
    }
    if (core_) {
        spa_hook_remove(&core_listener_);
        pw_core_disconnect(core_);
        core_ = nullptr;
    }
    if (context_) {
        pw_context_destroy(context_);
        context_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

std::vector<AudioDevice> PipeWireDeviceEnumerator::input_devices() const {
    std::lock_guard lock(mutex_);
    std::vector<AudioDevice> out;
    out.reserve(nodes_.size());
    for (const auto& [id, dev] : nodes_) out.push_back(dev);
    return out;
}

bool PipeWireDeviceEnumerator::watch(std::function<void()> on_change) {
    if (!core_) return false;
    std::lock_guard lock(mutex_);
    on_change_ = std::move(on_change);
    return true;
}

void PipeWireDeviceEnumerator::unwatch() {
    std::lock_guard lock(mutex_);
    on_change_ = nullptr;
}

void PipeWireDeviceEnumerator::notify() {
    std::function<void()> cb;
    {
        std::lock_guard lock(mutex_);
        cb = on_change_;
    }
    if (cb) cb();
}

void PipeWireDeviceEnumerator::on_global(void* data, uint32_t id, uint32_t /*permissions*/,
                                         const char* type, uint32_t /*version*/,
                                         const struct spa_dict* props) {
    auto* self = static_cast<PipeWireDeviceEnumerator*>(data);
    if (!props || std::strcmp(type, PW_TYPE_INTERFACE_Node) != 0) return;

    const char* media_class = spa_dict_lookup(props, PW_KEY_MEDIA_CLASS);
    if (!media_class || std::strcmp(media_class, "Audio/Source") != 0) return;

    const char* name = spa_dict_lookup(props, PW_KEY_NODE_NAME);
    if (!name) return;
    const char* desc = spa_dict_lookup(props, PW_KEY_NODE_DESCRIPTION);

    {
        std::lock_guard lock(self->mutex_);
        self->nodes_[id] = AudioDevice{.uid = name, .name = desc ? desc : name};
    }
    if (self->synced_) self->notify();
}

void PipeWireDeviceEnumerator::on_global_remove(void* data, uint32_t id) {
    auto* self = static_cast<PipeWireDeviceEnumerator*>(data);
    bool removed;
    {
        std::lock_guard lock(self->mutex_);
        removed = self->nodes_.erase(id) > 0;
    }
    if (removed) self->notify();
}

void PipeWireDeviceEnumerator::on_core_done(void* data, uint32_t id, int seq) {
    auto* self = static_cast<PipeWireDeviceEnumerator*>(data);
    if (id == PW_ID_CORE && seq == self->sync_seq_) {
        self->synced_ = true;
        pw_thread_loop_signal(self->loop_, false);
    }
}

void PipeWireDeviceEnumerator::on_core_error(void* /*data*/, uint32_t id, int /*seq*/, int res,
                                             const char* message) {
    std::println(stderr, "devices: core error on {}: {} ({})", id, message ? message : "",
                 spa_strerror(res));
}
