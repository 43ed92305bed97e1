#include "panels/Volume.hpp"
#include "panels/Format.hpp"
#include "panels/PanelStream.hpp"
#include "runtime/Channel.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <spa/param/audio/raw.h>
#include <spa/param/props.h>
#include <spa/pod/builder.h>
#include <spa/pod/iter.h>
#include <spa/utils/result.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace lazybar::panels {

using util::Logger;

namespace {

struct SinkState {
    bool bound = false;
    bool muted = false;
    int percent = 0;
};

// Connection to the PipeWire daemon on its own thread loop. Every member
// below loop_ is touched only with the loop lock held.
class SinkMonitor {
public:
    SinkMonitor(std::string sink_name, std::shared_ptr<runtime::Channel<bool>> changes)
        : sink_name_(std::move(sink_name)), changes_(std::move(changes)) {}

    ~SinkMonitor() { close(); }

    SinkMonitor(const SinkMonitor&) = delete;
    SinkMonitor& operator=(const SinkMonitor&) = delete;

    [[nodiscard]] bool init() {
        pw_init(nullptr, nullptr);
        loop_ = pw_thread_loop_new("lazybar-volume", nullptr);
        if (!loop_) return false;

        context_ = pw_context_new(pw_thread_loop_get_loop(loop_), nullptr, 0);
        if (!context_) return false;

        pw_thread_loop_lock(loop_);
        core_ = pw_context_connect(context_, nullptr, 0);
        if (!core_) {
            pw_thread_loop_unlock(loop_);
            return false;
        }
        registry_ = pw_core_get_registry(core_, PW_VERSION_REGISTRY, 0);
        spa_zero(registry_listener_);
        pw_registry_add_listener(registry_, &registry_listener_, &registry_events, this);
        pw_thread_loop_unlock(loop_);

        if (pw_thread_loop_start(loop_) < 0) return false;
        return true;
    }

    void close() {
        if (loop_) pw_thread_loop_stop(loop_);
        unbind_node();
        if (registry_) {
            spa_hook_remove(&registry_listener_);
            pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry_));
            registry_ = nullptr;
        }
        if (core_) {
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

    SinkState state() {
        pw_thread_loop_lock(loop_);
        SinkState state = state_;
        pw_thread_loop_unlock(loop_);
        return state;
    }

    bool toggle_mute() {
        pw_thread_loop_lock(loop_);
        bool ok = state_.bound && send_props(state_.percent, !state_.muted);
        pw_thread_loop_unlock(loop_);
        return ok;
    }

    bool adjust(int delta) {
        pw_thread_loop_lock(loop_);
        bool ok = state_.bound && send_props(std::clamp(state_.percent + delta, 0, 100), state_.muted);
        pw_thread_loop_unlock(loop_);
        return ok;
    }

private:
    static void on_global(void* data, uint32_t id, uint32_t, const char* type, uint32_t,
                          const struct spa_dict* props) {
        auto* self = static_cast<SinkMonitor*>(data);
        if (self->node_ || std::strcmp(type, PW_TYPE_INTERFACE_Node) != 0 || !props) return;

        const char* media_class = spa_dict_lookup(props, PW_KEY_MEDIA_CLASS);
        if (!media_class || std::strcmp(media_class, "Audio/Sink") != 0) return;

        const char* node_name = spa_dict_lookup(props, PW_KEY_NODE_NAME);
        if (!self->sink_name_.empty() && (!node_name || self->sink_name_ != node_name)) return;

        self->node_ = static_cast<pw_node*>(pw_registry_bind(self->registry_, id, type, PW_VERSION_NODE, 0));
        if (!self->node_) return;
        self->node_id_ = id;

        spa_zero(self->node_listener_);
        pw_node_add_listener(self->node_, &self->node_listener_, &node_events, self);
        uint32_t ids[] = {SPA_PARAM_Props};
        pw_node_subscribe_params(self->node_, ids, 1);

        Logger::info(std::string("Volume: Bound sink ") + (node_name ? node_name : "(unnamed)"));
    }

    static void on_global_remove(void* data, uint32_t id) {
        auto* self = static_cast<SinkMonitor*>(data);
        if (!self->node_ || id != self->node_id_) return;
        Logger::warn("Volume: Sink removed");
        self->unbind_node();
        self->state_ = SinkState{};
        self->changes_->send(true);
    }

    static void on_node_param(void* data, int, uint32_t id, uint32_t, uint32_t, const struct spa_pod* param) {
        auto* self = static_cast<SinkMonitor*>(data);
        if (id != SPA_PARAM_Props || !param || !spa_pod_is_object(param)) return;

        const auto* object = reinterpret_cast<const spa_pod_object*>(param);
        const spa_pod_prop* prop = nullptr;
        bool changed = false;
        SPA_POD_OBJECT_FOREACH(object, prop) {
            if (prop->key == SPA_PROP_mute) {
                bool muted = false;
                if (spa_pod_get_bool(&prop->value, &muted) == 0) {
                    self->state_.muted = muted;
                    changed = true;
                }
            } else if (prop->key == SPA_PROP_channelVolumes) {
                float volumes[SPA_AUDIO_MAX_CHANNELS];
                uint32_t count = spa_pod_copy_array(&prop->value, SPA_TYPE_Float, volumes, SPA_AUDIO_MAX_CHANNELS);
                if (count == 0) continue;
                float sum = 0.0f;
                for (uint32_t i = 0; i < count; i++) sum += volumes[i];
                self->channels_ = count;
                self->state_.percent = Volume::linear_to_percent(sum / static_cast<float>(count));
                changed = true;
            }
        }

        if (changed) {
            self->state_.bound = true;
            self->changes_->send(true);
        }
    }

    bool send_props(int percent, bool muted) {
        float volumes[SPA_AUDIO_MAX_CHANNELS];
        uint32_t count = std::max<uint32_t>(1, std::min<uint32_t>(channels_, SPA_AUDIO_MAX_CHANNELS));
        std::fill(volumes, volumes + count, Volume::percent_to_linear(percent));

        uint8_t buffer[1024];
        spa_pod_builder builder{};
        spa_pod_builder_init(&builder, buffer, sizeof(buffer));
        spa_pod_frame frame{};
        spa_pod_builder_push_object(&builder, &frame, SPA_TYPE_OBJECT_Props, SPA_PARAM_Props);
        spa_pod_builder_prop(&builder, SPA_PROP_channelVolumes, 0);
        spa_pod_builder_array(&builder, sizeof(float), SPA_TYPE_Float, count, volumes);
        spa_pod_builder_prop(&builder, SPA_PROP_mute, 0);
        spa_pod_builder_bool(&builder, muted);
        auto* pod = static_cast<spa_pod*>(spa_pod_builder_pop(&builder, &frame));

        int result = pw_node_set_param(node_, SPA_PARAM_Props, 0, pod);
        if (result < 0) {
            Logger::error(std::string("Volume: set_param failed: ") + spa_strerror(result));
            return false;
        }
        return true;
    }

    void unbind_node() {
        if (!node_) return;
        spa_hook_remove(&node_listener_);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(node_));
        node_ = nullptr;
    }

    static constexpr pw_registry_events registry_events = {
        .version = PW_VERSION_REGISTRY_EVENTS,
        .global = on_global,
        .global_remove = on_global_remove,
    };

    static constexpr pw_node_events node_events = {
        .version = PW_VERSION_NODE_EVENTS,
        .info = nullptr,
        .param = on_node_param,
    };

    std::string sink_name_;
    std::shared_ptr<runtime::Channel<bool>> changes_;

    pw_thread_loop* loop_ = nullptr;
    pw_context* context_ = nullptr;
    pw_core* core_ = nullptr;
    pw_registry* registry_ = nullptr;
    spa_hook registry_listener_{};
    pw_node* node_ = nullptr;
    spa_hook node_listener_{};
    uint32_t node_id_ = 0;
    uint32_t channels_ = 2;
    SinkState state_;
};

class VolumeStream : public PanelStream {
public:
    VolumeStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& attrs, int height,
                 bar::EventChannel events, std::unique_ptr<SinkMonitor> monitor,
                 std::shared_ptr<runtime::Channel<bool>> changes, std::string format, std::string format_muted,
                 int step)
        : PanelStream(std::move(common), surface, attrs, height, std::move(events)),
          monitor_(std::move(monitor)),
          changes_(std::move(changes)),
          format_(std::move(format)),
          format_muted_(std::move(format_muted)),
          step_(step) {}

protected:
    runtime::Poll<bool> poll_source(const runtime::Waker& waker) override {
        auto change = changes_->poll_next(waker);
        if (change.is_pending()) return runtime::Poll<bool>::pending();
        if (change.is_done()) return runtime::Poll<bool>::done();
        while (changes_->try_receive()) {
        }
        return runtime::Poll<bool>::ready(true);
    }

    bar::PanelUpdate render() override {
        auto state = monitor_->state();
        if (!state.bound) {
            return draw_text("");
        }
        const auto& format = state.muted ? format_muted_ : format_;
        return draw_text(substitute(format, {
            {"volume", std::to_string(state.percent)},
            {"ramp", common().ramp.choose(state.percent, 0.0, 100.0)},
        }));
    }

    bar::EventResponse handle_action(const std::string& action, bool& redraw) override {
        // The node reports the new props back, which triggers the redraw
        redraw = false;
        bool ok = false;
        if (action == "toggle_mute") {
            ok = monitor_->toggle_mute();
        } else if (action == "increment") {
            ok = monitor_->adjust(step_);
        } else if (action == "decrement") {
            ok = monitor_->adjust(-step_);
        } else {
            return bar::EventResponse::failure("Unknown event " + action);
        }
        if (!ok) return bar::EventResponse::failure("No sink available");
        return bar::EventResponse::success();
    }

private:
    std::unique_ptr<SinkMonitor> monitor_;
    std::shared_ptr<runtime::Channel<bool>> changes_;
    std::string format_;
    std::string format_muted_;
    int step_;
};

}  // namespace

PanelConfigPtr Volume::parse(const std::string& name, const config::Table& table, const config::Config& global) {
    auto volume = std::make_unique<Volume>();
    volume->common_ = PanelCommon::parse(name, table, global);
    volume->sink_ = table.get_string_or("sink", "");
    volume->format_ = PanelCommon::parse_format(table, "", "VOL: %volume%%");
    volume->format_muted_ = PanelCommon::parse_format(table, "muted", "MUTE");

    auto step = table.get_int("step").value_or(5);
    if (step <= 0 || step > 100) {
        throw config::ConfigError("[panels." + name + "] step must be between 1 and 100");
    }
    volume->step_ = static_cast<int>(step);
    return volume;
}

PanelRun Volume::run(draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                     runtime::Scheduler&) {
    auto changes = runtime::Channel<bool>::create();
    auto monitor = std::make_unique<SinkMonitor>(sink_, changes);
    if (!monitor->init()) {
        throw std::runtime_error("Failed to connect to PipeWire");
    }

    auto events = runtime::Channel<bar::Event>::create();
    PanelRun run;
    run.events = events;
    run.stream = std::make_unique<VolumeStream>(common_, surface, default_attrs, height, events, std::move(monitor),
                                                changes, format_, format_muted_, step_);
    return run;
}

int Volume::linear_to_percent(float linear) {
    if (linear <= 0.0f) return 0;
    return static_cast<int>(std::lround(std::cbrt(linear) * 100.0f));
}

float Volume::percent_to_linear(int percent) {
    float cubic = static_cast<float>(std::clamp(percent, 0, 100)) / 100.0f;
    return cubic * cubic * cubic;
}

}  // namespace lazybar::panels
