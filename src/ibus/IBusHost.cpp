// SPDX-License-Identifier: Apache-2.0
#include "IBusHost.hpp"

#include <core/Log.hpp>
#include <ibus/IBusTarget.hpp>

#include <glib-unix.h>
#include <ibus.h>

#include <csignal>
#include <format>
#include <memory>
#include <utility>

namespace
{

/// @brief State the engine factory hands to every engine it creates.
struct EngineContext
{
    voicebridge::Dispatcher* dispatcher = nullptr;
    voicebridge::CapabilityFile* capabilityFile = nullptr;
    IBusBus* bus = nullptr;
    int engineCount = 0;
};

} // namespace

// GObject instance; the engine owns target from creation until destroy.
struct VoiceBridgeEngine
{
    IBusEngine parent;
    voicebridge::IBusTarget* target;
};

struct VoiceBridgeEngineClass
{
    IBusEngineClass parent;
};

G_DEFINE_TYPE(VoiceBridgeEngine, voicebridge_engine, IBUS_TYPE_ENGINE)

namespace
{

auto targetOf(IBusEngine* engine) -> voicebridge::IBusTarget*
{
    return reinterpret_cast<VoiceBridgeEngine*>(engine)->target;
}

// Key events are never intercepted; text arrives over the command socket only.
auto engineProcessKeyEvent(IBusEngine*, guint, guint, guint) -> gboolean
{
    return FALSE;
}

void engineFocusIn(IBusEngine* engine)
{
    if (auto* target = targetOf(engine))
        target->onFocusIn();
}

void engineFocusOut(IBusEngine* engine)
{
    if (auto* target = targetOf(engine))
        target->onFocusOut();
}

void engineReset(IBusEngine* engine)
{
    if (auto* target = targetOf(engine))
        target->onReset();
}

void engineEnable(IBusEngine* engine)
{
    if (auto* target = targetOf(engine))
        target->onEnable();
}

void engineDisable(IBusEngine* engine)
{
    if (auto* target = targetOf(engine))
        target->onDisable();
}

void engineSetCapabilities(IBusEngine* engine, guint caps)
{
    if (auto* target = targetOf(engine))
        target->onSetCapabilities(caps);
}

void engineDestroy(IBusObject* object)
{
    auto* self = reinterpret_cast<VoiceBridgeEngine*>(object);
    auto owned = std::unique_ptr<voicebridge::IBusTarget>(std::exchange(self->target, nullptr));
    owned.reset();

    IBUS_OBJECT_CLASS(voicebridge_engine_parent_class)->destroy(object);
}

auto onCreateEngine(IBusFactory*, gchar* engineName, gpointer userData) -> IBusEngine*
{
    auto* context = static_cast<EngineContext*>(userData);
    auto const objectPath = std::format("/org/freedesktop/IBus/Engine/{}", ++context->engineCount);

    auto* engine = IBUS_ENGINE(g_object_new(voicebridge_engine_get_type(),
                                            "engine-name",
                                            engineName,
                                            "object-path",
                                            objectPath.c_str(),
                                            "connection",
                                            ibus_bus_get_connection(context->bus),
                                            nullptr));

    // The newest engine becomes the active target right away.
    auto target = std::make_unique<voicebridge::IBusTarget>(engine, *context->dispatcher, *context->capabilityFile);
    reinterpret_cast<VoiceBridgeEngine*>(engine)->target = target.release();

    voicebridge::log::info("Created engine: {} at {}", engineName, objectPath);
    return engine;
}

auto drainIdle(gpointer userData) -> gboolean
{
    static_cast<voicebridge::Dispatcher*>(userData)->drain();
    return G_SOURCE_REMOVE;
}

auto quitOnSignal(gpointer userData) -> gboolean
{
    voicebridge::log::info("Shutting down voicebridge engine");
    g_main_loop_quit(static_cast<GMainLoop*>(userData));
    return G_SOURCE_CONTINUE;
}

void onBusDisconnected(IBusBus*, gpointer userData)
{
    voicebridge::log::warning("Lost connection to the IBus daemon");
    g_main_loop_quit(static_cast<GMainLoop*>(userData));
}

} // namespace

static void voicebridge_engine_init(VoiceBridgeEngine* self)
{
    self->target = nullptr;
}

static void voicebridge_engine_class_init(VoiceBridgeEngineClass* klass)
{
    auto* engineClass = IBUS_ENGINE_CLASS(klass);
    engineClass->process_key_event = engineProcessKeyEvent;
    engineClass->focus_in = engineFocusIn;
    engineClass->focus_out = engineFocusOut;
    engineClass->reset = engineReset;
    engineClass->enable = engineEnable;
    engineClass->disable = engineDisable;
    engineClass->set_capabilities = engineSetCapabilities;

    IBUS_OBJECT_CLASS(klass)->destroy = engineDestroy;
}

namespace voicebridge
{

struct IBusHost::Impl
{
    Dispatcher& dispatcher;
    CapabilityFile& capabilityFile;

    EngineContext engineContext;
    IBusBus* bus = nullptr;
    IBusFactory* factory = nullptr;
    GMainLoop* loop = nullptr;
    guint sigintSource = 0;
    guint sigtermSource = 0;

    Impl(Dispatcher& dispatcher, CapabilityFile& capabilityFile):
        dispatcher(dispatcher), capabilityFile(capabilityFile)
    {
    }

    ~Impl()
    {
        if (sigintSource)
            g_source_remove(sigintSource);
        if (sigtermSource)
            g_source_remove(sigtermSource);
        if (factory)
            g_object_unref(factory);
        if (bus)
            g_object_unref(bus);
        if (loop)
            g_main_loop_unref(loop);
    }
};

IBusHost::IBusHost(Dispatcher& dispatcher, CapabilityFile& capabilityFile):
    _impl(std::make_unique<Impl>(dispatcher, capabilityFile))
{
}

IBusHost::~IBusHost()
{
    _impl->dispatcher.setScheduler({});
}

auto IBusHost::connect(const IBusHostConfig& config) -> VoidResult
{
    ibus_init();

    _impl->bus = ibus_bus_new();
    if (!_impl->bus || !ibus_bus_is_connected(_impl->bus))
        return makeError(ErrorCode::HostServiceError, "Cannot connect to IBus daemon");

    _impl->loop = g_main_loop_new(nullptr, FALSE);
    g_signal_connect(_impl->bus, "disconnected", G_CALLBACK(onBusDisconnected), _impl->loop);

    _impl->engineContext = EngineContext {
        .dispatcher = &_impl->dispatcher,
        .capabilityFile = &_impl->capabilityFile,
        .bus = _impl->bus,
    };
    _impl->factory = ibus_factory_new(ibus_bus_get_connection(_impl->bus));
    g_signal_connect(_impl->factory, "create-engine", G_CALLBACK(onCreateEngine), &_impl->engineContext);

    // Components are floating; take ownership so the reference can be dropped after registration.
    auto* component = ibus_component_new(config.componentName.c_str(),
                                         "Voice Bridge Input Method",
                                         "1.0",
                                         "Apache-2.0",
                                         "voicebridge",
                                         "",
                                         "",
                                         "voicebridge");
    g_object_ref_sink(component);
    ibus_component_add_engine(component,
                              ibus_engine_desc_new(config.engineName.c_str(),
                                                   config.engineLongName.c_str(),
                                                   config.description.c_str(),
                                                   config.language.c_str(),
                                                   "Apache-2.0",
                                                   "voicebridge",
                                                   "audio-input-microphone",
                                                   config.layout.c_str()));

    auto const registered = ibus_bus_register_component(_impl->bus, component);
    g_object_unref(component);
    if (!registered)
        log::warning("IBus daemon rejected component {}", config.componentName);

    auto const nameReply = ibus_bus_request_name(_impl->bus, config.componentName.c_str(), 0);
    log::debug("request_name: {}", nameReply);

    _impl->sigintSource = g_unix_signal_add(SIGINT, quitOnSignal, _impl->loop);
    _impl->sigtermSource = g_unix_signal_add(SIGTERM, quitOnSignal, _impl->loop);

    _impl->dispatcher.setScheduler(
        [dispatcher = &_impl->dispatcher] { g_idle_add(drainIdle, dispatcher); });

    log::info("IBus engine '{}' registered", config.engineName);
    return {};
}

void IBusHost::run()
{
    if (!_impl->loop)
        return;
    g_main_loop_run(_impl->loop);

    // Operations queued after the last idle callback still belong to this context.
    _impl->dispatcher.drain();
}

void IBusHost::quit()
{
    if (_impl->loop)
        g_main_loop_quit(_impl->loop);
}

} // namespace voicebridge
