// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/CapabilityFile.hpp>
#include <bridge/Dispatcher.hpp>
#include <bridge/InputTarget.hpp>

#include <ibus.h>

namespace voicebridge
{

/// @brief InputTarget backed by one IBus engine instance.
///
/// Created and destroyed together with its engine, on the GLib main context. Besides
/// the text operations it reacts to the engine's lifecycle: it becomes the
/// dispatcher's active target on creation and focus-in, releases the slot on
/// destruction, and republishes its capabilities to the side-channel file.
class IBusTarget: public InputTarget
{
  public:
    IBusTarget(IBusEngine* engine, Dispatcher& dispatcher, CapabilityFile& capabilityFile);
    ~IBusTarget() override;

    IBusTarget(const IBusTarget&) = delete;
    IBusTarget& operator=(const IBusTarget&) = delete;

    void commit(std::string_view text) override;
    void showPreview(std::string_view text, bool markAsUnderlined) override;
    void hidePreview() override;
    void deleteBeforeCursor(int count) override;
    [[nodiscard]] auto capabilities() const -> TargetCapabilities override;

    void onSetCapabilities(guint caps);
    void onFocusIn();
    void onFocusOut();
    void onEnable();
    void onDisable();
    void onReset();

  private:
    IBusEngine* _engine;
    Dispatcher& _dispatcher;
    CapabilityFile& _capabilityFile;
    TargetCapabilities _capabilities;
};

} // namespace voicebridge
