// SPDX-License-Identifier: Apache-2.0
#include "IBusTarget.hpp"

#include <bridge/Protocol.hpp>
#include <core/Log.hpp>

#include <string>

namespace voicebridge
{

IBusTarget::IBusTarget(IBusEngine* engine, Dispatcher& dispatcher, CapabilityFile& capabilityFile):
    _engine(engine), _dispatcher(dispatcher), _capabilityFile(capabilityFile)
{
    _dispatcher.attachTarget(*this);
}

IBusTarget::~IBusTarget()
{
    _dispatcher.detachTarget(*this);
}

void IBusTarget::commit(std::string_view text)
{
    auto const owned = std::string(text);
    ibus_engine_commit_text(_engine, ibus_text_new_from_string(owned.c_str()));
}

void IBusTarget::showPreview(std::string_view text, bool markAsUnderlined)
{
    auto const owned = std::string(text);
    auto const length = static_cast<guint>(utf8Length(owned));

    auto* preedit = ibus_text_new_from_string(owned.c_str());
    if (markAsUnderlined)
        ibus_text_append_attribute(preedit, IBUS_ATTR_TYPE_UNDERLINE, IBUS_ATTR_UNDERLINE_SINGLE, 0, length);

    ibus_engine_update_preedit_text_with_mode(_engine, preedit, length, TRUE, IBUS_ENGINE_PREEDIT_CLEAR);
}

void IBusTarget::hidePreview()
{
    ibus_engine_update_preedit_text(_engine, ibus_text_new_from_static_string(""), 0, FALSE);
}

void IBusTarget::deleteBeforeCursor(int count)
{
    if (count > 0)
        ibus_engine_delete_surrounding_text(_engine, -count, static_cast<guint>(count));
}

auto IBusTarget::capabilities() const -> TargetCapabilities
{
    return _capabilities;
}

void IBusTarget::onSetCapabilities(guint caps)
{
    _capabilities.supportsSurroundingText = (caps & IBUS_CAP_SURROUNDING_TEXT) != 0;
    _capabilityFile.write(_capabilities);
    log::info("Client capabilities: surrounding_text={} (0x{:x})", _capabilities.supportsSurroundingText, caps);
}

void IBusTarget::onFocusIn()
{
    _dispatcher.attachTarget(*this);
    _capabilityFile.write(_capabilities);
}

void IBusTarget::onFocusOut()
{
    hidePreview();
}

void IBusTarget::onEnable()
{
    hidePreview();
    log::info("voicebridge engine enabled");
}

void IBusTarget::onDisable()
{
    hidePreview();
    log::info("voicebridge engine disabled");
}

void IBusTarget::onReset()
{
    hidePreview();
}

} // namespace voicebridge
