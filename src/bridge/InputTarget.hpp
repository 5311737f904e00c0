// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string_view>

namespace voicebridge
{

/// @brief Capabilities a text target negotiated with its client application.
struct TargetCapabilities
{
    /// @brief The client can report and edit text around the cursor.
    bool supportsSurroundingText = false;
};

/// @brief Text-insertion surface of the focused application.
///
/// Implementations are owned by the host input-method framework and are only ever
/// called from the dispatcher's consumer context.
class InputTarget
{
  public:
    virtual ~InputTarget() = default;

    /// @brief Inserts final text at the cursor.
    virtual void commit(std::string_view text) = 0;

    /// @brief Shows text as the in-progress preview, replacing any preview shown.
    /// @param markAsUnderlined Draw the preview underlined so it reads as not yet final.
    virtual void showPreview(std::string_view text, bool markAsUnderlined) = 0;

    virtual void hidePreview() = 0;

    /// @brief Removes count characters immediately before the cursor.
    virtual void deleteBeforeCursor(int count) = 0;

    [[nodiscard]] virtual auto capabilities() const -> TargetCapabilities = 0;
};

} // namespace voicebridge
