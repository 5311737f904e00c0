// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <variant>
#include <vector>

namespace voicebridge
{

/// @brief `preedit:<text>`: show text as the in-progress preview (empty text clears it).
struct PreviewCommand
{
    std::string text;
};

/// @brief `commit:<text>`: replace the preview with final text.
struct CommitCommand
{
    std::string text;
};

/// @brief `delete:<N>`: remove N characters before the cursor.
struct DeleteCommand
{
    int count = 0;
};

/// @brief `replace:<N>:<text>`: remove N characters before the cursor, then commit text.
struct ReplaceCommand
{
    int count = 0;
    std::string text;
};

/// @brief A command as received on the wire.
using Command = std::variant<PreviewCommand, CommitCommand, DeleteCommand, ReplaceCommand>;

/// @brief Shows text as the preview, replacing any preview currently shown.
struct ShowPreview
{
    std::string text;
};

/// @brief Hides whatever preview is currently shown.
struct ClearPreview
{
};

/// @brief Commits text into the target document.
struct CommitText
{
    std::string text;
};

/// @brief Removes characters immediately preceding the cursor.
struct DeleteBeforeCursor
{
    int count = 0;
};

/// @brief Removes characters before the cursor, then commits text.
struct ReplaceBeforeCursor
{
    int count = 0;
    std::string text;
};

/// @brief A single step executed by the dispatcher against the active target.
using EditOperation = std::variant<ShowPreview, ClearPreview, CommitText, DeleteBeforeCursor, ReplaceBeforeCursor>;

/// @brief Ordered operations produced from one command; always enqueued as one unit.
using EditBatch = std::vector<EditOperation>;

} // namespace voicebridge
