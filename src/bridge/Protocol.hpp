// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/Command.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voicebridge
{

/// @brief Parses one protocol line.
///
/// Grammar: `preedit:<text>`, `commit:<text>`, `delete:<N>`, `replace:<N>:<text>`.
/// Unknown tags, non-integer counts and a `replace` without its second field yield
/// std::nullopt. The protocol has no error channel, so callers drop such lines.
/// @param line A single line without its terminator.
[[nodiscard]] auto parseCommand(std::string_view line) -> std::optional<Command>;

/// @brief Formats a command as a protocol line, including the trailing newline.
///
/// Line breaks inside text are flattened to spaces so a command always occupies one line.
[[nodiscard]] auto formatCommand(const Command& command) -> std::string;

/// @brief Translates a command into the operations the dispatcher executes.
///
/// A commit becomes a preview clear followed by the commit, in that order.
[[nodiscard]] auto translateCommand(Command command) -> EditBatch;

/// @brief Replaces invalid UTF-8 sequences with U+FFFD.
[[nodiscard]] auto sanitizeUtf8(std::string_view bytes) -> std::string;

/// @brief Returns the number of code points in a UTF-8 string.
[[nodiscard]] auto utf8Length(std::string_view text) -> std::size_t;

/// @brief Accumulates stream bytes and hands out complete lines.
///
/// Partial lines stay buffered across feed() calls; dropping the splitter discards them.
class LineSplitter
{
  public:
    /// @brief Appends received bytes and returns every line completed by them.
    ///
    /// Lines are UTF-8 sanitized and whitespace-trimmed; empty lines are skipped.
    [[nodiscard]] auto feed(std::string_view bytes) -> std::vector<std::string>;

    /// @brief Number of bytes buffered for an incomplete line.
    [[nodiscard]] auto pendingBytes() const noexcept -> std::size_t { return _buffer.size(); }

    void clear() noexcept { _buffer.clear(); }

  private:
    std::string _buffer;
};

} // namespace voicebridge
