// SPDX-License-Identifier: Apache-2.0
#include "Protocol.hpp"

#include <charconv>
#include <format>

namespace voicebridge
{

namespace
{

    constexpr auto Whitespace = std::string_view { " \t\n\r\f\v" };
    constexpr auto ReplacementCharacter = std::string_view { "\xEF\xBF\xBD" };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const start = text.find_first_not_of(Whitespace);
        if (start == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(Whitespace);
        return text.substr(start, end - start + 1);
    }

    /// @brief Parses a signed decimal count, tolerating surrounding whitespace and a leading '+'.
    auto parseCount(std::string_view text) -> std::optional<int>
    {
        text = trim(text);
        if (text.starts_with('+'))
            text.remove_prefix(1);
        if (text.empty())
            return std::nullopt;

        auto value = 0;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || ptr != text.data() + text.size())
            return std::nullopt;
        return value;
    }

    auto flattenLineBreaks(std::string text) -> std::string
    {
        for (auto& ch: text)
            if (ch == '\n' || ch == '\r')
                ch = ' ';
        return text;
    }

    /// @brief Length of the well-formed UTF-8 sequence starting at bytes[0], or the length
    ///        of its maximal invalid subpart (negated) when it is ill-formed.
    auto sequenceLength(std::string_view bytes) -> int
    {
        auto const lead = static_cast<unsigned char>(bytes[0]);
        if (lead < 0x80)
            return 1;

        auto need = 0;
        auto lower = static_cast<unsigned char>(0x80);
        auto upper = static_cast<unsigned char>(0xBF);

        if (lead >= 0xC2 && lead <= 0xDF)
            need = 1;
        else if (lead == 0xE0)
        {
            need = 2;
            lower = 0xA0;
        }
        else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF)
            need = 2;
        else if (lead == 0xED)
        {
            need = 2;
            upper = 0x9F;
        }
        else if (lead == 0xF0)
        {
            need = 3;
            lower = 0x90;
        }
        else if (lead >= 0xF1 && lead <= 0xF3)
            need = 3;
        else if (lead == 0xF4)
        {
            need = 3;
            upper = 0x8F;
        }
        else
            return -1;

        for (auto i = 1; i <= need; ++i)
        {
            if (static_cast<std::size_t>(i) >= bytes.size())
                return -i;
            auto const byte = static_cast<unsigned char>(bytes[static_cast<std::size_t>(i)]);
            if (byte < lower || byte > upper)
                return -i;
            lower = 0x80;
            upper = 0xBF;
        }
        return need + 1;
    }

} // namespace

auto parseCommand(std::string_view line) -> std::optional<Command>
{
    auto const colon = line.find(':');
    if (colon == std::string_view::npos)
        return std::nullopt;

    auto const tag = trim(line.substr(0, colon));
    auto const payload = line.substr(colon + 1);

    if (tag == "preedit")
        return PreviewCommand { std::string(payload) };

    if (tag == "commit")
        return CommitCommand { std::string(payload) };

    if (tag == "delete")
    {
        auto const count = parseCount(payload);
        if (!count)
            return std::nullopt;
        return DeleteCommand { *count };
    }

    if (tag == "replace")
    {
        auto const separator = payload.find(':');
        if (separator == std::string_view::npos)
            return std::nullopt;
        auto const count = parseCount(payload.substr(0, separator));
        if (!count)
            return std::nullopt;
        return ReplaceCommand { *count, std::string(payload.substr(separator + 1)) };
    }

    return std::nullopt;
}

auto formatCommand(const Command& command) -> std::string
{
    struct Formatter
    {
        auto operator()(const PreviewCommand& c) const -> std::string
        {
            return std::format("preedit:{}\n", flattenLineBreaks(c.text));
        }
        auto operator()(const CommitCommand& c) const -> std::string
        {
            return std::format("commit:{}\n", flattenLineBreaks(c.text));
        }
        auto operator()(const DeleteCommand& c) const -> std::string { return std::format("delete:{}\n", c.count); }
        auto operator()(const ReplaceCommand& c) const -> std::string
        {
            return std::format("replace:{}:{}\n", c.count, flattenLineBreaks(c.text));
        }
    };
    return std::visit(Formatter {}, command);
}

auto translateCommand(Command command) -> EditBatch
{
    struct Translator
    {
        auto operator()(PreviewCommand& c) const -> EditBatch
        {
            return { ShowPreview { std::move(c.text) } };
        }
        auto operator()(CommitCommand& c) const -> EditBatch
        {
            return { ClearPreview {}, CommitText { std::move(c.text) } };
        }
        auto operator()(DeleteCommand& c) const -> EditBatch { return { DeleteBeforeCursor { c.count } }; }
        auto operator()(ReplaceCommand& c) const -> EditBatch
        {
            // Same preview handling as a commit, so replace:0:X and commit:X are indistinguishable.
            return { ClearPreview {}, ReplaceBeforeCursor { c.count, std::move(c.text) } };
        }
    };
    return std::visit(Translator {}, command);
}

auto sanitizeUtf8(std::string_view bytes) -> std::string
{
    auto out = std::string {};
    out.reserve(bytes.size());

    while (!bytes.empty())
    {
        auto const length = sequenceLength(bytes);
        if (length > 0)
        {
            out.append(bytes.substr(0, static_cast<std::size_t>(length)));
            bytes.remove_prefix(static_cast<std::size_t>(length));
        }
        else
        {
            out.append(ReplacementCharacter);
            bytes.remove_prefix(static_cast<std::size_t>(-length));
        }
    }
    return out;
}

auto utf8Length(std::string_view text) -> std::size_t
{
    auto count = std::size_t { 0 };
    for (auto const ch: text)
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80)
            ++count;
    return count;
}

auto LineSplitter::feed(std::string_view bytes) -> std::vector<std::string>
{
    _buffer.append(bytes);

    auto lines = std::vector<std::string> {};
    auto start = std::size_t { 0 };
    while (true)
    {
        auto const newline = _buffer.find('\n', start);
        if (newline == std::string::npos)
            break;

        auto const line = trim(std::string_view(_buffer).substr(start, newline - start));
        if (!line.empty())
            lines.push_back(sanitizeUtf8(line));
        start = newline + 1;
    }
    _buffer.erase(0, start);
    return lines;
}

} // namespace voicebridge
