// SPDX-License-Identifier: Apache-2.0
#include <bridge/Protocol.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace voicebridge;

TEST_CASE("parseCommand recognizes the four commands", "[protocol]")
{
    SECTION("preedit")
    {
        auto const command = parseCommand("preedit:Hello");
        REQUIRE(command.has_value());
        REQUIRE(std::holds_alternative<PreviewCommand>(*command));
        CHECK(std::get<PreviewCommand>(*command).text == "Hello");
    }

    SECTION("commit")
    {
        auto const command = parseCommand("commit:Hello there!");
        REQUIRE(command.has_value());
        REQUIRE(std::holds_alternative<CommitCommand>(*command));
        CHECK(std::get<CommitCommand>(*command).text == "Hello there!");
    }

    SECTION("delete")
    {
        auto const command = parseCommand("delete:5");
        REQUIRE(command.has_value());
        REQUIRE(std::holds_alternative<DeleteCommand>(*command));
        CHECK(std::get<DeleteCommand>(*command).count == 5);
    }

    SECTION("replace")
    {
        auto const command = parseCommand("replace:3:abc");
        REQUIRE(command.has_value());
        REQUIRE(std::holds_alternative<ReplaceCommand>(*command));
        CHECK(std::get<ReplaceCommand>(*command).count == 3);
        CHECK(std::get<ReplaceCommand>(*command).text == "abc");
    }
}

TEST_CASE("parseCommand keeps colons inside text", "[protocol]")
{
    auto const commit = parseCommand("commit:time: 10:30");
    REQUIRE(commit.has_value());
    CHECK(std::get<CommitCommand>(*commit).text == "time: 10:30");

    auto const replace = parseCommand("replace:2:a:b");
    REQUIRE(replace.has_value());
    CHECK(std::get<ReplaceCommand>(*replace).count == 2);
    CHECK(std::get<ReplaceCommand>(*replace).text == "a:b");
}

TEST_CASE("parseCommand accepts empty payloads", "[protocol]")
{
    auto const preview = parseCommand("preedit:");
    REQUIRE(preview.has_value());
    CHECK(std::get<PreviewCommand>(*preview).text.empty());

    auto const replace = parseCommand("replace:4:");
    REQUIRE(replace.has_value());
    CHECK(std::get<ReplaceCommand>(*replace).count == 4);
    CHECK(std::get<ReplaceCommand>(*replace).text.empty());
}

TEST_CASE("parseCommand tolerates whitespace and signs in counts", "[protocol]")
{
    auto const padded = parseCommand("delete: 7 ");
    REQUIRE(padded.has_value());
    CHECK(std::get<DeleteCommand>(*padded).count == 7);

    auto const plus = parseCommand("delete:+2");
    REQUIRE(plus.has_value());
    CHECK(std::get<DeleteCommand>(*plus).count == 2);

    auto const negative = parseCommand("delete:-3");
    REQUIRE(negative.has_value());
    CHECK(std::get<DeleteCommand>(*negative).count == -3);
}

TEST_CASE("parseCommand rejects malformed lines", "[protocol]")
{
    CHECK_FALSE(parseCommand("").has_value());
    CHECK_FALSE(parseCommand("hello").has_value());
    CHECK_FALSE(parseCommand("insert:text").has_value());
    CHECK_FALSE(parseCommand("delete:").has_value());
    CHECK_FALSE(parseCommand("delete:five").has_value());
    CHECK_FALSE(parseCommand("delete:5x").has_value());
    CHECK_FALSE(parseCommand("replace:3").has_value());
    CHECK_FALSE(parseCommand("replace:x:abc").has_value());
    CHECK_FALSE(parseCommand("Commit:upper case tag").has_value());
}

TEST_CASE("formatCommand produces one protocol line per command", "[protocol]")
{
    CHECK(formatCommand(PreviewCommand { "Hel" }) == "preedit:Hel\n");
    CHECK(formatCommand(CommitCommand { "Hello " }) == "commit:Hello \n");
    CHECK(formatCommand(DeleteCommand { 5 }) == "delete:5\n");
    CHECK(formatCommand(ReplaceCommand { 2, "ok" }) == "replace:2:ok\n");
    CHECK(formatCommand(CommitCommand { "two\nlines\r" }) == "commit:two lines \n");
}

TEST_CASE("formatCommand output parses back to the same command", "[protocol]")
{
    auto line = formatCommand(ReplaceCommand { 12, "x: y" });
    line.pop_back();
    auto const parsed = parseCommand(line);
    REQUIRE(parsed.has_value());
    CHECK(std::get<ReplaceCommand>(*parsed).count == 12);
    CHECK(std::get<ReplaceCommand>(*parsed).text == "x: y");
}

TEST_CASE("translateCommand clears the preview before committing", "[protocol]")
{
    auto const batch = translateCommand(CommitCommand { "Hi" });
    REQUIRE(batch.size() == 2);
    CHECK(std::holds_alternative<ClearPreview>(batch[0]));
    REQUIRE(std::holds_alternative<CommitText>(batch[1]));
    CHECK(std::get<CommitText>(batch[1]).text == "Hi");
}

TEST_CASE("translateCommand maps preview, delete and replace", "[protocol]")
{
    auto const preview = translateCommand(PreviewCommand { "He" });
    REQUIRE(preview.size() == 1);
    CHECK(std::get<ShowPreview>(preview[0]).text == "He");

    auto const remove = translateCommand(DeleteCommand { 3 });
    REQUIRE(remove.size() == 1);
    CHECK(std::get<DeleteBeforeCursor>(remove[0]).count == 3);

    auto const replace = translateCommand(ReplaceCommand { 2, "xy" });
    REQUIRE(replace.size() == 2);
    CHECK(std::holds_alternative<ClearPreview>(replace[0]));
    CHECK(std::get<ReplaceBeforeCursor>(replace[1]).count == 2);
    CHECK(std::get<ReplaceBeforeCursor>(replace[1]).text == "xy");
}

TEST_CASE("sanitizeUtf8 replaces invalid sequences", "[protocol]")
{
    CHECK(sanitizeUtf8("plain") == "plain");
    CHECK(sanitizeUtf8("gr\xC3\xBC\xC3\x9F") == "gr\xC3\xBC\xC3\x9F");
    CHECK(sanitizeUtf8("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
    // Truncated three-byte sequence is a single maximal subpart.
    CHECK(sanitizeUtf8("a\xE2\x82" "b") == "a\xEF\xBF\xBD" "b");
    // Overlong encoding of '/'.
    CHECK(sanitizeUtf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
    // UTF-16 surrogate encoded in UTF-8.
    CHECK(sanitizeUtf8("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("utf8Length counts code points", "[protocol]")
{
    CHECK(utf8Length("") == 0);
    CHECK(utf8Length("World") == 5);
    CHECK(utf8Length("gr\xC3\xBC\xC3\x9F") == 4);
    CHECK(utf8Length("\xF0\x9F\x8E\xA4 mic") == 5);
}

TEST_CASE("LineSplitter buffers partial lines", "[protocol]")
{
    auto splitter = LineSplitter {};

    auto lines = splitter.feed("commit:Hel");
    CHECK(lines.empty());
    CHECK(splitter.pendingBytes() == 10);

    lines = splitter.feed("lo\npreedit:");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "commit:Hello");

    lines = splitter.feed("x\n");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "preedit:x");
    CHECK(splitter.pendingBytes() == 0);
}

TEST_CASE("LineSplitter trims lines and skips empty ones", "[protocol]")
{
    auto splitter = LineSplitter {};
    auto const lines = splitter.feed("  delete:2\r\n\n   \ncommit:a b \n");
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "delete:2");
    CHECK(lines[1] == "commit:a b");
}

TEST_CASE("LineSplitter sanitizes invalid UTF-8", "[protocol]")
{
    auto splitter = LineSplitter {};
    auto const lines = splitter.feed("commit:\xFE\n");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "commit:\xEF\xBF\xBD");
}

TEST_CASE("LineSplitter clear discards the pending line", "[protocol]")
{
    auto splitter = LineSplitter {};
    (void) splitter.feed("commit:never finished");
    splitter.clear();
    auto const lines = splitter.feed("delete:1\n");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "delete:1");
}
