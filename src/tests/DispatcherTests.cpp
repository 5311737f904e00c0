// SPDX-License-Identifier: Apache-2.0
#include <bridge/Dispatcher.hpp>
#include <bridge/Protocol.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <string>
#include <thread>
#include <vector>

using namespace voicebridge;

namespace
{

/// Text field that applies edits the way an application would and records every call.
class DocumentTarget: public InputTarget
{
  public:
    explicit DocumentTarget(bool surroundingText = true): _capabilities { surroundingText } {}

    void commit(std::string_view text) override
    {
        calls.push_back(std::format("commit:{}", text));
        document += text;
    }

    void showPreview(std::string_view text, bool markAsUnderlined) override
    {
        calls.push_back(std::format("preview:{}", text));
        preview = text;
        underlined = markAsUnderlined;
    }

    void hidePreview() override
    {
        calls.push_back("hide");
        preview.clear();
    }

    void deleteBeforeCursor(int count) override
    {
        calls.push_back(std::format("delete:{}", count));
        auto const n = std::min(static_cast<std::size_t>(count), document.size());
        document.erase(document.size() - n);
    }

    [[nodiscard]] auto capabilities() const -> TargetCapabilities override { return _capabilities; }

    std::string document;
    std::string preview;
    bool underlined = false;
    std::vector<std::string> calls;

  private:
    TargetCapabilities _capabilities;
};

void send(Dispatcher& dispatcher, std::string_view line)
{
    auto command = parseCommand(line);
    REQUIRE(command.has_value());
    dispatcher.submit(translateCommand(std::move(*command)));
}

} // namespace

TEST_CASE("Dispatcher previews and commits an utterance", "[dispatcher]")
{
    auto target = DocumentTarget {};
    auto dispatcher = Dispatcher {};
    dispatcher.attachTarget(target);

    send(dispatcher, "preedit:Hel");
    send(dispatcher, "preedit:Hello");
    send(dispatcher, "preedit:Hello there");
    dispatcher.drain();
    CHECK(target.preview == "Hello there");
    CHECK(target.document.empty());

    send(dispatcher, "commit:Hello there!");
    dispatcher.drain();
    CHECK(target.preview.empty());
    CHECK(target.document == "Hello there!");
}

TEST_CASE("Dispatcher deletes characters before the cursor", "[dispatcher]")
{
    auto target = DocumentTarget {};
    target.document = "Hello World";
    auto dispatcher = Dispatcher {};
    dispatcher.attachTarget(target);

    send(dispatcher, "delete:5");
    dispatcher.drain();
    CHECK(target.document == "Hello ");
}

TEST_CASE("Dispatcher replace deletes then commits", "[dispatcher]")
{
    auto target = DocumentTarget {};
    target.document = "Hello Wrld";
    auto dispatcher = Dispatcher {};
    dispatcher.attachTarget(target);

    send(dispatcher, "preedit:ignored");
    send(dispatcher, "replace:4:World");
    dispatcher.drain();
    CHECK(target.document == "Hello World");
    CHECK(target.preview.empty());
    CHECK(target.calls == std::vector<std::string> { "preview:ignored", "hide", "delete:4", "commit:World" });
}

TEST_CASE("Dispatcher replace with zero count behaves like commit", "[dispatcher]")
{
    auto viaReplace = DocumentTarget {};
    auto viaCommit = DocumentTarget {};
    auto first = Dispatcher {};
    auto second = Dispatcher {};
    first.attachTarget(viaReplace);
    second.attachTarget(viaCommit);

    send(first, "preedit:Ab");
    send(first, "replace:0:Abc");
    send(second, "preedit:Ab");
    send(second, "commit:Abc");
    first.drain();
    second.drain();

    CHECK(viaReplace.calls == viaCommit.calls);
    CHECK(viaReplace.document == viaCommit.document);
}

TEST_CASE("Dispatcher treats empty preview as clearing it", "[dispatcher]")
{
    auto target = DocumentTarget {};
    auto dispatcher = Dispatcher {};
    dispatcher.attachTarget(target);

    send(dispatcher, "preedit:Hi");
    send(dispatcher, "preedit:");
    dispatcher.drain();
    CHECK(target.preview.empty());
    CHECK(target.calls.back() == "hide");
}

TEST_CASE("Dispatcher ignores non-positive counts and empty commits", "[dispatcher]")
{
    auto target = DocumentTarget {};
    target.document = "abc";
    auto dispatcher = Dispatcher {};
    dispatcher.attachTarget(target);

    send(dispatcher, "delete:0");
    send(dispatcher, "delete:-2");
    send(dispatcher, "commit:");
    dispatcher.drain();

    CHECK(target.document == "abc");
    CHECK(target.calls == std::vector<std::string> { "hide" });
}

TEST_CASE("Dispatcher underlines the preview only for basic targets", "[dispatcher]")
{
    auto dispatcher = Dispatcher {};

    auto rich = DocumentTarget { true };
    dispatcher.attachTarget(rich);
    send(dispatcher, "preedit:rich");
    dispatcher.drain();
    CHECK_FALSE(rich.underlined);

    auto terminal = DocumentTarget { false };
    dispatcher.attachTarget(terminal);
    send(dispatcher, "preedit:term");
    dispatcher.drain();
    CHECK(terminal.underlined);
}

TEST_CASE("Dispatcher drops operations while no target is active", "[dispatcher]")
{
    auto target = DocumentTarget {};
    auto dispatcher = Dispatcher {};
    CHECK_FALSE(dispatcher.hasTarget());

    send(dispatcher, "commit:lost");
    CHECK(dispatcher.pendingOperations() == 0);
    CHECK(dispatcher.drain() == 0);

    dispatcher.attachTarget(target);
    send(dispatcher, "commit:kept");
    dispatcher.drain();
    CHECK(target.document == "kept");

    dispatcher.detachTarget(target);
    CHECK_FALSE(dispatcher.hasTarget());
    send(dispatcher, "commit:dropped");
    dispatcher.drain();
    CHECK(target.document == "kept");
}

TEST_CASE("Dispatcher does not deliver commands to a target attached after they arrived", "[dispatcher]")
{
    auto target = DocumentTarget {};
    auto dispatcher = Dispatcher {};

    send(dispatcher, "preedit:early");
    send(dispatcher, "commit:x");
    dispatcher.attachTarget(target);
    dispatcher.drain();

    CHECK(target.document.empty());
    CHECK(target.preview.empty());
    CHECK(target.calls.empty());
}

TEST_CASE("Dispatcher drops queued operations when the target leaves before the drain", "[dispatcher]")
{
    auto target = DocumentTarget {};
    auto dispatcher = Dispatcher {};
    dispatcher.attachTarget(target);

    send(dispatcher, "commit:late");
    REQUIRE(dispatcher.pendingOperations() == 2);
    dispatcher.detachTarget(target);

    CHECK(dispatcher.drain() == 2);
    CHECK(target.calls.empty());
}

TEST_CASE("Dispatcher detach of an inactive target keeps the active one", "[dispatcher]")
{
    auto active = DocumentTarget {};
    auto stale = DocumentTarget {};
    auto dispatcher = Dispatcher {};

    dispatcher.attachTarget(stale);
    dispatcher.attachTarget(active);
    dispatcher.detachTarget(stale);
    REQUIRE(dispatcher.hasTarget());

    send(dispatcher, "commit:x");
    dispatcher.drain();
    CHECK(active.document == "x");
    CHECK(stale.document.empty());
}

TEST_CASE("Dispatcher coalesces wake-up requests until drained", "[dispatcher]")
{
    auto target = DocumentTarget {};
    auto wakeups = 0;
    auto dispatcher = Dispatcher { [&] { ++wakeups; } };
    dispatcher.attachTarget(target);

    send(dispatcher, "preedit:a");
    send(dispatcher, "preedit:ab");
    send(dispatcher, "commit:abc");
    CHECK(wakeups == 1);
    CHECK(dispatcher.pendingOperations() == 4);

    dispatcher.drain();
    send(dispatcher, "delete:1");
    CHECK(wakeups == 2);
}

TEST_CASE("Dispatcher wakes the consumer once a scheduler is installed late", "[dispatcher]")
{
    auto target = DocumentTarget {};
    auto dispatcher = Dispatcher {};
    dispatcher.attachTarget(target);

    send(dispatcher, "commit:a");
    REQUIRE(dispatcher.pendingOperations() == 2);

    auto wakeups = 0;
    dispatcher.setScheduler([&] { ++wakeups; });
    CHECK(wakeups == 1);

    send(dispatcher, "commit:b");
    CHECK(wakeups == 1);

    dispatcher.drain();
    CHECK(target.document == "ab");

    send(dispatcher, "commit:c");
    CHECK(wakeups == 2);
}

TEST_CASE("Dispatcher keeps each producer's order under concurrent submission", "[dispatcher]")
{
    constexpr auto Producers = 4;
    constexpr auto CommandsPerProducer = 200;

    auto target = DocumentTarget {};
    auto dispatcher = Dispatcher {};
    dispatcher.attachTarget(target);

    auto done = std::atomic<int> { 0 };
    auto producers = std::vector<std::thread> {};
    for (auto p = 0; p < Producers; ++p)
    {
        producers.emplace_back([&, p] {
            for (auto i = 0; i < CommandsPerProducer; ++i)
                dispatcher.submit(translateCommand(CommitCommand { std::format("{}.{};", p, i) }));
            ++done;
        });
    }

    // Drain concurrently with the producers, like the consumer context would.
    while (done < Producers)
        dispatcher.drain();
    for (auto& thread: producers)
        thread.join();
    dispatcher.drain();

    auto commits = std::vector<std::string> {};
    for (auto const& call: target.calls)
        if (call.starts_with("commit:"))
            commits.push_back(call.substr(7));
    REQUIRE(commits.size() == Producers * CommandsPerProducer);

    // Every commit batch is "hide" immediately followed by its commit.
    for (auto i = std::size_t { 0 }; i + 1 < target.calls.size(); i += 2)
    {
        CHECK(target.calls[i] == "hide");
        CHECK(target.calls[i + 1].starts_with("commit:"));
    }

    for (auto p = 0; p < Producers; ++p)
    {
        auto expected = 0;
        for (auto const& commit: commits)
        {
            if (commit.starts_with(std::format("{}.", p)))
            {
                CHECK(commit == std::format("{}.{};", p, expected));
                ++expected;
            }
        }
        CHECK(expected == CommandsPerProducer);
    }
}
