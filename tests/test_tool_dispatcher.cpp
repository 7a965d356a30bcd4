// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <archchan/tool_dispatcher.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "test_fakes.h"

using namespace archchan;
using archchan::testing::RecordingRunner;
using archchan::testing::ScriptedModel;

namespace {

const char* kTopCpu = R"({"tool":"shell","command":"ps aux --sort=-%cpu","explanation":"top CPU"})";
const char* kUpgrade = R"({"tool":"shell","command":"sudo pacman -Syu","explanation":"upgrade"})";
const char* kWipe = R"({"tool":"shell","command":"rm -rf /","explanation":"clean up"})";
const char* kSearch = R"({"tool":"search","query":"arch news"})";

const char* kSearchJson = R"([
    {"title": "Arch News", "abstract": "Latest news", "url": "https://archlinux.org/news"}
])";

template <typename T>
const T& as(const DispatchOutcome& outcome) {
    EXPECT_TRUE(std::holds_alternative<T>(outcome)) << "unexpected outcome: " << outcomeText(outcome);
    static const T empty{};
    const T* value = std::get_if<T>(&outcome);
    return value ? *value : empty;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

class ToolDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.silentMode = true;
        config_.modelRetries = 0;
    }

    ToolDispatcher& dispatcher(bool useGate = false) {
        if (!dispatcher_) {
            ConfirmationHandler& handler = useGate ? static_cast<ConfirmationHandler&>(gate_)
                                                   : static_cast<ConfirmationHandler&>(callback_);
            dispatcher_ = std::make_unique<ToolDispatcher>(config_, state_, model_, runner_, handler);
            dispatcher_->setOutputHandler(std::make_unique<SilentConsole>(true));
        }
        return *dispatcher_;
    }

    DispatchOutcome run(const std::string& input) {
        CancellationToken token;
        return run(input, token);
    }

    DispatchOutcome run(const std::string& input, CancellationToken& token) {
        return dispatcher().dispatch(input, token, [this](DispatchStage stage) {
            stages_.push_back(stage);
        });
    }

    AssistantConfig config_;
    ConversationState state_{20, "arch-chan"};
    ScriptedModel model_;
    RecordingRunner runner_;

    bool approve_ = true;
    std::vector<ConfirmationRequest> asked_;
    CallbackConfirmation callback_{[this](const ConfirmationRequest& request) {
        asked_.push_back(request);
        return approve_;
    }};
    ConfirmationGate gate_;

    std::vector<DispatchStage> stages_;
    std::unique_ptr<ToolDispatcher> dispatcher_;
};

// ---- Plain replies ----

TEST_F(ToolDispatcherTest, PlainReplyIsDisplayed) {
    model_.reply("¡Hola! Soy Arch-Chan.");

    auto outcome = run("hola");
    EXPECT_EQ(as<Displayed>(outcome).text, "¡Hola! Soy Arch-Chan.");
    EXPECT_EQ(runner_.callCount(), 0u);

    auto turns = state_.snapshot();
    ASSERT_EQ(turns.size(), 2u);
    EXPECT_EQ(turns[0].role, MessageRole::USER);
    EXPECT_EQ(turns[0].content, "hola");
    EXPECT_EQ(turns[1].role, MessageRole::ASSISTANT);
    EXPECT_EQ(turns[1].content, "¡Hola! Soy Arch-Chan.");

    std::vector<DispatchStage> expected = {
        DispatchStage::AWAITING_MODEL_REPLY, DispatchStage::PARSING, DispatchStage::DONE};
    EXPECT_EQ(stages_, expected);
    EXPECT_EQ(dispatcher().stage(), DispatchStage::IDLE);
}

TEST_F(ToolDispatcherTest, MalformedPayloadIsShownAsText) {
    std::string reply = R"json({"tool":"python","code":"print(1)"})json";
    model_.reply(reply);

    auto outcome = run("run some python");
    EXPECT_EQ(as<Displayed>(outcome).text, reply);
    EXPECT_EQ(runner_.callCount(), 0u);
    EXPECT_EQ(state_.size(), 2u);
}

TEST_F(ToolDispatcherTest, ModelSeesHistoryAndSystemPrompt) {
    model_.reply("first");
    model_.reply("second");
    run("one");
    run("two");

    auto requests = model_.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].context.size(), 1u);
    ASSERT_EQ(requests[1].context.size(), 3u);
    EXPECT_EQ(requests[1].context[1].content, "first");
    EXPECT_EQ(requests[1].context[2].content, "two");
    EXPECT_EQ(requests[1].systemPrompt, dispatcher().systemPrompt());
    EXPECT_EQ(requests[1].modelId, "arch-chan");
}

TEST_F(ToolDispatcherTest, SelectedModelIsAddressed) {
    state_.setModelId("arch-chan-lite");
    model_.reply("ok");
    run("hi");
    EXPECT_EQ(model_.requests()[0].modelId, "arch-chan-lite");
}

TEST_F(ToolDispatcherTest, SystemPrompt) {
    std::string prompt = dispatcher().systemPrompt();
    EXPECT_TRUE(contains(prompt, "Arch-Chan"));
    EXPECT_TRUE(contains(prompt, R"("tool": "shell")"));
    EXPECT_TRUE(contains(prompt, R"("tool": "search")"));
}

TEST_F(ToolDispatcherTest, CustomSystemPrompt) {
    config_.systemPrompt = "Be terse.";
    std::string prompt = dispatcher().systemPrompt();
    EXPECT_EQ(prompt.rfind("Be terse.", 0), 0u);
    EXPECT_TRUE(contains(prompt, R"("tool": "shell")"));
}

// ---- Shell tool ----

TEST_F(ToolDispatcherTest, SafeCommandRuns) {
    model_.reply(kTopCpu);
    runner_.shellResult.stdoutText = "USER PID %CPU\nroot 1 0.0\n";

    auto outcome = run("what is using my CPU?");
    const auto& executed = as<Executed>(outcome);
    EXPECT_EQ(executed.invocation, "ps aux --sort=-%cpu");
    EXPECT_EQ(executed.result.exitCode, 0);
    EXPECT_FALSE(executed.summary.has_value());
    EXPECT_TRUE(contains(executed.displayText, "USER PID %CPU"));
    EXPECT_TRUE(asked_.empty());

    ASSERT_EQ(runner_.invocations().size(), 1u);
    EXPECT_EQ(runner_.invocations()[0], "ps aux --sort=-%cpu");

    auto turns = state_.snapshot();
    ASSERT_EQ(turns.size(), 3u);
    EXPECT_EQ(turns[1].role, MessageRole::ASSISTANT);
    EXPECT_EQ(turns[1].content, kTopCpu);
    EXPECT_EQ(turns[2].role, MessageRole::TOOL);
    EXPECT_TRUE(contains(turns[2].content, "Exit code: 0"));
    EXPECT_TRUE(contains(turns[2].content, "root 1 0.0"));

    std::vector<DispatchStage> expected = {
        DispatchStage::AWAITING_MODEL_REPLY, DispatchStage::PARSING, DispatchStage::VALIDATING,
        DispatchStage::EXECUTING, DispatchStage::DONE};
    EXPECT_EQ(stages_, expected);
}

TEST_F(ToolDispatcherTest, NonZeroExitIsStillExecuted) {
    model_.reply(R"({"tool":"shell","command":"ls /nope","explanation":"x"})");
    runner_.shellResult.exitCode = 2;
    runner_.shellResult.stdoutText.clear();
    runner_.shellResult.stderrText = "ls: cannot access '/nope'";

    auto outcome = run("list /nope");
    const auto& executed = as<Executed>(outcome);
    EXPECT_EQ(executed.result.exitCode, 2);
    EXPECT_TRUE(contains(state_.snapshot().back().content, "cannot access"));
}

TEST_F(ToolDispatcherTest, TimedOutCommandIsReported) {
    model_.reply(R"({"tool":"shell","command":"journalctl -f","explanation":"follow"})");
    runner_.shellResult.timedOut = true;
    runner_.shellResult.exitCode = 143;

    auto outcome = run("follow the journal");
    const auto& executed = as<Executed>(outcome);
    EXPECT_TRUE(executed.result.timedOut);
    EXPECT_TRUE(contains(executed.displayText, "Timed out"));
}

TEST_F(ToolDispatcherTest, BlockedCommandNeverRuns) {
    model_.reply(kWipe);

    auto outcome = run("free some space");
    const auto& rejected = as<Rejected>(outcome);
    EXPECT_EQ(rejected.kind, ErrorKind::COMMAND_BLOCKED);
    EXPECT_FALSE(rejected.reason.empty());
    EXPECT_EQ(runner_.callCount(), 0u);
    EXPECT_TRUE(asked_.empty());

    auto turns = state_.snapshot();
    ASSERT_EQ(turns.size(), 3u);
    EXPECT_EQ(turns[2].role, MessageRole::TOOL);
    EXPECT_TRUE(contains(turns[2].content, "blocked"));
}

TEST_F(ToolDispatcherTest, DisguisedBlockedCommandNeverRuns) {
    const char* payloads[] = {
        R"({"tool":"shell","command":"ls\nrm -rf /*","explanation":"list then clean"})",
        R"({"tool":"shell","command":"/bin/rm -rf /*","explanation":"clean"})",
        R"({"tool":"shell","command":"\\rm -rf ~","explanation":"clean"})",
    };
    for (const char* payload : payloads) {
        model_.reply(payload);
        auto outcome = run("free some space");
        EXPECT_EQ(as<Rejected>(outcome).kind, ErrorKind::COMMAND_BLOCKED) << payload;
    }
    EXPECT_EQ(runner_.callCount(), 0u);
    EXPECT_TRUE(asked_.empty());
}

TEST_F(ToolDispatcherTest, ElevationOnSecondLineAsksFirst) {
    approve_ = false;
    model_.reply(R"({"tool":"shell","command":"ls\nsudo cat /etc/shadow","explanation":"peek"})");

    auto outcome = run("show me the shadow file");
    EXPECT_EQ(as<Rejected>(outcome).kind, ErrorKind::CONFIRMATION_DENIED);
    ASSERT_EQ(asked_.size(), 1u);
    EXPECT_EQ(asked_[0].command, "ls\nsudo cat /etc/shadow");
    EXPECT_EQ(runner_.callCount(), 0u);
}

TEST_F(ToolDispatcherTest, LaunchFailureIsRejected) {
    model_.reply(kTopCpu);
    runner_.launchFails = true;

    auto outcome = run("top cpu");
    EXPECT_EQ(as<Rejected>(outcome).kind, ErrorKind::LAUNCH_ERROR);
    EXPECT_EQ(state_.size(), 3u);
}

// ---- Confirmation ----

TEST_F(ToolDispatcherTest, ApprovedCommandRunsElevated) {
    config_.elevationTool = "pkexec";
    model_.reply(kUpgrade);

    auto outcome = run("update my system");
    const auto& executed = as<Executed>(outcome);
    EXPECT_EQ(executed.invocation, "pkexec pacman -Syu");

    ASSERT_EQ(asked_.size(), 1u);
    EXPECT_EQ(asked_[0].command, "sudo pacman -Syu");
    EXPECT_EQ(asked_[0].explanation, "upgrade");
    EXPECT_FALSE(asked_[0].reason.empty());
    EXPECT_EQ(asked_[0].info.baseCommand, "pacman");

    ASSERT_EQ(runner_.invocations().size(), 1u);
    EXPECT_EQ(runner_.invocations()[0], "pkexec pacman -Syu");

    std::vector<DispatchStage> expected = {
        DispatchStage::AWAITING_MODEL_REPLY, DispatchStage::PARSING, DispatchStage::VALIDATING,
        DispatchStage::AWAITING_CONFIRMATION, DispatchStage::EXECUTING, DispatchStage::DONE};
    EXPECT_EQ(stages_, expected);
}

TEST_F(ToolDispatcherTest, ApprovedCommandWithoutElevationTool) {
    config_.elevationTool = "";
    model_.reply(kUpgrade);

    auto outcome = run("update my system");
    EXPECT_EQ(as<Executed>(outcome).invocation, "sudo pacman -Syu");
}

TEST_F(ToolDispatcherTest, DeniedCommandNeverRuns) {
    approve_ = false;
    model_.reply(kUpgrade);

    auto outcome = run("update my system");
    EXPECT_EQ(as<Rejected>(outcome).kind, ErrorKind::CONFIRMATION_DENIED);
    EXPECT_EQ(runner_.callCount(), 0u);
    EXPECT_EQ(asked_.size(), 1u);

    auto turns = state_.snapshot();
    ASSERT_EQ(turns.size(), 3u);
    EXPECT_TRUE(contains(turns[2].content, "denied"));
}

TEST_F(ToolDispatcherTest, Elevate) {
    config_.elevationTool = "kdesu";
    EXPECT_EQ(dispatcher().elevate("sudo pacman -Syu"), "kdesu -c 'pacman -Syu'");
    EXPECT_EQ(dispatcher().elevate("sudo echo 'hi'"), "kdesu -c 'echo '\\''hi'\\'''");
    EXPECT_EQ(dispatcher().elevate("pacman -Q"), "pacman -Q");
    EXPECT_EQ(dispatcher().elevate("sudoedit /etc/fstab"), "sudoedit /etc/fstab");
}

TEST_F(ToolDispatcherTest, ElevateWithPkexec) {
    config_.elevationTool = "pkexec";
    EXPECT_EQ(dispatcher().elevate("sudo systemctl restart bluetooth"),
              "pkexec systemctl restart bluetooth");
}

TEST_F(ToolDispatcherTest, GateApprovalFromAnotherThread) {
    model_.reply(kUpgrade);
    ToolDispatcher& d = dispatcher(true);
    EXPECT_FALSE(gate_.resolve(true)); // nothing pending yet

    auto future = std::async(std::launch::async, [&]() { return run("update"); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!gate_.pending().has_value() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(gate_.pending().has_value());
    EXPECT_EQ(gate_.pending()->command, "sudo pacman -Syu");
    EXPECT_EQ(d.stage(), DispatchStage::AWAITING_CONFIRMATION);
    EXPECT_TRUE(gate_.resolve(true));

    auto outcome = future.get();
    EXPECT_TRUE(std::holds_alternative<Executed>(outcome));
    EXPECT_FALSE(gate_.pending().has_value());
    EXPECT_EQ(runner_.callCount(), 1u);
}

TEST_F(ToolDispatcherTest, GateCallbackSeesRequest) {
    model_.reply(kUpgrade);
    dispatcher(true);

    std::vector<std::string> seen;
    gate_.setRequestCallback([&](const ConfirmationRequest& request) {
        seen.push_back(request.command);
    });

    auto future = std::async(std::launch::async, [&]() { return run("update"); });
    while (!gate_.pending().has_value()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(gate_.resolve(false));

    EXPECT_EQ(as<Rejected>(future.get()).kind, ErrorKind::CONFIRMATION_DENIED);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "sudo pacman -Syu");
}

// ---- Search tool ----

TEST_F(ToolDispatcherTest, SearchIsSummarized) {
    model_.reply(kSearch);
    model_.reply("Hay una nueva versión del kernel.");
    runner_.searchResult.stdoutText = kSearchJson;

    auto outcome = run("any arch news?");
    const auto& executed = as<Executed>(outcome);
    ASSERT_TRUE(executed.summary.has_value());
    EXPECT_EQ(*executed.summary, "Hay una nueva versión del kernel.");
    EXPECT_EQ(executed.displayText, "Hay una nueva versión del kernel.");
    EXPECT_EQ(runner_.invocations()[0], "arch news");

    // Summary request: history + results + a one-off instruction
    auto requests = model_.requests();
    ASSERT_EQ(requests.size(), 2u);
    const auto& context = requests[1].context;
    ASSERT_GE(context.size(), 2u);
    EXPECT_EQ(context.back().role, MessageRole::USER);
    EXPECT_EQ(context[context.size() - 2].role, MessageRole::TOOL);
    EXPECT_TRUE(contains(context[context.size() - 2].content, "Search results for 'arch news'"));
    EXPECT_TRUE(contains(context[context.size() - 2].content, "1. Arch News"));

    auto turns = state_.snapshot();
    ASSERT_EQ(turns.size(), 4u);
    EXPECT_EQ(turns[2].role, MessageRole::TOOL);
    EXPECT_EQ(turns[3].role, MessageRole::ASSISTANT);
    EXPECT_EQ(turns[3].content, "Hay una nueva versión del kernel.");

    std::vector<DispatchStage> expected = {
        DispatchStage::AWAITING_MODEL_REPLY, DispatchStage::PARSING, DispatchStage::EXECUTING,
        DispatchStage::SUMMARIZING, DispatchStage::DONE};
    EXPECT_EQ(stages_, expected);
}

TEST_F(ToolDispatcherTest, ToolCallInSummaryIsNotChained) {
    model_.reply(kSearch);
    model_.reply(kWipe);
    runner_.searchResult.stdoutText = kSearchJson;

    auto outcome = run("any arch news?");
    const auto& executed = as<Executed>(outcome);
    EXPECT_FALSE(executed.summary.has_value());
    EXPECT_TRUE(contains(executed.displayText, "Arch News"));
    EXPECT_EQ(runner_.callCount(), 1u);
    EXPECT_EQ(state_.size(), 3u);
}

TEST_F(ToolDispatcherTest, SummaryStartingWithBraceIsKept) {
    model_.reply(kSearch);
    model_.reply("{Resumen} Arch Linux lanzó una nueva ISO.");
    runner_.searchResult.stdoutText = kSearchJson;

    auto outcome = run("any arch news?");
    const auto& executed = as<Executed>(outcome);
    ASSERT_TRUE(executed.summary.has_value());
    EXPECT_EQ(*executed.summary, "{Resumen} Arch Linux lanzó una nueva ISO.");
    EXPECT_EQ(executed.displayText, "{Resumen} Arch Linux lanzó una nueva ISO.");
    EXPECT_EQ(state_.size(), 4u);
}

TEST_F(ToolDispatcherTest, SummaryFailureShowsRawResults) {
    model_.reply(kSearch);
    model_.fail();
    runner_.searchResult.stdoutText = kSearchJson;

    auto outcome = run("any arch news?");
    const auto& executed = as<Executed>(outcome);
    EXPECT_FALSE(executed.summary.has_value());
    EXPECT_TRUE(contains(executed.displayText, "https://archlinux.org/news"));
    EXPECT_EQ(state_.size(), 3u);
}

TEST_F(ToolDispatcherTest, EmptySearchResults) {
    model_.reply(kSearch);
    model_.reply("No encontré nada.");

    auto outcome = run("any arch news?");
    EXPECT_TRUE(contains(state_.snapshot()[2].content, "No results found."));
    EXPECT_EQ(*as<Executed>(outcome).summary, "No encontré nada.");
}

TEST_F(ToolDispatcherTest, SearchNeverAsksForConfirmation) {
    model_.reply(R"({"tool":"search","query":"sudo rm -rf /"})");
    model_.reply("summary");

    auto outcome = run("search that");
    EXPECT_TRUE(std::holds_alternative<Executed>(outcome));
    EXPECT_TRUE(asked_.empty());
    EXPECT_EQ(runner_.invocations()[0], "sudo rm -rf /");
}

// ---- Model failures ----

TEST_F(ToolDispatcherTest, ModelUnavailableKeepsOnlyUserTurn) {
    model_.fail(ErrorKind::MODEL_UNAVAILABLE);

    auto outcome = run("hola");
    EXPECT_EQ(as<Rejected>(outcome).kind, ErrorKind::MODEL_UNAVAILABLE);

    auto turns = state_.snapshot();
    ASSERT_EQ(turns.size(), 1u);
    EXPECT_EQ(turns[0].role, MessageRole::USER);
    EXPECT_EQ(dispatcher().stage(), DispatchStage::IDLE);
}

TEST_F(ToolDispatcherTest, UnavailableModelIsRetried) {
    config_.modelRetries = 1;
    model_.fail(ErrorKind::MODEL_UNAVAILABLE);
    model_.reply("ok");

    auto outcome = run("hola");
    EXPECT_EQ(as<Displayed>(outcome).text, "ok");
    EXPECT_EQ(model_.callCount(), 2u);
}

TEST_F(ToolDispatcherTest, ModelTimeoutIsNotRetried) {
    config_.modelRetries = 3;
    model_.fail(ErrorKind::MODEL_TIMEOUT);

    auto outcome = run("hola");
    EXPECT_EQ(as<Rejected>(outcome).kind, ErrorKind::MODEL_TIMEOUT);
    EXPECT_EQ(model_.callCount(), 1u);
}

// ---- Cancellation ----

TEST_F(ToolDispatcherTest, CancelledBeforeStart) {
    CancellationToken token;
    token.cancel();

    auto outcome = run("hola", token);
    EXPECT_TRUE(std::holds_alternative<Cancelled>(outcome));
    EXPECT_EQ(model_.callCount(), 0u);
    EXPECT_EQ(state_.size(), 0u);
    ASSERT_EQ(stages_.size(), 1u);
    EXPECT_EQ(stages_[0], DispatchStage::CANCELLED);
}

TEST_F(ToolDispatcherTest, CancelWhileWaitingForModel) {
    model_.block();
    CancellationToken token;

    std::thread canceller([&]() {
        model_.waitForCalls(1);
        token.cancel();
    });
    auto outcome = run("hola", token);
    canceller.join();

    EXPECT_TRUE(std::holds_alternative<Cancelled>(outcome));
    EXPECT_EQ(state_.size(), 1u);
    EXPECT_EQ(stages_.back(), DispatchStage::CANCELLED);
}

TEST_F(ToolDispatcherTest, CancelWhileExecuting) {
    model_.reply(kTopCpu);
    runner_.blockUntilCancelled = true;
    CancellationToken token;

    std::thread canceller([&]() {
        while (runner_.callCount() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        token.cancel();
    });
    auto outcome = run("top cpu", token);
    canceller.join();

    EXPECT_TRUE(std::holds_alternative<Cancelled>(outcome));
    EXPECT_EQ(state_.size(), 1u);
}

TEST_F(ToolDispatcherTest, CancelWhileAwaitingConfirmation) {
    model_.reply(kUpgrade);
    dispatcher(true);
    CancellationToken token;

    auto future = std::async(std::launch::async, [&]() { return run("update", token); });
    while (!gate_.pending().has_value()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    token.cancel();

    auto outcome = future.get();
    EXPECT_TRUE(std::holds_alternative<Cancelled>(outcome));
    EXPECT_EQ(runner_.callCount(), 0u);
    EXPECT_FALSE(gate_.pending().has_value());
    EXPECT_FALSE(gate_.resolve(true));
    EXPECT_EQ(state_.size(), 1u);
}

TEST_F(ToolDispatcherTest, CancelWhileSummarizing) {
    model_.reply(kSearch);
    model_.block();
    CancellationToken token;

    std::thread canceller([&]() {
        model_.waitForCalls(2);
        token.cancel();
    });
    auto outcome = run("news", token);
    canceller.join();

    EXPECT_TRUE(std::holds_alternative<Cancelled>(outcome));
    EXPECT_EQ(runner_.callCount(), 1u);
    EXPECT_EQ(state_.size(), 1u);
}
