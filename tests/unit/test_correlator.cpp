#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/interaction_log.hpp"
#include "rpc/correlator.hpp"
#include "rpc/server_handle.hpp"
#include "fixture_support.hpp"

namespace {

using bridge::core::errors::ErrorCategory;
using bridge::core::errors::get_error;
using bridge::core::errors::get_value;
using bridge::core::errors::is_error;
using bridge::core::logging::InteractionLog;
using bridge::rpc::Correlator;
using bridge::rpc::HandleState;
using nlohmann::json;
using std::chrono::milliseconds;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_correlator_" + bridge::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<json> read_entries(const std::filesystem::path& file_path) {
    std::vector<json> entries;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        entries.push_back(json::parse(line));
    }
    return entries;
}

json tool(const std::string& name, json arguments = json::object()) {
    return json{{"name", name}, {"arguments", std::move(arguments)}};
}

TEST(CorrelatorTest, CallOnUninitializedHandleIsNotReady) {
    auto handle = fixture::spawn("echo");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    auto result = correlator.call(*handle, "tools/call", tool("echo"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Lifecycle);
    EXPECT_EQ(get_error(result).code, "not_ready");
}

TEST(CorrelatorTest, ReturnsMatchingResult) {
    auto handle = fixture::ready("echo");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    auto result = correlator.call(*handle, "tools/call", tool("list_directory", {{"path", "."}}));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("echo").at("name"), "list_directory");
    EXPECT_EQ(get_value(result).at("echo").at("arguments").at("path"), ".");
}

TEST(CorrelatorTest, ErrorPayloadBecomesRemoteError) {
    auto handle = fixture::ready("echo");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    auto result = correlator.call(*handle, "tools/call", tool("fail"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Remote);
    EXPECT_EQ(get_error(result).code, "remote_error");
    EXPECT_EQ(get_error(result).rpc_code, -32000);
    EXPECT_EQ(handle->state(), HandleState::Ready);
}

TEST(CorrelatorTest, SilentBackendTimesOutWithinBudget) {
    auto handle = fixture::ready("silent");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    const auto started = std::chrono::steady_clock::now();
    auto result = correlator.call(*handle, "tools/call", tool("read_file", {{"path", "x"}}),
                                  milliseconds(100));
    const auto waited = std::chrono::steady_clock::now() - started;
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Timeout);
    EXPECT_EQ(get_error(result).code, "timeout");
    EXPECT_GE(waited, milliseconds(100));
    EXPECT_LT(waited, milliseconds(1500));
    // A timeout does not kill the backend.
    EXPECT_EQ(handle->state(), HandleState::Ready);
}

TEST(CorrelatorTest, LateResponseIsDiscardedById) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "interactions.jsonl";
    InteractionLog log(log_path);

    auto handle = fixture::ready("late");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator(&log);
    auto first = correlator.call(*handle, "tools/call", tool("first", {{"delay_ms", 300}}),
                                 milliseconds(100));
    ASSERT_TRUE(is_error(first));
    EXPECT_EQ(get_error(first).code, "timeout");

    auto second = correlator.call(*handle, "tools/call", tool("second", {{"delay_ms", 0}}),
                                  milliseconds(3000));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).at("echo").at("name"), "second");

    bool saw_timeout = false;
    bool saw_discard = false;
    for (const auto& entry : read_entries(log_path)) {
        if (entry.at("action") == "timeout") {
            saw_timeout = true;
        }
        if (entry.at("action") == "discard") {
            saw_discard = true;
            EXPECT_EQ(entry.at("payload").at("result").at("echo").at("name"), "first");
        }
    }
    EXPECT_TRUE(saw_timeout);
    EXPECT_TRUE(saw_discard);
}

TEST(CorrelatorTest, SkipsNotificationsAndStrayResponses) {
    auto handle = fixture::ready("noisy");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    for (int i = 0; i < 3; ++i) {
        auto result = correlator.call(*handle, "tools/call", tool("echo"));
        ASSERT_FALSE(is_error(result));
        EXPECT_EQ(get_value(result).at("echo").at("name"), "echo");
    }
}

TEST(CorrelatorTest, AnswersServerRequestsWithMethodNotFound) {
    auto handle = fixture::ready("echo");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    auto result = correlator.call(*handle, "tools/call", tool("ask"));
    ASSERT_FALSE(is_error(result));
    const auto& answer = get_value(result).at("client_answer");
    EXPECT_EQ(answer.at("id"), "srv-1");
    EXPECT_EQ(answer.at("error").at("code"), -32601);
}

TEST(CorrelatorTest, CrashMarksHandleDead) {
    auto handle = fixture::ready("crash");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    auto result = correlator.call(*handle, "tools/call", tool("read_file"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Transport);
    EXPECT_EQ(get_error(result).code, "end_of_stream");
    EXPECT_EQ(handle->state(), HandleState::Dead);

    auto again = correlator.call(*handle, "tools/call", tool("read_file"));
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "server_unavailable");
}

TEST(CorrelatorTest, GarbageLineMarksHandleDead) {
    auto handle = fixture::ready("garbage");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    auto result = correlator.call(*handle, "tools/call", tool("read_file"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "parse_error");
    EXPECT_EQ(handle->state(), HandleState::Dead);
}

TEST(CorrelatorTest, SecondCallerOnSameHandleGetsBusy) {
    auto handle = fixture::ready("echo");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    auto slow = std::async(std::launch::async, [&]() {
        return correlator.call(*handle, "tools/call", tool("sleep", {{"ms", 600}}),
                               milliseconds(5000));
    });
    std::this_thread::sleep_for(milliseconds(100));

    auto blocked = correlator.call(*handle, "tools/call", tool("echo"), milliseconds(100));
    ASSERT_TRUE(is_error(blocked));
    EXPECT_EQ(get_error(blocked).category, ErrorCategory::Busy);
    EXPECT_EQ(get_error(blocked).code, "busy");

    auto slow_result = slow.get();
    ASSERT_FALSE(is_error(slow_result));
    EXPECT_EQ(get_value(slow_result).at("slept_ms"), 600);

    // The slot frees up once the first call is done.
    auto after = correlator.call(*handle, "tools/call", tool("echo"), milliseconds(3000));
    EXPECT_FALSE(is_error(after));
}

TEST(CorrelatorTest, WaitingCallerProceedsWhenBudgetAllows) {
    auto handle = fixture::ready("echo");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    auto slow = std::async(std::launch::async, [&]() {
        return correlator.call(*handle, "tools/call", tool("sleep", {{"ms", 200}}),
                               milliseconds(5000));
    });
    std::this_thread::sleep_for(milliseconds(50));

    auto waited = correlator.call(*handle, "tools/call", tool("echo"), milliseconds(5000));
    ASSERT_FALSE(is_error(waited));
    EXPECT_EQ(get_value(waited).at("echo").at("name"), "echo");
    EXPECT_FALSE(is_error(slow.get()));
}

TEST(CorrelatorTest, DifferentHandlesRunConcurrently) {
    auto first = fixture::ready("echo", "first");
    auto second = fixture::ready("echo", "second");
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    fixture::HandleGuard first_guard(first);
    fixture::HandleGuard second_guard(second);

    const Correlator correlator;
    const auto started = std::chrono::steady_clock::now();
    auto a = std::async(std::launch::async, [&]() {
        return correlator.call(*first, "tools/call", tool("sleep", {{"ms", 500}}));
    });
    auto b = std::async(std::launch::async, [&]() {
        return correlator.call(*second, "tools/call", tool("sleep", {{"ms", 500}}));
    });
    EXPECT_FALSE(is_error(a.get()));
    EXPECT_FALSE(is_error(b.get()));
    EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(950));
}

TEST(CorrelatorTest, NotifyRequiresUsableHandle) {
    auto handle = fixture::spawn("echo");
    ASSERT_NE(handle, nullptr);
    fixture::HandleGuard guard(handle);

    const Correlator correlator;
    auto sent = correlator.notify(*handle, "notifications/initialized", json::object());
    ASSERT_TRUE(is_error(sent));
    EXPECT_EQ(get_error(sent).code, "not_ready");
}

}  // namespace
