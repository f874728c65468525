#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/logging/interaction_log.hpp"

namespace {

using bridge::core::logging::InteractionLog;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_interaction_log_" + bridge::core::config::generate_session_id());
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

std::vector<std::string> read_lines(const std::filesystem::path& file_path) {
    std::vector<std::string> lines;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

TEST(InteractionLogTest, AppendsOneJsonObjectPerEntry) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "logs" / "interactions.jsonl";
    InteractionLog log(log_path);
    ASSERT_TRUE(log.enabled());

    log.record("filesystem", "send", json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"}});
    log.record("filesystem", "receive", json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}});

    const auto lines = read_lines(log_path);
    ASSERT_EQ(lines.size(), 2u);

    const json first = json::parse(lines[0]);
    EXPECT_EQ(first.at("server"), "filesystem");
    EXPECT_EQ(first.at("action"), "send");
    EXPECT_EQ(first.at("payload").at("method"), "tools/call");
    EXPECT_TRUE(first.at("ts_unix_ms").is_number_integer());
    const std::string timestamp = first.at("timestamp").get<std::string>();
    EXPECT_EQ(timestamp.back(), 'Z');
    EXPECT_NE(timestamp.find('T'), std::string::npos);

    EXPECT_EQ(json::parse(lines[1]).at("action"), "receive");
    EXPECT_EQ(log.dropped_entries(), 0u);
}

TEST(InteractionLogTest, DisabledLogWritesNothing) {
    InteractionLog log;
    EXPECT_FALSE(log.enabled());
    log.record("git", "send", json::object());
    EXPECT_EQ(log.dropped_entries(), 0u);
}

TEST(InteractionLogTest, ReplacesInvalidUtf8InsteadOfThrowing) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "interactions.jsonl";
    InteractionLog log(log_path);

    log.record("weather", "receive", json{{"raw", std::string("bad \xff byte")}});
    const auto lines = read_lines(log_path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_FALSE(json::parse(lines[0], nullptr, false).is_discarded());
}

TEST(InteractionLogTest, UnwritablePathIsCountedNotReturned) {
    TempWorkspace workspace;
    // A directory where the log file should be.
    const auto log_path = workspace.root() / "taken";
    std::filesystem::create_directories(log_path);
    InteractionLog log(log_path);

    log.record("git", "send", json::object());
    log.record("git", "send", json::object());
    EXPECT_EQ(log.dropped_entries(), 2u);
}

}  // namespace
