#include <gtest/gtest.h>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"

using namespace bridge::core::errors;

// A dummy function to simulate a backend call failing
Result<std::string> simulate_call(bool should_fail) {
    if (should_fail) {
        return BridgeError{ErrorCategory::Remote, "File not found", "remote_error", "", -32602};
    }
    return std::string("file contents here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_call(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "file contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_call(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Remote);
    EXPECT_EQ(error.message, "File not found");
    EXPECT_EQ(error.rpc_code, -32602);
}

TEST(ErrorModelTest, StatusOkCarriesNoError) {
    const Status status = ok();
    EXPECT_FALSE(is_error(status));
}

TEST(ErrorModelTest, DefaultCodeIsUnknown) {
    const BridgeError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
    EXPECT_TRUE(error.hint.empty());
    EXPECT_EQ(to_string(error.category), "internal");
}

TEST(ToolResultTest, SuccessSerializesData) {
    const auto result = bridge::protocol::success_result("git", "git_status",
                                                         nlohmann::json{{"files", nlohmann::json::array()}}, 1.5);
    const auto out = result.to_json();
    EXPECT_TRUE(out.at("success").get<bool>());
    EXPECT_TRUE(out.at("data").at("files").is_array());
    EXPECT_FALSE(out.contains("error"));
}

TEST(ToolResultTest, RemoteFailureKeepsRpcCode) {
    const auto result = bridge::protocol::failure_result("git", "git_add", get_error(simulate_call(true)), 2.0);
    const auto out = result.to_json();
    EXPECT_FALSE(out.at("success").get<bool>());
    EXPECT_EQ(out.at("error").at("reason"), "remote_error");
    EXPECT_EQ(out.at("error").at("rpc_code"), -32602);
    EXPECT_FALSE(out.contains("data"));
}

TEST(ToolResultTest, MapsCategoriesToReasons) {
    using bridge::protocol::reason_for;
    EXPECT_EQ(reason_for(BridgeError{ErrorCategory::Timeout, "t", "timeout"}), "timeout");
    EXPECT_EQ(reason_for(BridgeError{ErrorCategory::Busy, "b", "busy"}), "busy");
    EXPECT_EQ(reason_for(BridgeError{ErrorCategory::Transport, "x", "end_of_stream"}), "transport");
    EXPECT_EQ(reason_for(BridgeError{ErrorCategory::Registry, "x", "unknown_server"}), "unknown_server");
    EXPECT_EQ(reason_for(BridgeError{ErrorCategory::Registry, "x", "duplicate_name"}), "duplicate_name");
    EXPECT_EQ(reason_for(BridgeError{ErrorCategory::Lifecycle, "x", "not_ready"}), "lifecycle");
    EXPECT_EQ(reason_for(BridgeError{ErrorCategory::Input, "x", "invalid_arguments"}), "invalid_input");
}
