#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"
#include "session/server_registry.hpp"

namespace bridge::tools {

// Registry names of the four stock backends.
struct BackendNames {
    std::string filesystem = "filesystem";
    std::string git = "git";
    std::string git_analyzer = "git_analyzer";
    std::string weather = "weather";
};

struct MetricsRequest {
    std::string file_path;
    std::vector<std::string> metric_types = {"lines_of_code", "cyclomatic_complexity",
                                             "maintainability_index"};
};

struct ReportRequest {
    std::string analysis_id;
    std::string format = "json";
    std::vector<std::string> sections = {"repository_info", "code_metrics", "code_smells",
                                         "contributors", "hotspots"};
};

// Argument shaping over ServerRegistry::invoke. Holds no state of its own.
class BackendTools {
public:
    explicit BackendTools(const session::ServerRegistry& registry, BackendNames names = {});

    // filesystem
    protocol::ToolResult list_files(const std::string& path = ".") const;
    protocol::ToolResult read_file(const std::string& path) const;
    protocol::ToolResult write_file(const std::string& path, const std::string& content) const;
    protocol::ToolResult create_directory(const std::string& path) const;

    // git
    protocol::ToolResult git_init(const std::string& repo_path = ".") const;
    protocol::ToolResult git_add(const std::string& file_path,
                                 const std::string& repo_path = ".") const;
    protocol::ToolResult git_commit(const std::string& message,
                                    const std::string& repo_path = ".") const;
    protocol::ToolResult git_status(const std::string& repo_path = ".") const;
    protocol::ToolResult git_log(const std::string& repo_path = ".",
                                 std::uint32_t limit = 10) const;

    // git_analyzer
    protocol::ToolResult analyze_repository(const std::string& repo_path = ".",
                                            const std::string& branch = "main",
                                            std::uint32_t depth = 100) const;
    protocol::ToolResult get_code_metrics(const MetricsRequest& request) const;
    protocol::ToolResult detect_smells(const std::string& repo_path = ".",
                                       const std::string& sensitivity_level = "medium") const;
    protocol::ToolResult analyze_contributors(const std::string& repo_path = ".",
                                              const std::string& time_range = "1 year") const;
    protocol::ToolResult get_hotspots(const std::string& repo_path = ".",
                                      double threshold = 0.8) const;
    protocol::ToolResult generate_report(const ReportRequest& request) const;

    // weather
    protocol::ToolResult get_weather(const std::string& city) const;
    protocol::ToolResult get_forecast(const std::string& city, std::uint32_t days = 3) const;
    protocol::ToolResult get_weather_alerts(const std::string& city) const;

    const BackendNames& names() const { return names_; }

private:
    const session::ServerRegistry& registry_;
    BackendNames names_;
};

}  // namespace bridge::tools
