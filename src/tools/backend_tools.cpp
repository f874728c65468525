#include "tools/backend_tools.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace bridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ToolResult;

namespace {

ToolResult missing_argument(const std::string& server, const std::string& tool,
                            const std::string& argument) {
    return protocol::failure_result(
        server, tool,
        BridgeError{ErrorCategory::Input, "Argument '" + argument + "' cannot be empty.",
                    "invalid_arguments"},
        0.0);
}

}  // namespace

BackendTools::BackendTools(const session::ServerRegistry& registry, BackendNames names)
    : registry_(registry), names_(std::move(names)) {}

ToolResult BackendTools::list_files(const std::string& path) const {
    return registry_.invoke(names_.filesystem, "list_directory",
                            json{{"path", path.empty() ? "." : path}});
}

ToolResult BackendTools::read_file(const std::string& path) const {
    if (path.empty()) {
        return missing_argument(names_.filesystem, "read_file", "path");
    }
    return registry_.invoke(names_.filesystem, "read_file", json{{"path", path}});
}

ToolResult BackendTools::write_file(const std::string& path, const std::string& content) const {
    if (path.empty()) {
        return missing_argument(names_.filesystem, "write_file", "path");
    }
    return registry_.invoke(names_.filesystem, "write_file",
                            json{{"path", path}, {"content", content}});
}

ToolResult BackendTools::create_directory(const std::string& path) const {
    if (path.empty()) {
        return missing_argument(names_.filesystem, "create_directory", "path");
    }
    return registry_.invoke(names_.filesystem, "create_directory", json{{"path", path}});
}

ToolResult BackendTools::git_init(const std::string& repo_path) const {
    return registry_.invoke(names_.git, "git_init", json{{"repo_path", repo_path}});
}

ToolResult BackendTools::git_add(const std::string& file_path,
                                 const std::string& repo_path) const {
    if (file_path.empty()) {
        return missing_argument(names_.git, "git_add", "file_path");
    }
    return registry_.invoke(names_.git, "git_add",
                            json{{"repo_path", repo_path}, {"files", json::array({file_path})}});
}

ToolResult BackendTools::git_commit(const std::string& message,
                                    const std::string& repo_path) const {
    if (message.empty()) {
        return missing_argument(names_.git, "git_commit", "message");
    }
    return registry_.invoke(names_.git, "git_commit",
                            json{{"repo_path", repo_path}, {"message", message}});
}

ToolResult BackendTools::git_status(const std::string& repo_path) const {
    return registry_.invoke(names_.git, "git_status", json{{"repo_path", repo_path}});
}

ToolResult BackendTools::git_log(const std::string& repo_path, const std::uint32_t limit) const {
    return registry_.invoke(names_.git, "git_log",
                            json{{"repo_path", repo_path}, {"max_count", limit}});
}

ToolResult BackendTools::analyze_repository(const std::string& repo_path,
                                            const std::string& branch,
                                            const std::uint32_t depth) const {
    return registry_.invoke(names_.git_analyzer, "analyze_repository",
                            json{{"repo_path", repo_path}, {"branch", branch}, {"depth", depth}});
}

ToolResult BackendTools::get_code_metrics(const MetricsRequest& request) const {
    if (request.file_path.empty()) {
        return missing_argument(names_.git_analyzer, "get_code_metrics", "file_path");
    }
    return registry_.invoke(
        names_.git_analyzer, "get_code_metrics",
        json{{"file_path", request.file_path}, {"metric_types", request.metric_types}});
}

ToolResult BackendTools::detect_smells(const std::string& repo_path,
                                       const std::string& sensitivity_level) const {
    return registry_.invoke(
        names_.git_analyzer, "detect_smells",
        json{{"repo_path", repo_path}, {"sensitivity_level", sensitivity_level}});
}

ToolResult BackendTools::analyze_contributors(const std::string& repo_path,
                                              const std::string& time_range) const {
    return registry_.invoke(names_.git_analyzer, "analyze_contributors",
                            json{{"repo_path", repo_path}, {"time_range", time_range}});
}

ToolResult BackendTools::get_hotspots(const std::string& repo_path,
                                      const double threshold) const {
    return registry_.invoke(names_.git_analyzer, "get_hotspots",
                            json{{"repo_path", repo_path}, {"threshold", threshold}});
}

ToolResult BackendTools::generate_report(const ReportRequest& request) const {
    if (request.analysis_id.empty()) {
        return missing_argument(names_.git_analyzer, "generate_report", "analysis_id");
    }
    return registry_.invoke(names_.git_analyzer, "generate_report",
                            json{{"analysis_id", request.analysis_id},
                                 {"format", request.format},
                                 {"sections", request.sections}});
}

ToolResult BackendTools::get_weather(const std::string& city) const {
    if (city.empty()) {
        return missing_argument(names_.weather, "get_weather", "city");
    }
    return registry_.invoke(names_.weather, "get_weather", json{{"city", city}});
}

ToolResult BackendTools::get_forecast(const std::string& city, const std::uint32_t days) const {
    if (city.empty()) {
        return missing_argument(names_.weather, "get_forecast", "city");
    }
    return registry_.invoke(names_.weather, "get_forecast", json{{"city", city}, {"days", days}});
}

ToolResult BackendTools::get_weather_alerts(const std::string& city) const {
    if (city.empty()) {
        return missing_argument(names_.weather, "get_weather_alerts", "city");
    }
    return registry_.invoke(names_.weather, "get_weather_alerts", json{{"city", city}});
}

}  // namespace bridge::tools
