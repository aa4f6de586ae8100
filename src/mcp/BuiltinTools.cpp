#include "mcp/BuiltinTools.hpp"
#include "core/McpError.hpp"
#include "server/Logger.hpp"
#include <filesystem>
#include <system_error>

namespace gitmcp {
namespace mcp {

namespace fs = std::filesystem;
using core::JsonRpcErrorCode;
using core::McpError;

namespace {

constexpr int kMaxEchoRepeat = 10;

std::string requireString(const json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
        throw McpError(JsonRpcErrorCode::ValidationError, "'" + key + "' must be a string");
    }
    std::string value = args[key].get<std::string>();
    if (value.empty()) {
        throw McpError(JsonRpcErrorCode::ValidationError, "'" + key + "' must not be empty");
    }
    return value;
}

bool optionalBool(const json& args, const std::string& key, bool fallback) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return fallback;
    }
    if (!args[key].is_boolean()) {
        throw McpError(JsonRpcErrorCode::ValidationError, "'" + key + "' must be a boolean");
    }
    return args[key].get<bool>();
}

// True if child equals base or lies below it (both already canonical)
bool isWithin(fs::path base, const fs::path& child) {
    if (!base.has_filename() && base.has_parent_path() && base != base.root_path()) {
        base = base.parent_path();
    }
    fs::path rel = child.lexically_relative(base);
    return !rel.empty() && *rel.begin() != "..";
}

ToolDefinition setWorkingDirTool(const BuiltinToolSettings& settings) {
    ToolDefinition def;
    def.name = "git_set_working_dir";
    def.title = "Git Set Working Directory";
    def.description = "Set the session working directory used as the default path for git operations.";
    def.inputSchema = {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"}, {"description", "Path to the git repository"}}},
            {"validateGitRepo", {{"type", "boolean"}, {"default", true},
                                 {"description", "Require the directory to contain .git"}}}
        }},
        {"required", {"path"}}
    };
    def.execute = [settings](const json& args, ToolContext& ctx) {
        std::string requested = requireString(args, "path");
        bool validate = optionalBool(args, "validateGitRepo", true);

        std::string resolved = resolveWorkingDirectory(requested, settings, validate);
        ctx.workspace.setWorkingDirectory(resolved);
        LOG_INFO_CTX("Working directory set", ctx.request.withField("path", resolved));

        return json{
            {"success", true},
            {"path", resolved},
            {"message", "Working directory set to: " + resolved}
        };
    };
    return def;
}

ToolDefinition clearWorkingDirTool() {
    ToolDefinition def;
    def.name = "git_clear_working_dir";
    def.title = "Git Clear Working Directory";
    def.description = "Clear the session working directory.";
    def.inputSchema = {{"type", "object"}, {"properties", json::object()}};
    def.execute = [](const json&, ToolContext& ctx) {
        json out = {{"success", true}};
        auto previous = ctx.workspace.workingDirectory();
        if (previous) {
            out["previousPath"] = *previous;
            out["message"] = "Working directory cleared (was: " + *previous + ")";
        } else {
            out["message"] = "No working directory was set";
        }
        ctx.workspace.clearWorkingDirectory();
        return out;
    };
    return def;
}

ToolDefinition workingDirTool() {
    ToolDefinition def;
    def.name = "git_working_dir";
    def.title = "Git Working Directory";
    def.description = "Report the session working directory and the identity the request runs under.";
    def.inputSchema = {{"type", "object"}, {"properties", json::object()}};
    def.execute = [](const json&, ToolContext& ctx) {
        const auto& dir = ctx.workspace.workingDirectory();
        const auto& req = ctx.request;
        return json{
            {"workingDirectory", dir ? json(*dir) : json(nullptr)},
            {"sessionId", req.sessionId() ? json(*req.sessionId()) : json(nullptr)},
            {"tenantId", req.tenantId() ? json(*req.tenantId()) : json(nullptr)},
            {"clientId", req.clientId() ? json(*req.clientId()) : json(nullptr)}
        };
    };
    return def;
}

ToolDefinition echoTool() {
    ToolDefinition def;
    def.name = "echo_message";
    def.title = "Echo Message";
    def.description = "Echo a message back, optionally repeated. Used for connectivity checks.";
    def.inputSchema = {
        {"type", "object"},
        {"properties", {
            {"message", {{"type", "string"}}},
            {"repeat", {{"type", "integer"}, {"minimum", 1}, {"maximum", kMaxEchoRepeat}, {"default", 1}}}
        }},
        {"required", {"message"}}
    };
    def.execute = [](const json& args, ToolContext& ctx) {
        std::string message = requireString(args, "message");
        int repeat = 1;
        if (args.contains("repeat") && !args["repeat"].is_null()) {
            if (!args["repeat"].is_number_integer()) {
                throw McpError(JsonRpcErrorCode::ValidationError, "'repeat' must be an integer");
            }
            repeat = args["repeat"].get<int>();
            if (repeat < 1 || repeat > kMaxEchoRepeat) {
                throw McpError(JsonRpcErrorCode::ValidationError,
                               "'repeat' must be between 1 and " + std::to_string(kMaxEchoRepeat));
            }
        }

        std::string repeated;
        for (int i = 0; i < repeat; ++i) {
            if (i > 0) repeated += ' ';
            repeated += message;
        }
        return json{
            {"originalMessage", message},
            {"repeatedMessage", repeated},
            {"repeatCount", repeat},
            {"timestamp", ctx.request.timestamp()}
        };
    };
    return def;
}

} // anonymous namespace

std::string resolveWorkingDirectory(const std::string& requested,
                                    const BuiltinToolSettings& settings,
                                    bool validateGitRepo) {
    fs::path path(requested);
    std::error_code ec;

    fs::path base;
    if (settings.gitBaseDir) {
        base = fs::weakly_canonical(fs::path(*settings.gitBaseDir), ec);
        if (ec) {
            throw McpError(JsonRpcErrorCode::ConfigurationError, "GIT_BASE_DIR cannot be resolved");
        }
        if (path.is_relative()) {
            path = base / path;
        }
    }

    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        throw McpError(JsonRpcErrorCode::ValidationError, "Invalid path: " + requested);
    }

    if (settings.gitBaseDir && !isWithin(base, resolved)) {
        throw McpError(JsonRpcErrorCode::Forbidden,
                       "Path is outside the allowed base directory: " + requested);
    }

    if (!fs::is_directory(resolved, ec)) {
        throw McpError(JsonRpcErrorCode::NotFound,
                       "Directory does not exist: " + resolved.string());
    }

    if (validateGitRepo && !fs::exists(resolved / ".git", ec)) {
        throw McpError(JsonRpcErrorCode::ValidationError,
                       "Not a git repository: " + resolved.string());
    }

    return resolved.string();
}

void registerBuiltinTools(ToolRegistry& registry, const BuiltinToolSettings& settings) {
    registry.registerTool(setWorkingDirTool(settings));
    registry.registerTool(clearWorkingDirTool());
    registry.registerTool(workingDirTool());
    registry.registerTool(echoTool());
}

} // namespace mcp
} // namespace gitmcp
