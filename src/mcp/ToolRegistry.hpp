#pragma once

#include "core/RequestContext.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gitmcp {
namespace mcp {

using json = nlohmann::json;

/**
 * Per-handler state visible to tools. In stateful mode there is one per
 * session, so the working directory set by one client never leaks to another.
 */
class SessionWorkspace {
public:
    const std::optional<std::string>& workingDirectory() const { return m_workingDirectory; }
    void setWorkingDirectory(const std::string& path) { m_workingDirectory = path; }
    void clearWorkingDirectory() { m_workingDirectory.reset(); }

private:
    std::optional<std::string> m_workingDirectory;
};

struct ToolContext {
    const core::RequestContext& request;
    SessionWorkspace& workspace;
};

// Returns the tool's structured result; throw core::McpError to report a tool failure
using ToolFunction = std::function<json(const json& args, ToolContext& ctx)>;

struct ToolDefinition {
    std::string name;
    std::string title;
    std::string description;
    json inputSchema;
    ToolFunction execute;

    // Entry for a tools/list response
    json toJson() const;
};

using ToolDefinitionPtr = std::shared_ptr<const ToolDefinition>;

/**
 * Registry of callable tools, shared read-only by every protocol handler
 * once startup registration is done.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // Overwrites a tool with the same name
    void registerTool(ToolDefinition definition);
    void unregisterTool(const std::string& name);

    // nullptr if not found
    ToolDefinitionPtr getTool(const std::string& name) const;
    bool hasTool(const std::string& name) const;

    // Sorted by name
    std::vector<std::string> getToolNames() const;
    size_t size() const { return m_tools.size(); }

    json listTools() const;

    void clear();

private:
    std::unordered_map<std::string, ToolDefinitionPtr> m_tools;
};

} // namespace mcp
} // namespace gitmcp
