#include "mcp/ToolRegistry.hpp"
#include <algorithm>
#include <stdexcept>

namespace gitmcp {
namespace mcp {

json ToolDefinition::toJson() const {
    json out = {
        {"name", name},
        {"description", description},
        {"inputSchema", inputSchema.is_null() ? json{{"type", "object"}} : inputSchema}
    };
    if (!title.empty()) {
        out["title"] = title;
    }
    return out;
}

void ToolRegistry::registerTool(ToolDefinition definition) {
    if (definition.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!definition.execute) {
        throw std::invalid_argument("Tool '" + definition.name + "' has no implementation");
    }
    std::string name = definition.name;
    m_tools[name] = std::make_shared<const ToolDefinition>(std::move(definition));
}

void ToolRegistry::unregisterTool(const std::string& name) {
    m_tools.erase(name);
}

ToolDefinitionPtr ToolRegistry::getTool(const std::string& name) const {
    auto it = m_tools.find(name);
    if (it != m_tools.end()) {
        return it->second;
    }
    return nullptr;
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return m_tools.find(name) != m_tools.end();
}

std::vector<std::string> ToolRegistry::getToolNames() const {
    std::vector<std::string> names;
    names.reserve(m_tools.size());
    for (const auto& [name, def] : m_tools) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

json ToolRegistry::listTools() const {
    json tools = json::array();
    for (const auto& name : getToolNames()) {
        tools.push_back(m_tools.at(name)->toJson());
    }
    return tools;
}

void ToolRegistry::clear() {
    m_tools.clear();
}

} // namespace mcp
} // namespace gitmcp
