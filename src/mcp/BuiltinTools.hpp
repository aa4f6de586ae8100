#pragma once

#include "mcp/ToolRegistry.hpp"
#include <optional>
#include <string>

namespace gitmcp {
namespace mcp {

struct BuiltinToolSettings {
    // When set, working directories must resolve inside this directory and
    // relative paths are taken relative to it
    std::optional<std::string> gitBaseDir;
};

/**
 * Register git_set_working_dir, git_clear_working_dir, git_working_dir
 * and echo_message
 */
void registerBuiltinTools(ToolRegistry& registry, const BuiltinToolSettings& settings = {});

/**
 * Resolve and validate a requested working directory.
 * Throws core::McpError (ValidationError / Forbidden / NotFound).
 */
std::string resolveWorkingDirectory(const std::string& requested,
                                    const BuiltinToolSettings& settings,
                                    bool validateGitRepo);

} // namespace mcp
} // namespace gitmcp
