#include "policy/tool_permissions.hpp"

#include <algorithm>
#include <utility>

namespace inkbridge::policy {

using core::errors::BridgeError;
using core::errors::ErrorKind;

ToolPermissions::ToolPermissions(ToolPolicy tool_policy)
    : tool_policy_(std::move(tool_policy)) {}

bool ToolPermissions::is_mutating(const std::string& tool_name) const {
    return std::find(tool_policy_.mutating_tools.begin(),
                     tool_policy_.mutating_tools.end(),
                     tool_name) != tool_policy_.mutating_tools.end();
}

core::errors::Status ToolPermissions::check(const protocol::SessionMode mode,
                                            const bool allow_write,
                                            const std::string& tool_name) const {
    if (!is_mutating(tool_name)) {
        return core::errors::ok();
    }
    if (mode == protocol::SessionMode::Discussion) {
        return BridgeError{ErrorKind::ToolNotAllowed,
                           "Tool not allowed in Discussion mode",
                           "tool_not_allowed_in_discussion",
                           "Switch to Continue mode to let the model edit files."};
    }
    if (!allow_write) {
        return BridgeError{ErrorKind::ToolNotAllowed,
                           "Tool not allowed before user confirmation",
                           "tool_not_confirmed",
                           "Confirm the request to allow file changes."};
    }
    return core::errors::ok();
}

}  // namespace inkbridge::policy
