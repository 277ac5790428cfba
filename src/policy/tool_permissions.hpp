#pragma once

#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "protocol/chat_contract.hpp"

namespace inkbridge::policy {

struct ToolPolicy {
    // Tools that modify the project; gated by session mode and confirmation.
    std::vector<std::string> mutating_tools = {
        "write",
        "append",
        "save_summary"};
};

class ToolPermissions {
public:
    explicit ToolPermissions(ToolPolicy tool_policy = {});

    // Discussion mode never mutates. Continue mode mutates only once the user
    // has confirmed the request (allow_write). Read-only tools always pass.
    core::errors::Status check(protocol::SessionMode mode,
                               bool allow_write,
                               const std::string& tool_name) const;

    bool is_mutating(const std::string& tool_name) const;

private:
    ToolPolicy tool_policy_;
};

}  // namespace inkbridge::policy
