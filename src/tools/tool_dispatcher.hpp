#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "policy/tool_permissions.hpp"
#include "project/knowledge_search.hpp"
#include "protocol/chat_contract.hpp"
#include "tools/tool_host.hpp"

namespace inkbridge::tools {

// Per-request facts the dispatcher needs; fixed for the whole exchange.
struct ToolContext {
    std::filesystem::path project_root;
    protocol::SessionMode mode = protocol::SessionMode::Discussion;
    bool allow_write = false;
    std::optional<std::string> active_chapter;
};

// Maps an engine tool call (name + untrusted argument object) onto ToolHost
// and the project collaborators. Returns the text sent back to the engine.
class ToolDispatcher {
public:
    // knowledge_search may be null; rag_search then fails.
    explicit ToolDispatcher(const project::KnowledgeSearch* knowledge_search = nullptr,
                            policy::ToolPermissions permissions = policy::ToolPermissions{});

    core::errors::Result<std::string> execute(const ToolContext& context,
                                              const std::string& tool_name,
                                              const nlohmann::json& args) const;

private:
    core::errors::Result<std::string> run_read(const ToolContext& context,
                                               const nlohmann::json& args) const;
    core::errors::Result<std::string> run_write(const ToolContext& context,
                                                const nlohmann::json& args) const;
    core::errors::Result<std::string> run_append(const ToolContext& context,
                                                 const nlohmann::json& args) const;
    core::errors::Result<std::string> run_list(const ToolContext& context,
                                               const nlohmann::json& args) const;
    core::errors::Result<std::string> run_search(const ToolContext& context,
                                                 const nlohmann::json& args) const;
    core::errors::Result<std::string> run_chapter_info(const ToolContext& context) const;
    core::errors::Result<std::string> run_save_summary(const ToolContext& context,
                                                       const nlohmann::json& args) const;
    core::errors::Result<std::string> run_rag_search(const ToolContext& context,
                                                     const nlohmann::json& args) const;

    ToolHost host_;
    const project::KnowledgeSearch* knowledge_search_;
    policy::ToolPermissions permissions_;
};

}  // namespace inkbridge::tools
