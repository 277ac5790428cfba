#include "policy/path_validator.hpp"

#include <system_error>
#include <vector>

namespace inkbridge::policy {

using core::errors::BridgeError;
using core::errors::ErrorKind;

bool PathValidator::is_within_root(const std::filesystem::path& root,
                                   const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::string PathValidator::relative_to_root(const std::filesystem::path& root,
                                            const std::filesystem::path& child) {
    return child.lexically_relative(root).generic_string();
}

core::errors::Result<std::filesystem::path> PathValidator::canonical_root(
    const std::filesystem::path& project_root) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(project_root, ec) || ec) {
        return BridgeError{ErrorKind::InvalidPath,
                           "Project root is not a directory: " + project_root.string(),
                           "invalid_project_root"};
    }

    const std::filesystem::path root = std::filesystem::canonical(project_root, ec);
    if (ec) {
        return BridgeError{ErrorKind::InvalidPath,
                           "Failed to canonicalize project dir: " + ec.message(),
                           "invalid_project_root"};
    }
    return root;
}

core::errors::Result<std::filesystem::path> PathValidator::validate(
    const std::filesystem::path& project_root,
    const std::string& relative_path) const {
    auto root_result = canonical_root(project_root);
    if (core::errors::is_error(root_result)) {
        return core::errors::get_error(root_result);
    }
    const std::filesystem::path root = core::errors::get_value(root_result);

    const std::filesystem::path input(relative_path);
    if (input.is_absolute() || input.has_root_directory() || input.has_root_name()) {
        return BridgeError{ErrorKind::InvalidPath, "Absolute paths are not allowed",
                           "absolute_path"};
    }

    std::filesystem::path candidate = root;
    for (const auto& component : input) {
        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            return BridgeError{ErrorKind::InvalidPath,
                               "Parent directory (..) is not allowed",
                               "parent_traversal"};
        }
        candidate /= component;
    }

    // Walk up to the deepest entry that exists. symlink_status also sees
    // dangling links, which must not pass as "not yet created".
    std::error_code ec;
    std::filesystem::path existing = candidate;
    std::vector<std::filesystem::path> missing_suffix;
    while (true) {
        const auto status = std::filesystem::symlink_status(existing, ec);
        if (!ec && std::filesystem::exists(status)) {
            break;
        }
        if (existing == root || !existing.has_parent_path() ||
            existing.parent_path() == existing) {
            return BridgeError{ErrorKind::InvalidPath, "Invalid path", "invalid_path"};
        }
        missing_suffix.push_back(existing.filename());
        existing = existing.parent_path();
    }

    const std::filesystem::path canonical_ancestor =
        std::filesystem::canonical(existing, ec);
    if (ec) {
        // Dangling symlink: its target cannot be checked against the root.
        return BridgeError{ErrorKind::PathEscape,
                           "Path escapes project directory",
                           "path_outside_project"};
    }

    if (!is_within_root(root, canonical_ancestor)) {
        return BridgeError{ErrorKind::PathEscape, "Path escapes project directory",
                           "path_outside_project"};
    }

    std::filesystem::path resolved = canonical_ancestor;
    for (auto it = missing_suffix.rbegin(); it != missing_suffix.rend(); ++it) {
        resolved /= *it;
    }
    return resolved;
}

}  // namespace inkbridge::policy
