#pragma once

#include <filesystem>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace inkbridge::policy {

// Resolves engine-supplied relative paths against a project root.
//
// Rejection is two-phase: any absolute path or ".." component is refused
// lexically, then the deepest existing ancestor of the candidate is
// canonicalized (following symlinks) and must still lie under the canonical
// root. The returned path is that canonical ancestor with the not-yet-existing
// suffix re-attached.
class PathValidator {
public:
    core::errors::Result<std::filesystem::path> validate(
        const std::filesystem::path& project_root,
        const std::string& relative_path) const;

    core::errors::Result<std::filesystem::path> canonical_root(
        const std::filesystem::path& project_root) const;

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    // Project-relative, '/'-separated form of an already validated path.
    static std::string relative_to_root(const std::filesystem::path& root,
                                        const std::filesystem::path& child);
};

}  // namespace inkbridge::policy
