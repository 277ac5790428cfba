#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace inkbridge::storage {

using BackupPath = std::optional<std::filesystem::path>;

struct MutationHooks {
    // Called with the path holding the new bytes (the temp file for a write,
    // the target for an append) before the mutation is committed. An error
    // aborts the mutation and is returned to the caller.
    std::function<core::errors::Status(const std::filesystem::path&)> before_commit;
};

// Milliseconds since the epoch, strictly increasing within this process so
// that two mutations in the same millisecond still get distinct backups.
std::int64_t unique_timestamp_ms();

// Copies an existing regular file to <root>/.backup/<ms>/<relative-path>.
// Returns nullopt when the target does not exist; fails with IsADirectory
// when it is a directory.
core::errors::Result<BackupPath> backup_existing(
    const std::filesystem::path& project_root,
    const std::filesystem::path& full_path);

core::errors::Status restore_backup(const std::filesystem::path& full_path,
                                    const std::filesystem::path& backup_path);

// Writes to a sibling "<name>.tmp.<ms>" and renames it over the target. On a
// failed replace the backup (if any) is restored.
core::errors::Status atomic_write(const std::filesystem::path& full_path,
                                  const std::string& content,
                                  const BackupPath& rollback_backup,
                                  const MutationHooks& hooks = {});

core::errors::Result<BackupPath> write_with_backup(
    const std::filesystem::path& project_root,
    const std::filesystem::path& full_path,
    const std::string& content,
    const MutationHooks& hooks = {});

// Appends in place, starting the content on a fresh line. A failure restores
// the backup, or removes the file when it did not exist before.
core::errors::Result<BackupPath> append_with_backup(
    const std::filesystem::path& project_root,
    const std::filesystem::path& full_path,
    const std::string& content,
    const MutationHooks& hooks = {});

}  // namespace inkbridge::storage
