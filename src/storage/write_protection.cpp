#include "storage/write_protection.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <system_error>
#include "core/logging/logger.hpp"
#include "policy/path_validator.hpp"

namespace inkbridge::storage {

using core::errors::BridgeError;
using core::errors::ErrorKind;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

BridgeError io_error(const std::string& message, const std::string& code) {
    return BridgeError{ErrorKind::IoError, message, code};
}

core::errors::Status ensure_parent_dir(const std::filesystem::path& full_path) {
    const auto parent = full_path.parent_path();
    if (parent.empty()) {
        return core::errors::ok();
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return io_error("Failed to create directory '" + parent.filename().string() +
                            "': " + ec.message(),
                        "create_dir_failed");
    }
    return core::errors::ok();
}

core::errors::Status write_bytes(const std::filesystem::path& path,
                                 const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return io_error("Failed to open temp file '" + path.filename().string() + "'",
                        "temp_open_failed");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
        return io_error("Failed to write temp file '" + path.filename().string() + "'",
                        "temp_write_failed");
    }
    return core::errors::ok();
}

// Best-effort cleanup on an error path; the primary error is what gets reported.
void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        LOG_WARN("write_protection: failed to remove " + path.filename().string() + ": " +
                 ec.message());
    }
}

void roll_back(const std::filesystem::path& full_path, const BackupPath& backup) {
    if (backup.has_value()) {
        auto restored = restore_backup(full_path, backup.value());
        if (core::errors::is_error(restored)) {
            LOG_ERROR("write_protection: rollback failed: " +
                      core::errors::get_error(restored).message);
        }
        return;
    }
    remove_quietly(full_path);
}

// True when the last byte of a non-empty file is not '\n'.
core::errors::Result<bool> needs_leading_newline(const std::filesystem::path& full_path,
                                                 const std::string& display) {
    std::error_code ec;
    if (!std::filesystem::exists(full_path, ec) || ec) {
        return false;
    }
    const auto size = std::filesystem::file_size(full_path, ec);
    if (ec) {
        return io_error("Failed to stat '" + display + "': " + ec.message(), "stat_failed");
    }
    if (size == 0) {
        return false;
    }

    std::ifstream in(full_path, std::ios::binary);
    if (!in.is_open()) {
        return io_error("Failed to open '" + display + "'", "open_failed");
    }
    in.seekg(-1, std::ios::end);
    char last = '\0';
    if (!in.get(last)) {
        return io_error("Failed to read '" + display + "'", "read_failed");
    }
    return last != '\n';
}

}  // namespace

std::int64_t unique_timestamp_ms() {
    static std::atomic<std::int64_t> last{0};
    std::int64_t candidate = now_unix_ms();
    std::int64_t previous = last.load();
    while (true) {
        const std::int64_t next = candidate > previous ? candidate : previous + 1;
        if (last.compare_exchange_weak(previous, next)) {
            return next;
        }
    }
}

core::errors::Result<BackupPath> backup_existing(
    const std::filesystem::path& project_root,
    const std::filesystem::path& full_path) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(full_path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return BackupPath{};
    }

    const std::string display = full_path.filename().string();
    if (std::filesystem::is_directory(full_path, ec)) {
        return BridgeError{ErrorKind::IsADirectory, "'" + display + "' is a directory",
                           "is_a_directory"};
    }

    if (!policy::PathValidator::is_within_root(project_root, full_path)) {
        return BridgeError{ErrorKind::PathEscape, "Failed to compute relative path",
                           "path_outside_project"};
    }
    const auto relative = full_path.lexically_relative(project_root);

    const auto backup_path = project_root / ".backup" /
                             std::to_string(unique_timestamp_ms()) / relative;
    std::filesystem::create_directories(backup_path.parent_path(), ec);
    if (ec) {
        return io_error("Failed to create backup directory: " + ec.message(),
                        "backup_dir_failed");
    }

    std::filesystem::copy_file(full_path, backup_path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return io_error("Failed to backup '" + relative.generic_string() + "': " +
                            ec.message(),
                        "backup_failed");
    }
    LOG_DEBUG("write_protection: backed up " + relative.generic_string());
    return BackupPath{backup_path};
}

core::errors::Status restore_backup(const std::filesystem::path& full_path,
                                    const std::filesystem::path& backup_path) {
    auto parent = ensure_parent_dir(full_path);
    if (core::errors::is_error(parent)) {
        return parent;
    }

    std::error_code ec;
    std::filesystem::copy_file(backup_path, full_path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return io_error("Failed to restore '" + full_path.filename().string() + "': " +
                            ec.message(),
                        "restore_failed");
    }
    return core::errors::ok();
}

core::errors::Status atomic_write(const std::filesystem::path& full_path,
                                  const std::string& content,
                                  const BackupPath& rollback_backup,
                                  const MutationHooks& hooks) {
    auto parent = ensure_parent_dir(full_path);
    if (core::errors::is_error(parent)) {
        return parent;
    }

    const std::string name = full_path.filename().string();
    const auto tmp_path = full_path.parent_path() /
                          (name + ".tmp." + std::to_string(unique_timestamp_ms()));
    auto written = write_bytes(tmp_path, content);
    if (core::errors::is_error(written)) {
        remove_quietly(tmp_path);
        return written;
    }
    if (hooks.before_commit) {
        auto committed = hooks.before_commit(tmp_path);
        if (core::errors::is_error(committed)) {
            remove_quietly(tmp_path);
            return committed;
        }
    }

    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, full_path, rename_ec);
    if (!rename_ec) {
        return core::errors::ok();
    }

    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(full_path, ec))) {
        remove_quietly(tmp_path);
        return io_error("Failed to move file into place '" + name + "': " +
                            rename_ec.message(),
                        "rename_failed");
    }

    // Some platforms refuse to rename onto an existing file.
    std::filesystem::remove(full_path, ec);
    if (ec) {
        remove_quietly(tmp_path);
        return io_error("Failed to replace '" + name + "': " + rename_ec.message() +
                            "; also failed to remove old file: " + ec.message(),
                        "replace_failed");
    }
    std::filesystem::rename(tmp_path, full_path, ec);
    if (ec) {
        remove_quietly(tmp_path);
        if (rollback_backup.has_value()) {
            auto restored = restore_backup(full_path, rollback_backup.value());
            if (core::errors::is_error(restored)) {
                LOG_ERROR("write_protection: rollback failed: " +
                          core::errors::get_error(restored).message);
            }
        }
        return io_error("Failed to replace '" + name + "': " + ec.message(),
                        "replace_failed");
    }
    return core::errors::ok();
}

core::errors::Result<BackupPath> write_with_backup(
    const std::filesystem::path& project_root,
    const std::filesystem::path& full_path,
    const std::string& content,
    const MutationHooks& hooks) {
    auto backup = backup_existing(project_root, full_path);
    if (core::errors::is_error(backup)) {
        return core::errors::get_error(backup);
    }
    const BackupPath backup_path = core::errors::get_value(backup);

    auto written = atomic_write(full_path, content, backup_path, hooks);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return backup_path;
}

core::errors::Result<BackupPath> append_with_backup(
    const std::filesystem::path& project_root,
    const std::filesystem::path& full_path,
    const std::string& content,
    const MutationHooks& hooks) {
    auto backup = backup_existing(project_root, full_path);
    if (core::errors::is_error(backup)) {
        return core::errors::get_error(backup);
    }
    const BackupPath backup_path = core::errors::get_value(backup);
    const std::string display = full_path.filename().string();

    auto newline = needs_leading_newline(full_path, display);
    if (core::errors::is_error(newline)) {
        return core::errors::get_error(newline);
    }

    auto parent = ensure_parent_dir(full_path);
    if (core::errors::is_error(parent)) {
        return core::errors::get_error(parent);
    }

    std::ofstream out(full_path, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        roll_back(full_path, backup_path);
        return io_error("Failed to open '" + display + "'", "open_failed");
    }
    if (core::errors::get_value(newline)) {
        out.put('\n');
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
        out.close();
        roll_back(full_path, backup_path);
        return io_error("Failed to append to '" + display + "'", "append_failed");
    }
    out.close();
    if (hooks.before_commit) {
        auto committed = hooks.before_commit(full_path);
        if (core::errors::is_error(committed)) {
            roll_back(full_path, backup_path);
            return core::errors::get_error(committed);
        }
    }
    return backup_path;
}

}  // namespace inkbridge::storage
