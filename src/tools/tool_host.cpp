#include "tools/tool_host.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include "core/text/utf8.hpp"
#include "policy/path_validator.hpp"
#include "storage/write_protection.hpp"

namespace inkbridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorKind;

namespace {

struct ResolvedPath {
    std::filesystem::path root;
    std::filesystem::path full;
};

core::errors::Result<ResolvedPath> resolve(const std::filesystem::path& project_root,
                                           const std::string& relative) {
    const policy::PathValidator validator;
    auto root = validator.canonical_root(project_root);
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }
    auto full = validator.validate(project_root, relative);
    if (core::errors::is_error(full)) {
        return core::errors::get_error(full);
    }
    return ResolvedPath{core::errors::get_value(root), core::errors::get_value(full)};
}

BridgeError io_error(const std::string& message, const std::string& code) {
    return BridgeError{ErrorKind::IoError, message, code};
}

BridgeError binary_rejected() {
    return BridgeError{ErrorKind::BinaryFileRejected, "Binary file detected",
                       "binary_file"};
}

std::string format_line(const std::size_t line_number, const std::string& line) {
    std::ostringstream out;
    out << std::setw(5) << std::setfill('0') << line_number << "| " << line << "\n";
    return out.str();
}

std::size_t tail_start(const std::int64_t offset, const std::size_t total_lines) {
    if (offset == std::numeric_limits<std::int64_t>::min()) {
        return 0;
    }
    const auto back = static_cast<std::uint64_t>(-offset);
    if (back >= total_lines) {
        return 0;
    }
    return total_lines - static_cast<std::size_t>(back);
}

std::uint64_t modified_unix_seconds(const std::filesystem::path& path) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0 || info.st_mtime < 0) {
        return 0;
    }
    return static_cast<std::uint64_t>(info.st_mtime);
}

bool is_hidden(const std::string& name) {
    return !name.empty() && name.front() == '.';
}

// Appends the matches of one text file; binary files are skipped silently.
void search_file(const std::filesystem::path& root, const std::filesystem::path& file,
                 const std::string& query, std::vector<SearchMatch>& out) {
    if (core::text::file_looks_binary(file.string())) {
        return;
    }
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    const std::string relative = policy::PathValidator::relative_to_root(root, file);
    std::string line;
    std::uint32_t line_no = 0;
    while (out.size() < kMaxSearchMatches && std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!core::text::is_valid_utf8(line)) {
            return;
        }
        if (line.find(query) == std::string::npos) {
            continue;
        }
        out.push_back(SearchMatch{relative, line_no, line});
    }
}

core::errors::Status walk_and_search(const std::filesystem::path& root,
                                     const std::filesystem::path& dir,
                                     const std::string& query,
                                     std::vector<SearchMatch>& out) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return io_error("Failed to read dir: " + ec.message(), "read_dir_failed");
    }
    for (const auto& entry : it) {
        if (out.size() >= kMaxSearchMatches) {
            break;
        }
        const std::string name = entry.path().filename().string();
        if (is_hidden(name)) {
            continue;
        }
        // Links are never followed: their targets may lie outside the project.
        const auto status = entry.symlink_status(ec);
        if (ec || std::filesystem::is_symlink(status)) {
            continue;
        }
        if (std::filesystem::is_directory(status)) {
            if (is_ignored_dir_name(name)) {
                continue;
            }
            auto nested = walk_and_search(root, entry.path(), query, out);
            if (core::errors::is_error(nested)) {
                return nested;
            }
        } else if (std::filesystem::is_regular_file(status)) {
            search_file(root, entry.path(), query, out);
        }
    }
    return core::errors::ok();
}

}  // namespace

bool is_ignored_dir_name(const std::string& name) {
    return name == "node_modules" || name == "target" || name == ".git" ||
           name == ".backup" || name == "dist";
}

core::errors::Result<ReadResult> ToolHost::read(
    const std::filesystem::path& project_root,
    const ReadRequest& request) const {
    auto resolved = resolve(project_root, request.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto file_path = core::errors::get_value(resolved).full;

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return BridgeError{ErrorKind::IsADirectory, "'" + request.path + "' is a directory",
                           "is_a_directory"};
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return io_error("Failed to open file '" + request.path + "': " +
                            std::strerror(errno),
                        "open_failed");
    }
    if (core::text::file_looks_binary(file_path.string())) {
        return binary_rejected();
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!core::text::is_valid_utf8(line)) {
            return binary_rejected();
        }
        lines.push_back(std::move(line));
    }
    if (in.bad()) {
        return io_error("Failed to read file '" + request.path + "'", "read_failed");
    }

    const std::size_t total = lines.size();
    std::size_t start = 0;
    if (request.offset.has_value()) {
        const std::int64_t offset = request.offset.value();
        start = offset >= 0 ? static_cast<std::size_t>(offset) : tail_start(offset, total);
    }
    const std::size_t limit =
        std::min<std::uint32_t>(request.limit.value_or(kDefaultReadLimit), kDefaultReadLimit);

    ReadResult result;
    result.total_lines = static_cast<std::uint32_t>(
        std::min<std::size_t>(total, std::numeric_limits<std::uint32_t>::max()));

    std::size_t included = 0;
    std::size_t output_bytes = 0;
    for (std::size_t index = start; index < total; ++index) {
        if (included >= limit) {
            result.truncated = true;
            break;
        }

        std::string text = lines[index];
        if (core::text::count_code_points(text) > kMaxLineChars) {
            text = core::text::take_code_points(text, kMaxLineChars) + "...";
            result.truncated = true;
        }

        const std::string formatted = format_line(index + 1, text);
        if (output_bytes + formatted.size() > kMaxReadBytes) {
            result.truncated = true;
            break;
        }
        output_bytes += formatted.size();
        result.content += formatted;
        ++included;
    }
    return result;
}

core::errors::Status ToolHost::write(
    const std::filesystem::path& project_root,
    const std::string& path,
    const std::string& content) const {
    auto resolved = resolve(project_root, path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& target = core::errors::get_value(resolved);

    auto written = storage::write_with_backup(target.root, target.full, content);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return core::errors::ok();
}

core::errors::Status ToolHost::append(
    const std::filesystem::path& project_root,
    const std::string& path,
    const std::string& content) const {
    auto resolved = resolve(project_root, path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& target = core::errors::get_value(resolved);

    auto appended = storage::append_with_backup(target.root, target.full, content);
    if (core::errors::is_error(appended)) {
        return core::errors::get_error(appended);
    }
    return core::errors::ok();
}

core::errors::Result<ListResult> ToolHost::list(
    const std::filesystem::path& project_root,
    const std::optional<std::string>& path) const {
    const std::string relative = path.value_or("");
    auto resolved = resolve(project_root, relative);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto dir = core::errors::get_value(resolved).full;

    std::error_code ec;
    const auto status = std::filesystem::symlink_status(dir, ec);
    if (ec || !std::filesystem::exists(status)) {
        return io_error("Failed to stat '" + relative + "': " +
                            (ec ? ec.message() : std::string("No such file or directory")),
                        "stat_failed");
    }
    if (!std::filesystem::is_directory(status)) {
        return io_error("'" + relative + "' is not a directory", "not_a_directory");
    }

    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return io_error("Failed to read directory '" + relative + "': " + ec.message(),
                        "read_dir_failed");
    }

    ListResult result;
    for (const auto& entry : it) {
        if (result.entries.size() >= kMaxListEntries) {
            break;
        }
        const std::string name = entry.path().filename().string();
        if (is_hidden(name)) {
            continue;
        }
        const auto entry_status = entry.symlink_status(ec);
        if (ec) {
            return io_error("Failed to stat directory entry '" + name + "': " +
                                ec.message(),
                            "stat_failed");
        }
        if (std::filesystem::is_symlink(entry_status)) {
            continue;
        }
        const bool is_dir = std::filesystem::is_directory(entry_status);
        if (is_dir && is_ignored_dir_name(name)) {
            continue;
        }

        ListEntry item;
        item.name = name;
        item.is_dir = is_dir;
        if (std::filesystem::is_regular_file(entry_status)) {
            item.size = entry.file_size(ec);
            if (ec) {
                return io_error("Failed to read metadata for '" + name + "': " +
                                    ec.message(),
                                "stat_failed");
            }
        }
        item.modified = modified_unix_seconds(entry.path());
        result.entries.push_back(std::move(item));
    }
    return result;
}

core::errors::Result<SearchResult> ToolHost::search(
    const std::filesystem::path& project_root,
    const SearchRequest& request) const {
    if (request.query.empty()) {
        return BridgeError{ErrorKind::MissingArgument, "Search query cannot be empty.",
                           "empty_search_query"};
    }

    auto resolved = resolve(project_root, request.path.value_or(""));
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& scope = core::errors::get_value(resolved);

    std::error_code ec;
    const auto status = std::filesystem::status(scope.full, ec);
    if (ec || !std::filesystem::exists(status)) {
        return io_error("Failed to stat path '" + request.path.value_or("") + "'",
                        "stat_failed");
    }

    SearchResult result;
    if (std::filesystem::is_regular_file(status)) {
        search_file(scope.root, scope.full, request.query, result.matches);
        return result;
    }
    if (!std::filesystem::is_directory(status)) {
        return result;
    }

    auto walked = walk_and_search(scope.root, scope.full, request.query, result.matches);
    if (core::errors::is_error(walked)) {
        return core::errors::get_error(walked);
    }
    return result;
}

}  // namespace inkbridge::tools
