// Helpers for reading /proc, /sys and configuration trees with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace sysvet::util {

// Map an absolute path to an alternate root:
//   /proc/... -> $SYSVET_PROC_ROOT/proc/...
//   /sys/...  -> $SYSVET_SYS_ROOT/sys/...
//   anything else absolute -> $SYSVET_FS_ROOT/...
// Unset roots leave the path alone.
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read the first line of a file without the trailing newline.
auto read_first_line(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns std::nullopt when the directory
// exists but cannot be opened, an empty vector when it does not exist.
auto list_dir(const std::string& abs) -> std::optional<std::vector<std::string>>;

// Resolve a symlink target (one level). Returns std::nullopt on error.
auto read_symlink(const std::string& abs) -> std::optional<std::string>;

// path_exists does not follow symlinks: a dangling link still exists.
[[nodiscard]] bool path_exists(const std::string& abs);
[[nodiscard]] bool is_directory(const std::string& abs);

// Strip a remapped root prefix so reported paths read like real system paths.
auto unmap_path(const std::string& mapped) -> std::string;

} // namespace sysvet::util
