#include "util/Procfs.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace sysvet::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static bool under(const std::string& abs, const char* top) {
  size_t n = std::strlen(top);
  return abs.compare(0, n, top) == 0 && (abs.size() == n || abs[n] == '/');
}

static std::string root_for(const std::string& abs) {
  if (under(abs, "/proc")) return env_root("SYSVET_PROC_ROOT");
  if (under(abs, "/sys")) return env_root("SYSVET_SYS_ROOT");
  return env_root("SYSVET_FS_ROOT");
}

auto map_path(const std::string& abs) -> std::string {
  if (abs.empty() || abs[0] != '/') return abs;
  auto root = root_for(abs);
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto unmap_path(const std::string& mapped) -> std::string {
  for (const char* name : {"SYSVET_PROC_ROOT", "SYSVET_SYS_ROOT", "SYSVET_FS_ROOT"}) {
    auto root = env_root(name);
    while (root.size() > 1 && root.back() == '/') root.pop_back();
    if (root.empty()) continue;
    if (mapped.compare(0, root.size(), root) == 0 && mapped.size() > root.size() && mapped[root.size()] == '/')
      return mapped.substr(root.size());
  }
  return mapped;
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_path(abs));
  if (!in) return std::nullopt;
  try {
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return s;
  } catch (const std::exception&) {
    // File disappeared or became unreadable between open and read
    return std::nullopt;
  }
}

auto read_first_line(const std::string& abs) -> std::optional<std::string> {
  auto txt = read_file_string(abs);
  if (!txt) return std::nullopt;
  auto nl = txt->find('\n');
  if (nl != std::string::npos) txt->resize(nl);
  while (!txt->empty() && (txt->back() == '\r' || txt->back() == ' ')) txt->pop_back();
  return txt;
}

auto list_dir(const std::string& abs) -> std::optional<std::vector<std::string>> {
  std::vector<std::string> out;
  auto path = map_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) {
    if (errno == ENOENT || errno == ENOTDIR) return out;
    return std::nullopt;
  }
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

auto read_symlink(const std::string& abs) -> std::optional<std::string> {
  char buf[4096];
  auto path = map_path(abs);
  ssize_t n = ::readlink(path.c_str(), buf, sizeof(buf) - 1);
  if (n < 0) return std::nullopt;
  return std::string(buf, static_cast<size_t>(n));
}

bool path_exists(const std::string& abs) {
  struct stat st{};
  return ::lstat(map_path(abs).c_str(), &st) == 0;
}

bool is_directory(const std::string& abs) {
  struct stat st{};
  if (::stat(map_path(abs).c_str(), &st) != 0) return false;
  return S_ISDIR(st.st_mode);
}

} // namespace sysvet::util
