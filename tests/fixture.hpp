#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// A throwaway tree that stands in for /, /proc and /sys. Every SYSVET_*_ROOT
// points at it while the object lives.
struct FixtureRoot {
  fs::path root;

  explicit FixtureRoot(const std::string& name) {
    root = fs::temp_directory_path() / ("sysvet_test_" + name + "_" + std::to_string(::getpid()));
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root);
    for (const char* var : {"SYSVET_PROC_ROOT", "SYSVET_SYS_ROOT", "SYSVET_FS_ROOT"}) ::setenv(var, root.c_str(), 1);
  }
  ~FixtureRoot() {
    for (const char* var : {"SYSVET_PROC_ROOT", "SYSVET_SYS_ROOT", "SYSVET_FS_ROOT"}) ::unsetenv(var);
    std::error_code ec;
    fs::remove_all(root, ec);
  }
  FixtureRoot(const FixtureRoot&) = delete;
  FixtureRoot& operator=(const FixtureRoot&) = delete;

  fs::path path(const std::string& abs) const { return root / abs.substr(abs[0] == '/' ? 1 : 0); }

  void write(const std::string& abs, const std::string& content) const {
    auto p = path(abs);
    fs::create_directories(p.parent_path());
    std::ofstream(p) << content;
  }
  void mkdir(const std::string& abs) const { fs::create_directories(path(abs)); }
  // Symlink at abs pointing to target (written verbatim, not remapped)
  void link(const std::string& abs, const std::string& target) const {
    auto p = path(abs);
    fs::create_directories(p.parent_path());
    fs::create_symlink(target, p);
  }
};
