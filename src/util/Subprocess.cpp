#include "util/Subprocess.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>

namespace sysvet::util {

auto find_in_path(const std::string& name) -> std::optional<std::string> {
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (::access(name.c_str(), X_OK) == 0) return name;
    return std::nullopt;
  }
  const char* path = std::getenv("PATH");
  std::string p = (path && *path) ? path : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
  size_t start = 0;
  while (start <= p.size()) {
    size_t end = p.find(':', start);
    std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!dir.empty()) {
      std::string cand = dir + "/" + name;
      if (::access(cand.c_str(), X_OK) == 0) return cand;
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return std::nullopt;
}

static void reap(pid_t pid, int& status) {
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

auto run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                 std::stop_token st) -> std::optional<CommandOutput> {
  if (argv.empty()) return std::nullopt;
  auto exe = find_in_path(argv[0]);
  if (!exe) return std::nullopt;

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) return std::nullopt;

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) { ::close(fds[0]); ::close(fds[1]); return std::nullopt; }
  if (pid == 0) {
    ::dup2(fds[1], STDOUT_FILENO);
    int devnull = ::open("/dev/null", O_WRONLY);
    if (devnull >= 0) ::dup2(devnull, STDERR_FILENO);
    ::execv(exe->c_str(), cargv.data());
    ::_exit(127);
  }
  ::close(fds[1]);

  CommandOutput res;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[4096];
  bool killed = false;
  for (;;) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline || st.stop_requested()) {
      ::kill(pid, SIGKILL);
      res.timed_out = now >= deadline;
      killed = true;
      break;
    }
    // Short poll slices keep stop requests responsive
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    int slice = static_cast<int>(left < 50 ? left : 50);
    struct pollfd pfd{fds[0], POLLIN, 0};
    int pr = ::poll(&pfd, 1, slice);
    if (pr < 0) {
      if (errno == EINTR) continue;
      ::kill(pid, SIGKILL);
      killed = true;
      break;
    }
    if (pr == 0) continue;
    ssize_t n = ::read(fds[0], buf, sizeof(buf));
    if (n > 0) { res.out.append(buf, static_cast<size_t>(n)); continue; }
    if (n < 0 && errno == EINTR) continue;
    break; // EOF or read error
  }
  ::close(fds[0]);
  int status = 0;
  reap(pid, status);
  if (!killed && WIFEXITED(status)) {
    res.exit_code = WEXITSTATUS(status);
    if (res.exit_code == 127) return std::nullopt;
  }
  return res;
}

} // namespace sysvet::util
