/*
TaleVox — Child process helpers.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "process_util.h"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace talevox {

namespace {

using Clock = std::chrono::steady_clock;

void closeFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Held from pipe creation until the parent has closed its copies of the
// write ends, so a concurrent fork never inherits another run's pipe.
std::mutex& spawnMutex() {
  static std::mutex m;
  return m;
}

// pipe() + FD_CLOEXEC; macOS has no pipe2().
bool openPipe(int fds[2]) {
  if (::pipe(fds) != 0) return false;
  if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0) {
    const int saved = errno;
    closeFd(fds[0]);
    closeFd(fds[1]);
    errno = saved;
    return false;
  }
  return true;
}

bool isExecutableFile(const std::string& path) {
  return !path.empty() && ::access(path.c_str(), X_OK) == 0;
}

int remainingMs(const Clock::time_point& deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return left < 0 ? 0 : static_cast<int>(left);
}

std::string snippetOf(const std::string& output) {
  std::string snippet = output;
  if (snippet.size() > 600) {
    snippet.resize(600);
    snippet += "...";
  }
  return snippet;
}

} // namespace

std::string findExecutable(const std::string& name) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) {
    return isExecutableFile(name) ? name : std::string();
  }

  const char* pathEnv = std::getenv("PATH");
  std::string paths = (pathEnv && *pathEnv) ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= paths.size()) {
    std::size_t colon = paths.find(':', start);
    if (colon == std::string::npos) colon = paths.size();
    std::string dir = paths.substr(start, colon - start);
    if (dir.empty()) dir = ".";
    const std::string candidate = dir + "/" + name;
    if (isExecutableFile(candidate)) return candidate;
    start = colon + 1;
  }
  return {};
}

bool runProcess(
  const std::vector<std::string>& argv,
  const ProcessOptions& options,
  ProcessResult& outResult,
  std::string& outError
) {
  outResult = ProcessResult{};
  outError.clear();

  if (argv.empty() || argv[0].empty()) {
    outError = "Executable path is empty";
    return false;
  }

  std::unique_lock<std::mutex> spawnLock(spawnMutex());
  int outPipe[2] = {-1, -1};
  int errPipe[2] = {-1, -1};
  if (!openPipe(outPipe)) {
    outError = std::string("pipe failed: ") + std::strerror(errno);
    return false;
  }
  // Reports an exec failure from the child; closes on successful exec.
  if (!openPipe(errPipe)) {
    outError = std::string("pipe failed: ") + std::strerror(errno);
    closeFd(outPipe[0]);
    closeFd(outPipe[1]);
    return false;
  }

  // Build argv before fork: only async-signal-safe calls in the child.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const std::string& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    outError = std::string("fork failed: ") + std::strerror(errno);
    closeFd(outPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[0]);
    closeFd(errPipe[1]);
    return false;
  }

  if (pid == 0) {
    // Own process group so a timeout can take down grandchildren too.
    ::setpgid(0, 0);
    const int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
    ::dup2(outPipe[1], STDOUT_FILENO);
    ::dup2(outPipe[1], STDERR_FILENO);
    if (!options.workingDir.empty() && ::chdir(options.workingDir.c_str()) != 0) {
      const int e = errno;
      (void)!::write(errPipe[1], &e, sizeof(e));
      ::_exit(127);
    }
    ::execvp(cargv[0], cargv.data());
    const int e = errno;
    (void)!::write(errPipe[1], &e, sizeof(e));
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  closeFd(outPipe[1]);
  closeFd(errPipe[1]);
  spawnLock.unlock();

  int execErrno = 0;
  ssize_t n = 0;
  do {
    n = ::read(errPipe[0], &execErrno, sizeof(execErrno));
  } while (n < 0 && errno == EINTR);
  closeFd(errPipe[0]);
  if (n == static_cast<ssize_t>(sizeof(execErrno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    closeFd(outPipe[0]);
    outError = "Could not start '" + argv[0] + "': " + std::strerror(execErrno);
    return false;
  }

  const bool limited = options.timeoutMs > 0;
  const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(limited ? options.timeoutMs : 0);

  std::string buf;
  char tmp[4096];
  bool timedOut = false;
  while (outPipe[0] >= 0) {
    if (limited && remainingMs(deadline) == 0) {
      timedOut = true;
      break;
    }
    pollfd pfd{};
    pfd.fd = outPipe[0];
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, limited ? remainingMs(deadline) : -1);
    if (pr < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (pr == 0) continue;
    const ssize_t got = ::read(outPipe[0], tmp, sizeof(tmp));
    if (got < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      break;
    }
    if (got == 0) break; // EOF
    buf.append(tmp, tmp + got);
  }
  closeFd(outPipe[0]);

  // Output closed; the child may still be running.
  int status = 0;
  while (!timedOut) {
    const pid_t w = ::waitpid(pid, &status, limited ? WNOHANG : 0);
    if (w == pid) break;
    if (w < 0 && errno != EINTR) {
      outError = std::string("waitpid failed: ") + std::strerror(errno);
      return false;
    }
    if (limited && remainingMs(deadline) == 0) {
      timedOut = true;
      break;
    }
    if (limited) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  while (!buf.empty() && (buf.back() == '\n' || buf.back() == '\r')) buf.pop_back();
  outResult.output = std::move(buf);

  if (timedOut) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    outResult.timedOut = true;
    std::ostringstream oss;
    oss << "'" << argv[0] << "' timed out after " << options.timeoutMs << " ms";
    outError = oss.str();
    return false;
  }

  if (WIFSIGNALED(status)) {
    std::ostringstream oss;
    oss << "'" << argv[0] << "' killed by signal " << WTERMSIG(status);
    outError = oss.str();
    return false;
  }

  outResult.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (outResult.exitCode != 0) {
    std::ostringstream oss;
    oss << "'" << argv[0] << "' exit code " << outResult.exitCode;
    if (!outResult.output.empty()) {
      // Include a short snippet of output to help debugging.
      oss << "\n\nOutput:\n" << snippetOf(outResult.output);
    }
    outError = oss.str();
    return false;
  }

  return true;
}

} // namespace talevox
