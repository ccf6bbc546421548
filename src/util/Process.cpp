/**
 * @file Process.cpp
 * @brief fork/exec based command runner.
 */
#include "util/Process.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace Util {
namespace {

constexpr auto kKillGrace = std::chrono::milliseconds(500);
constexpr auto kReapPoll = std::chrono::milliseconds(50);

const char* const kSecretKeys[] = {
    "password", "wifi-sec.psk", "802-1x.password", "wps_pin", "psk",
};

std::vector<char*> toArgv(const std::vector<std::string>& argv) {
  std::vector<char*> out;
  out.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    out.push_back(const_cast<char*>(arg.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

// Runs in the forked child: exit signals are blocked in the parent and the mask
// is inherited, so restore a clean mask before exec.
void prepareChild() {
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
  setpgid(0, 0);
}

bool waitForExit(pid_t pid, int& status, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    pid_t res = waitpid(pid, &status, WNOHANG);
    if (res == pid) return true;
    if (res < 0 && errno != EINTR) return true;
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(kReapPoll);
  }
}

void killAndReap(pid_t pid, int& status) {
  kill(pid, SIGTERM);
  if (!waitForExit(pid, status, kKillGrace)) {
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
  }
}

class ChildProcess : public ChildHandle {
 public:
  explicit ChildProcess(pid_t pid) : m_pid(pid) {}

  ~ChildProcess() override {
    if (running()) terminate(std::chrono::milliseconds(2000));
  }

  int pid() const override { return m_pid; }

  bool running() override {
    if (m_reaped) return false;
    int status = 0;
    pid_t res = waitpid(m_pid, &status, WNOHANG);
    if (res == m_pid || (res < 0 && errno == ECHILD)) {
      m_reaped = true;
      if (res == m_pid && WIFEXITED(status)) {
        spdlog::debug("[Process] pid {} exited with code {}", m_pid, WEXITSTATUS(status));
      }
      return false;
    }
    return true;
  }

  void terminate(std::chrono::milliseconds grace) override {
    if (!running()) return;
    int status = 0;
    kill(m_pid, SIGTERM);
    if (!waitForExit(m_pid, status, grace)) {
      spdlog::warn("[Process] pid {} ignored SIGTERM, killing", m_pid);
      kill(m_pid, SIGKILL);
      waitpid(m_pid, &status, 0);
    }
    m_reaped = true;
  }

 private:
  pid_t m_pid;
  bool m_reaped = false;
};

}  // namespace

std::string describeCommand(const std::vector<std::string>& argv) {
  std::string out;
  bool maskNext = false;
  for (const auto& arg : argv) {
    if (!out.empty()) out += ' ';
    if (maskNext) {
      out += "******";
      maskNext = false;
      continue;
    }
    out += arg;
    for (const char* key : kSecretKeys) {
      if (arg == key) {
        maskNext = true;
        break;
      }
    }
  }
  return out;
}

bool processAlive(int pid) {
  if (pid <= 0) return false;
  return kill(pid, 0) == 0 || errno == EPERM;
}

CommandOutput SystemProcessRunner::run(const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout) {
  CommandOutput result;
  if (argv.empty()) return result;

  int outPipe[2];
  int errPipe[2];  // CLOEXEC: readable only if exec failed
  if (pipe2(outPipe, O_CLOEXEC) != 0) {
    spdlog::error("[Process] pipe2 failed: {}", strerror(errno));
    return result;
  }
  if (pipe2(errPipe, O_CLOEXEC) != 0) {
    spdlog::error("[Process] pipe2 failed: {}", strerror(errno));
    close(outPipe[0]);
    close(outPipe[1]);
    return result;
  }

  std::vector<char*> cargv = toArgv(argv);
  pid_t pid = fork();
  if (pid < 0) {
    spdlog::error("[Process] fork failed: {}", strerror(errno));
    close(outPipe[0]);
    close(outPipe[1]);
    close(errPipe[0]);
    close(errPipe[1]);
    return result;
  }

  if (pid == 0) {
    prepareChild();
    int devNull = open("/dev/null", O_RDONLY);
    if (devNull >= 0) dup2(devNull, STDIN_FILENO);
    dup2(outPipe[1], STDOUT_FILENO);
    dup2(outPipe[1], STDERR_FILENO);
    close(outPipe[0]);
    close(outPipe[1]);
    close(errPipe[0]);
    execvp(cargv[0], cargv.data());
    int err = errno;
    ssize_t ignored = write(errPipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  close(outPipe[1]);
  close(errPipe[1]);

  int execErr = 0;
  ssize_t n = read(errPipe[0], &execErr, sizeof(execErr));
  close(errPipe[0]);
  if (n == static_cast<ssize_t>(sizeof(execErr))) {
    spdlog::error("[Process] cannot exec '{}': {}", argv[0], strerror(execErr));
    close(outPipe[0]);
    int status = 0;
    waitpid(pid, &status, 0);
    return result;
  }
  result.launched = true;

  auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[512];
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timedOut = true;
      break;
    }
    struct pollfd pfd;
    pfd.fd = outPipe[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    int pr = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (pr < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (pr == 0) continue;
    ssize_t got = read(outPipe[0], buf, sizeof(buf));
    if (got > 0) {
      result.output.append(buf, static_cast<size_t>(got));
    } else if (got == 0 || errno != EINTR) {
      break;
    }
  }
  close(outPipe[0]);

  int status = 0;
  if (result.timedOut) {
    spdlog::warn("[Process] '{}' timed out after {} ms", argv[0], timeout.count());
    killAndReap(pid, status);
    return result;
  }

  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (left.count() < 0) left = std::chrono::milliseconds(0);
  if (!waitForExit(pid, status, left + kKillGrace)) {
    result.timedOut = true;
    killAndReap(pid, status);
    return result;
  }
  result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return result;
}

std::unique_ptr<ChildHandle> SystemProcessRunner::spawn(const std::vector<std::string>& argv) {
  if (argv.empty()) return nullptr;

  int errPipe[2];
  if (pipe2(errPipe, O_CLOEXEC) != 0) {
    spdlog::error("[Process] pipe2 failed: {}", strerror(errno));
    return nullptr;
  }

  std::vector<char*> cargv = toArgv(argv);
  pid_t pid = fork();
  if (pid < 0) {
    spdlog::error("[Process] fork failed: {}", strerror(errno));
    close(errPipe[0]);
    close(errPipe[1]);
    return nullptr;
  }

  if (pid == 0) {
    prepareChild();
    close(errPipe[0]);
    execvp(cargv[0], cargv.data());
    int err = errno;
    ssize_t ignored = write(errPipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  close(errPipe[1]);
  int execErr = 0;
  ssize_t n = read(errPipe[0], &execErr, sizeof(execErr));
  close(errPipe[0]);
  if (n == static_cast<ssize_t>(sizeof(execErr))) {
    spdlog::error("[Process] cannot exec '{}': {}", argv[0], strerror(execErr));
    int status = 0;
    waitpid(pid, &status, 0);
    return nullptr;
  }

  spdlog::debug("[Process] started pid {}: {}", pid, describeCommand(argv));
  return std::make_unique<ChildProcess>(pid);
}

}  // namespace Util
