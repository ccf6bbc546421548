/**
 * @file Process.hpp
 * @brief External command execution (nmcli, wpa_cli, ip) and helper daemons (dnsmasq).
 *
 * Commands are always exec'd with an argv vector, never through a shell, so SSIDs
 * and passphrases are passed verbatim.
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace Util {

struct CommandOutput {
  bool launched = false;  // false when the binary could not be exec'd
  bool timedOut = false;
  int exitCode = -1;
  std::string output;     // stdout and stderr, interleaved

  bool ok() const { return launched && !timedOut && exitCode == 0; }
};

// A long-running child. Destroying the handle terminates the child.
class ChildHandle {
 public:
  virtual ~ChildHandle() = default;

  virtual int pid() const = 0;
  virtual bool running() = 0;
  virtual void terminate(std::chrono::milliseconds grace) = 0;
};

class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  virtual CommandOutput run(const std::vector<std::string>& argv,
                            std::chrono::milliseconds timeout) = 0;
  // Returns nullptr when the process could not be started.
  virtual std::unique_ptr<ChildHandle> spawn(const std::vector<std::string>& argv) = 0;
};

class SystemProcessRunner : public ProcessRunner {
 public:
  CommandOutput run(const std::vector<std::string>& argv,
                    std::chrono::milliseconds timeout) override;
  std::unique_ptr<ChildHandle> spawn(const std::vector<std::string>& argv) override;
};

// Human-readable command line for logs; values following secret keys are masked.
std::string describeCommand(const std::vector<std::string>& argv);

bool processAlive(int pid);

}  // namespace Util
