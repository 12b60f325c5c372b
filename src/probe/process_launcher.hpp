#pragma once

#include <string>
#include <vector>

namespace netdiag::probe {

// Raw result of one finished process. Streams are kept as bytes; decoding is
// the caller's concern.
struct ProcessCapture {
  std::string stdout_bytes;
  std::string stderr_bytes;
  int exit_code = -1;
};

// Seam between the probe runner and the operating system so tests can script
// tool output without launching real processes.
class IProcessLauncher {
public:
  virtual ~IProcessLauncher() = default;

  // Runs `argv` (argv[0] is resolved through PATH) to completion and captures
  // stdout and stderr separately. Returns false when the process could not be
  // started or its output could not be collected. A non-zero exit code is not
  // a launch failure.
  virtual bool Run(const std::vector<std::string>& argv,
                   ProcessCapture& capture,
                   std::string& error) = 0;
};

// Launches real processes detached from any terminal: a new session with stdin
// on /dev/null on POSIX, CREATE_NO_WINDOW on Windows.
class SystemProcessLauncher final : public IProcessLauncher {
public:
  bool Run(const std::vector<std::string>& argv,
           ProcessCapture& capture,
           std::string& error) override;
};

} // namespace netdiag::probe
