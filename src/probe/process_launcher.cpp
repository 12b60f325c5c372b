#include "probe/process_launcher.hpp"

#include <cerrno>
#include <cstring>

#if defined(_WIN32)
#include <thread>
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace netdiag::probe {

namespace {

#if defined(_WIN32)

std::string QuoteWindowsArgument(const std::string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
    return arg;
  }
  std::string quoted = "\"";
  for (const char c : arg) {
    if (c == '"') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void DrainPipe(HANDLE pipe, std::string& out) {
  char buffer[4096];
  DWORD read = 0;
  while (ReadFile(pipe, buffer, static_cast<DWORD>(sizeof(buffer)), &read, nullptr) != 0 &&
         read > 0U) {
    out.append(buffer, read);
  }
}

bool RunWindows(const std::vector<std::string>& argv, ProcessCapture& capture,
                std::string& error) {
  SECURITY_ATTRIBUTES attrs{};
  attrs.nLength = sizeof(attrs);
  attrs.bInheritHandle = TRUE;

  HANDLE out_read = nullptr;
  HANDLE out_write = nullptr;
  HANDLE err_read = nullptr;
  HANDLE err_write = nullptr;
  if (CreatePipe(&out_read, &out_write, &attrs, 0) == 0) {
    error = "failed to create stdout pipe";
    return false;
  }
  if (CreatePipe(&err_read, &err_write, &attrs, 0) == 0) {
    CloseHandle(out_read);
    CloseHandle(out_write);
    error = "failed to create stderr pipe";
    return false;
  }
  SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
  SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

  std::string command_line;
  for (const std::string& arg : argv) {
    if (!command_line.empty()) {
      command_line += ' ';
    }
    command_line += QuoteWindowsArgument(arg);
  }

  STARTUPINFOA startup{};
  startup.cb = sizeof(startup);
  startup.dwFlags = STARTF_USESTDHANDLES;
  startup.hStdInput = nullptr;
  startup.hStdOutput = out_write;
  startup.hStdError = err_write;

  PROCESS_INFORMATION process{};
  const BOOL created = CreateProcessA(nullptr, command_line.data(), nullptr, nullptr, TRUE,
                                      CREATE_NO_WINDOW, nullptr, nullptr, &startup, &process);
  CloseHandle(out_write);
  CloseHandle(err_write);
  if (created == 0) {
    CloseHandle(out_read);
    CloseHandle(err_read);
    error = "failed to launch '" + argv.front() + "' (error " +
            std::to_string(GetLastError()) + ")";
    return false;
  }

  std::thread stderr_reader([&] { DrainPipe(err_read, capture.stderr_bytes); });
  DrainPipe(out_read, capture.stdout_bytes);
  stderr_reader.join();

  WaitForSingleObject(process.hProcess, INFINITE);
  DWORD exit_code = 0;
  GetExitCodeProcess(process.hProcess, &exit_code);
  capture.exit_code = static_cast<int>(exit_code);

  CloseHandle(process.hThread);
  CloseHandle(process.hProcess);
  CloseHandle(out_read);
  CloseHandle(err_read);
  return true;
}

#else

class PipeFds {
public:
  PipeFds() = default;
  ~PipeFds() {
    CloseRead();
    CloseWrite();
  }

  PipeFds(const PipeFds&) = delete;
  PipeFds& operator=(const PipeFds&) = delete;

  bool Open() {
    int fds[2] = {-1, -1};
#if defined(__linux__)
    // Atomic close-on-exec: probes fork concurrently from several workers.
    if (pipe2(fds, O_CLOEXEC) != 0) {
      return false;
    }
    read_fd_ = fds[0];
    write_fd_ = fds[1];
    return true;
#else
    if (pipe(fds) != 0) {
      return false;
    }
    read_fd_ = fds[0];
    write_fd_ = fds[1];
    return fcntl(read_fd_, F_SETFD, FD_CLOEXEC) == 0 &&
           fcntl(write_fd_, F_SETFD, FD_CLOEXEC) == 0;
#endif
  }

  int read_fd() const {
    return read_fd_;
  }
  int write_fd() const {
    return write_fd_;
  }

  void CloseRead() {
    if (read_fd_ >= 0) {
      close(read_fd_);
      read_fd_ = -1;
    }
  }
  void CloseWrite() {
    if (write_fd_ >= 0) {
      close(write_fd_);
      write_fd_ = -1;
    }
  }

private:
  int read_fd_ = -1;
  int write_fd_ = -1;
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void ExecChild(char* const* child_argv, const PipeFds& out_pipe,
                            const PipeFds& err_pipe, const PipeFds& status_pipe) {
  setsid();

  const int null_fd = open("/dev/null", O_RDONLY);
  if (null_fd >= 0) {
    dup2(null_fd, STDIN_FILENO);
    close(null_fd);
  }
  dup2(out_pipe.write_fd(), STDOUT_FILENO);
  dup2(err_pipe.write_fd(), STDERR_FILENO);

  execvp(child_argv[0], child_argv);

  const int exec_errno = errno;
  ssize_t ignored = write(status_pipe.write_fd(), &exec_errno, sizeof(exec_errno));
  (void)ignored;
  _exit(127);
}

bool ReadAvailable(const int fd, std::string& out, bool& eof) {
  char buffer[4096];
  const ssize_t n = read(fd, buffer, sizeof(buffer));
  if (n > 0) {
    out.append(buffer, static_cast<std::size_t>(n));
    return true;
  }
  if (n == 0) {
    eof = true;
    return true;
  }
  return errno == EINTR || errno == EAGAIN;
}

bool CollectOutput(PipeFds& out_pipe, PipeFds& err_pipe, ProcessCapture& capture,
                   std::string& error) {
  bool out_eof = false;
  bool err_eof = false;
  while (!out_eof || !err_eof) {
    pollfd fds[2] = {
        {.fd = out_eof ? -1 : out_pipe.read_fd(), .events = POLLIN, .revents = 0},
        {.fd = err_eof ? -1 : err_pipe.read_fd(), .events = POLLIN, .revents = 0},
    };
    const int ready = poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = std::string("poll failed while capturing output: ") + std::strerror(errno);
      return false;
    }
    if (!out_eof && (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      if (!ReadAvailable(out_pipe.read_fd(), capture.stdout_bytes, out_eof)) {
        error = std::string("failed to read stdout: ") + std::strerror(errno);
        return false;
      }
    }
    if (!err_eof && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      if (!ReadAvailable(err_pipe.read_fd(), capture.stderr_bytes, err_eof)) {
        error = std::string("failed to read stderr: ") + std::strerror(errno);
        return false;
      }
    }
  }
  return true;
}

int WaitForExit(const pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return status;
}

bool RunPosix(const std::vector<std::string>& argv, ProcessCapture& capture,
              std::string& error) {
  PipeFds out_pipe;
  PipeFds err_pipe;
  PipeFds status_pipe;
  if (!out_pipe.Open() || !err_pipe.Open() || !status_pipe.Open()) {
    error = std::string("failed to create pipes: ") + std::strerror(errno);
    return false;
  }

  std::vector<char*> child_argv;
  child_argv.reserve(argv.size() + 1U);
  for (const std::string& arg : argv) {
    child_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  child_argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    error = std::string("fork failed: ") + std::strerror(errno);
    return false;
  }
  if (pid == 0) {
    ExecChild(child_argv.data(), out_pipe, err_pipe, status_pipe);
  }

  out_pipe.CloseWrite();
  err_pipe.CloseWrite();
  status_pipe.CloseWrite();

  // The status pipe is close-on-exec: EOF without data means exec succeeded.
  int exec_errno = 0;
  ssize_t status_read = 0;
  do {
    status_read = read(status_pipe.read_fd(), &exec_errno, sizeof(exec_errno));
  } while (status_read < 0 && errno == EINTR);
  if (status_read == static_cast<ssize_t>(sizeof(exec_errno))) {
    (void)WaitForExit(pid);
    error = "failed to launch '" + argv.front() + "': " + std::strerror(exec_errno);
    return false;
  }

  const bool collected = CollectOutput(out_pipe, err_pipe, capture, error);
  // Close our ends first so a child blocked on a full pipe sees EPIPE instead of
  // hanging the wait below.
  out_pipe.CloseRead();
  err_pipe.CloseRead();
  capture.exit_code = WaitForExit(pid);
  return collected;
}

#endif

} // namespace

bool SystemProcessLauncher::Run(const std::vector<std::string>& argv,
                                ProcessCapture& capture,
                                std::string& error) {
  capture = ProcessCapture{};
  error.clear();
  if (argv.empty() || argv.front().empty()) {
    error = "empty command line";
    return false;
  }
#if defined(_WIN32)
  return RunWindows(argv, capture, error);
#else
  return RunPosix(argv, capture, error);
#endif
}

} // namespace netdiag::probe
