/* @file ProcessRunner.cpp
 * @brief POSIX fork/exec with stderr capture, plus a streaming stdout pipe
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <iostream>
#include <thread>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

// Booth headers
#include "io/ProcessRunner.hpp"

using namespace booth::io;

namespace {

  constexpr std::size_t kMaxCapturedStderr = 8 * 1024;

  std::vector<char*> toArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args)
      argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
  }

  // Runs in the child after fork(): only async-signal-safe calls from here on.
  [[noreturn]] void execChild(std::vector<char*>& argv, int stdoutFd, int stderrFd) {
    int devNull = ::open("/dev/null", O_RDWR);
    ::dup2(devNull, STDIN_FILENO);
    ::dup2(stdoutFd >= 0 ? stdoutFd : devNull, STDOUT_FILENO);
    ::dup2(stderrFd >= 0 ? stderrFd : devNull, STDERR_FILENO);
    ::execvp(argv[0], argv.data());
    const char msg[] = "exec failed\n";
    ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ::_exit(127);
  }

  int decodeStatus(int status) {
    if (WIFEXITED(status))
      return WEXITSTATUS(status);
    return -1;
  }

} // namespace

// -------------------------------------------------------------------
// ProcessRunner::run
// Blocks until the child exits or the timeout elapses.
// -------------------------------------------------------------------
ProcessResult ProcessRunner::run(const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) {
  ProcessResult result;
  if (args.empty())
    return result;

  int errPipe[2];
  if (::pipe(errPipe) != 0) {
    result.stdErr = std::string("pipe: ") + strerror(errno);
    return result;
  }

  auto argv = toArgv(args);
  pid_t pid = ::fork();
  if (pid < 0) {
    result.stdErr = std::string("fork: ") + strerror(errno);
    ::close(errPipe[0]);
    ::close(errPipe[1]);
    return result;
  }
  if (pid == 0) {
    ::close(errPipe[0]);
    execChild(argv, -1, errPipe[1]);
  }

  ::close(errPipe[1]);
  pollfd pfd{ errPipe[0], POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[512];

  while (true) {
    auto msLeft = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (msLeft.count() <= 0) {
      result.timedOut = true;
      break;
    }
    int rc = ::poll(&pfd, 1, static_cast<int>(msLeft.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      break;
    }
    if (rc == 0)
      continue; // re-check the deadline
    ssize_t n = ::read(errPipe[0], buf, sizeof(buf));
    if (n > 0) {
      if (result.stdErr.size() < kMaxCapturedStderr)
        result.stdErr.append(buf, static_cast<std::size_t>(n));
    } else if (n == 0) {
      break; // child closed stderr (exited)
    } else if (errno != EINTR && errno != EAGAIN) {
      break;
    }
  }
  ::close(errPipe[0]);

  int status = 0;
  if (result.timedOut) {
    ::kill(pid, SIGKILL);
    ::waitpid(pid, &status, 0);
    result.exitCode = -1;
    return result;
  }
  while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
  result.exitCode = decodeStatus(status);
  return result;
}

ProcessPipe::~ProcessPipe() { stop(); }

ProcessPipe::ProcessPipe(ProcessPipe&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)), fd_(std::exchange(other.fd_, -1)) {}

ProcessPipe& ProcessPipe::operator=(ProcessPipe&& other) noexcept {
  if (this != &other) {
    stop();
    pid_ = std::exchange(other.pid_, -1);
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

bool ProcessPipe::start(const std::vector<std::string>& args) {
  stop();
  if (args.empty())
    return false;

  int outPipe[2];
  if (::pipe(outPipe) != 0) {
    std::cerr << "[ProcessPipe] pipe: " << strerror(errno) << "\n";
    return false;
  }

  auto argv = toArgv(args);
  pid_t pid = ::fork();
  if (pid < 0) {
    std::cerr << "[ProcessPipe] fork: " << strerror(errno) << "\n";
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    return false;
  }
  if (pid == 0) {
    ::close(outPipe[0]);
    execChild(argv, outPipe[1], -1);
  }

  ::close(outPipe[1]);
  ::fcntl(outPipe[0], F_SETFL, ::fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
  pid_ = pid;
  fd_ = outPipe[0];
  return true;
}

std::optional<std::vector<unsigned char>> ProcessPipe::readSome(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  pollfd pfd{ fd_, POLLIN, 0 };
  int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (rc == -1)
    return errno == EINTR ? std::optional<std::vector<unsigned char>>{ std::vector<unsigned char>{} }
                          : std::nullopt;
  if (rc == 0)
    return std::vector<unsigned char>{};

  std::vector<unsigned char> chunk(64 * 1024);
  ssize_t n = ::read(fd_, chunk.data(), chunk.size());
  if (n > 0) {
    chunk.resize(static_cast<std::size_t>(n));
    return chunk;
  }
  if (n == -1 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK))
    return std::vector<unsigned char>{};

  stop(); // EOF / disconnect
  return std::nullopt;
}

void ProcessPipe::stop() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  if (pid_ <= 0)
    return;

  ::kill(pid_, SIGTERM);
  int status = 0;
  for (int i = 0; i < 50; ++i) {
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
      pid_ = -1;
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });
  }
  ::kill(pid_, SIGKILL);
  ::waitpid(pid_, &status, 0);
  pid_ = -1;
}
