#include "PseudoTerminalProcess.hpp"

#include "RawSocketUtils.hpp"

namespace tt {
void PseudoTerminalProcess::spawn(const SpawnOptions& options) {
  lock_guard<recursive_mutex> guard(processMutex);
  if (pid > 0) {
    throw std::runtime_error("Process was already spawned");
  }
  if (!fs::is_directory(options.workingDirectory)) {
    throw std::runtime_error("Working directory does not exist: " +
                             options.workingDirectory);
  }
  if (::access(options.shell.c_str(), X_OK) != 0) {
    throw std::runtime_error("Shell not found: " + options.shell);
  }

  winsize win;
  memset(&win, 0, sizeof(winsize));
  win.ws_col = options.cols;
  win.ws_row = options.rows;
  pid_t child = forkpty(&masterFd, NULL, NULL, &win);
  if (child == -1) {
    throw std::runtime_error(string("forkpty failed: ") + strerror(errno));
  }
  if (child == 0) {
    execShell(options);
  }
  pid = child;
  VLOG(1) << "Spawned " << options.shell << " as pid " << pid << " on pty "
          << masterFd;
}

void PseudoTerminalProcess::execShell(const SpawnOptions& options) {
  if (chdir(options.workingDirectory.c_str()) == -1) {
    _exit(127);
  }
  setenv("SHELL", options.shell.c_str(), 1);
  setenv("TERM", "xterm-256color", 1);
  setenv("COLORTERM", "truecolor", 1);
  setenv("TT_VERSION", TT_VERSION, 1);
  // Shells remember an ignored SIGCHLD as the "original" disposition, which
  // breaks children that expect to wait() on their own subprocesses.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  const char* shell = options.shell.c_str();
  if (!options.startupCommand.empty()) {
    // The startup command begins with `exec`, so the pty's exit code is the
    // target program's exit code.
    execl(shell, shell, "-lc", options.startupCommand.c_str(), (char*)NULL);
  } else {
    execl(shell, shell, "-l", (char*)NULL);
  }
  _exit(127);
}

void PseudoTerminalProcess::write(const string& data) {
  int fd;
  {
    lock_guard<recursive_mutex> guard(processMutex);
    fd = masterFd;
  }
  RawSocketUtils::writeAll(fd, data.c_str(), data.length());
}

void PseudoTerminalProcess::resize(int cols, int rows) {
  lock_guard<recursive_mutex> guard(processMutex);
  if (masterFd < 0) {
    return;
  }
  winsize win;
  memset(&win, 0, sizeof(winsize));
  win.ws_col = cols;
  win.ws_row = rows;
  if (ioctl(masterFd, TIOCSWINSZ, &win) == -1) {
    LOG(WARNING) << "Resize failed on pty " << masterFd << ": "
                 << strerror(errno);
  }
}

int PseudoTerminalProcess::waitForExit() {
  lock_guard<recursive_mutex> guard(processMutex);
  if (pid <= 0 || reaped) {
    return -1;
  }
  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(pid, &status, 0);
  } while (rc == -1 && errno == EINTR);
  reaped = true;
  if (rc == -1) {
    LOG(WARNING) << "waitpid failed for " << pid << ": " << strerror(errno);
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

void PseudoTerminalProcess::terminate() {
  lock_guard<recursive_mutex> guard(processMutex);
  if (pid > 0 && !reaped) {
    ::kill(pid, SIGHUP);
    int status;
    // Reap if it is already gone; otherwise escalate.
    if (waitpid(pid, &status, WNOHANG) == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      if (waitpid(pid, &status, WNOHANG) == 0) {
        ::kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
      }
    }
    reaped = true;
  }
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
}
}  // namespace tt
