#include "DaemonCreator.hpp"

namespace tt {
int DaemonCreator::create(bool terminateParent, const string& childPidFile) {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }
  if (pid > 0) {
    if (terminateParent) {
      exit(EXIT_SUCCESS);
    }
    return PARENT;
  }

  if (setsid() < 0) {
    return -1;
  }
  signal(SIGHUP, SIG_IGN);

  // Second fork so the daemon can never reacquire a terminal
  pid = fork();
  if (pid < 0) {
    return -1;
  }
  if (pid > 0) {
    exit(EXIT_SUCCESS);
  }

  if (!childPidFile.empty()) {
    ofstream pidStream(childPidFile, ios::out | ios::trunc);
    if (!pidStream) {
      STFATAL << "Error opening pidfile for writing: " << childPidFile;
    }
    pidStream << getpid() << "\n";
  }

  FATAL_FAIL(chdir("/"));

  int devNullOut = open("/dev/null", O_WRONLY);
  FATAL_FAIL(devNullOut);
  FATAL_FAIL(dup2(devNullOut, STDOUT_FILENO));
  FATAL_FAIL(dup2(devNullOut, STDERR_FILENO));
  int devNullIn = open("/dev/null", O_RDONLY);
  FATAL_FAIL(devNullIn);
  FATAL_FAIL(dup2(devNullIn, STDIN_FILENO));
  return CHILD;
}
}  // namespace tt
