#ifndef __TT_FAKE_TERMINAL_PROCESS_HPP__
#define __TT_FAKE_TERMINAL_PROCESS_HPP__

#include "RawSocketUtils.hpp"
#include "TerminalProcess.hpp"

namespace tt {
/**
 * Stands in for a pty: the session reads one end of a socketpair and the
 * test writes "process output" into the other. Closing the test end looks
 * like the process exiting.
 */
class FakeTerminalProcess : public TerminalProcess {
 public:
  FakeTerminalProcess()
      : processFd(-1),
        testFd(-1),
        exitCode(0),
        failSpawn(false),
        spawnCount(0),
        resizeCount(0),
        terminated(false) {}

  virtual ~FakeTerminalProcess() {
    terminate();
    closeTestEnd();
  }

  virtual void spawn(const SpawnOptions& options) {
    if (failSpawn) {
      throw std::runtime_error("Fake spawn failure");
    }
    lock_guard<recursive_mutex> guard(fakeMutex);
    spawnOptions = options;
    spawnCount++;
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    processFd = fds[0];
    testFd = fds[1];
  }

  virtual int getFd() { return processFd; }

  virtual void write(const string& data) {
    lock_guard<recursive_mutex> guard(fakeMutex);
    input += data;
  }

  virtual void resize(int cols, int rows) {
    lock_guard<recursive_mutex> guard(fakeMutex);
    lastSize = make_pair(cols, rows);
    resizeCount++;
  }

  virtual int waitForExit() { return exitCode; }

  virtual void terminate() {
    lock_guard<recursive_mutex> guard(fakeMutex);
    terminated = true;
    if (processFd >= 0) {
      ::close(processFd);
      processFd = -1;
    }
  }

  // Test side
  void emitOutput(const string& data) {
    RawSocketUtils::writeAll(testFd, data.c_str(), data.length());
  }

  void exitWith(int code) {
    exitCode = code;
    closeTestEnd();
  }

  string getInput() {
    lock_guard<recursive_mutex> guard(fakeMutex);
    return input;
  }

  pair<int, int> getLastSize() {
    lock_guard<recursive_mutex> guard(fakeMutex);
    return lastSize;
  }

  SpawnOptions getSpawnOptions() {
    lock_guard<recursive_mutex> guard(fakeMutex);
    return spawnOptions;
  }

  atomic<int> processFd;
  atomic<int> testFd;
  atomic<int> exitCode;
  bool failSpawn;
  atomic<int> spawnCount;
  atomic<int> resizeCount;
  atomic<bool> terminated;

 protected:
  void closeTestEnd() {
    lock_guard<recursive_mutex> guard(fakeMutex);
    if (testFd >= 0) {
      ::close(testFd);
      testFd = -1;
    }
  }

  recursive_mutex fakeMutex;
  SpawnOptions spawnOptions;
  string input;
  pair<int, int> lastSize;
};

class FakeTerminalProcessFactory : public TerminalProcessFactory {
 public:
  FakeTerminalProcessFactory() : failSpawns(false) {}

  virtual shared_ptr<TerminalProcess> create() {
    lock_guard<mutex> guard(factoryMutex);
    shared_ptr<FakeTerminalProcess> process(new FakeTerminalProcess());
    process->failSpawn = failSpawns;
    processes.push_back(process);
    return process;
  }

  shared_ptr<FakeTerminalProcess> get(int index) {
    lock_guard<mutex> guard(factoryMutex);
    return processes.at(index);
  }

  int count() {
    lock_guard<mutex> guard(factoryMutex);
    return int(processes.size());
  }

  bool failSpawns;

 protected:
  mutex factoryMutex;
  vector<shared_ptr<FakeTerminalProcess>> processes;
};
}  // namespace tt

#endif  // __TT_FAKE_TERMINAL_PROCESS_HPP__
