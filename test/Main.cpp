#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace tt;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      tt::LogHandler::setupLogHandler(&argc, &argv);
  tt::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  tt::HandleTerminate();
  ::signal(SIGPIPE, SIG_IGN);

  string logDirectoryPattern = GetTempDirectory() + string("tt_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  LogSettings logSettings;
  logSettings.directory = logDirectory;
  logSettings.filenamePrefix = "log";
  logSettings.logToStdout = false;
  logSettings.redirectStderrToFile = true;
  logSettings.appendPid = true;
  tt::LogHandler::setupLogFiles(&defaultConf, logSettings);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  std::error_code ec;
  fs::remove_all(logDirectory, ec);
  return result;
}
