#ifndef __TT_LOG_HANDLER__
#define __TT_LOG_HANDLER__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Where and how much a TetherTerm binary should log.
 */
struct LogSettings {
  string directory;
  string filenamePrefix;
  bool logToStdout = false;
  bool redirectStderrToFile = false;
  bool appendPid = false;
  int verbosity = 0;
  bool silent = false;
  string maxLogSize = "20971520";
};

/**
 * @brief Configures easylogging++ for the server, the client and the tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the shared default configuration.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default logger at a fresh timestamped file under
   * settings.directory and applies verbosity/silence.
   * @return Full path of the log file that was created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const LogSettings &settings);

  /** @brief Deletes a rolled log file (easylogging pre-rollout callback). */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Makes the "stdout" logger print bare messages for the user. */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace tt
#endif  // __TT_LOG_HANDLER__
