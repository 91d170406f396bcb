#ifndef __SB_LOG_HANDLER__
#define __SB_LOG_HANDLER__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Configures easylogging++ for the hub and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging from `argc/argv` and returns the base
   * configuration shared by every logger.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Routes the default logger into a fresh file under @p directory.
   * @param filenamePrefix File names look like `<prefix>-<time>_<pid>.log`.
   * @param maxlogsize Byte size at which the file is rolled out.
   * @return Full path of the log file that was created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &directory,
                              const string &filenamePrefix,
                              bool logToStdout = false,
                              bool redirectStderrToFile = false,
                              const string &maxlogsize = "20971520");

  /** @brief Applies a verbose level, ignoring negative values. */
  static void setVerbosity(int level);

  /**
   * @brief Called by easylogging when a file reaches its size limit.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the `stdout` logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &directory,
                           const string &stderrFilename);

  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace sb
#endif  // __SB_LOG_HANDLER__
