#ifndef __MUXCORE_LOG_HANDLER__
#define __MUXCORE_LOG_HANDLER__

#include "Headers.hpp"

namespace muxcore {
/**
 * @brief Configures easylogging++ for the mux tools and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging inside `path`.  Once the file grows
   * past `maxlogsize` bytes easylogging++ truncates it and starts over.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace muxcore
#endif  // __MUXCORE_LOG_HANDLER__
