#ifndef __MT_LOG_HANDLER__
#define __MT_LOG_HANDLER__

#include "Headers.hpp"

namespace mt {
/**
 * @brief Configures easylogging++ for the multiterm binary and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends every level to a new `<prefix>-<time>-<pid>.log` file in
   * `directory`.  The file rolls over at `maxLogSize` bytes.  Throws
   * std::runtime_error when the file cannot be created.
   * @return The path of the log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &directory, const string &prefix,
                              bool logToStdout,
                              const string &maxLogSize = "20971520");

  /**
   * @brief Keeps a full log file as `<filename>.1`, replacing the previous
   * generation.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace mt
#endif  // __MT_LOG_HANDLER__
