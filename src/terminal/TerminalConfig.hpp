#ifndef __MT_TERMINAL_CONFIG_HPP__
#define __MT_TERMINAL_CONFIG_HPP__

#include "Headers.hpp"
#include "TerminalSurface.hpp"

namespace mt {
/**
 * @brief Settings read from the ini file.  Every field has a default, so a
 * missing file or key is never an error.
 */
struct TerminalConfig {
  // [Terminal]
  /** @brief Shell for new sessions.  Empty means the backend default. */
  string shell;
  /** @brief Directory for new sessions.  Empty means the current one. */
  string directory;
  string fontFamily = "monospace";
  double fontSize = 14.0;
  int scrollback = 1000;
  string theme = "default";

  // [Behavior]
  int resizeDebounceMs = 100;
  int fitRetryMs = 100;
  int maxFitRetries = 20;
  int softErrorThreshold = 3;

  // [Debug]
  int verbose = 0;
  string logSize = "20971520";
  bool logToStdout = false;

  /** @brief `<config home>/multiterm/multiterm.ini` */
  static string defaultPath();
  /**
   * @brief Reads `path` over the defaults.  A missing file yields the
   * defaults; a file that exists but cannot be parsed is a fatal error.
   */
  static TerminalConfig load(const string& path);
  /** @brief Reads settings from ini text (used by tests). */
  static TerminalConfig parse(const string& iniData);

  SurfaceConfig surfaceConfig() const;
  /** @brief The configured directory, or the process working directory. */
  string startDirectory() const;
};
}  // namespace mt

#endif  // __MT_TERMINAL_CONFIG_HPP__
