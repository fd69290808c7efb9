#ifndef __MT_TERMINAL_BACKEND_HPP__
#define __MT_TERMINAL_BACKEND_HPP__

#include "Headers.hpp"

namespace mt {
/** @brief Channel carrying `TerminalOutput` payloads for a connection. */
inline string outputChannel(const string& connectionId) {
  return string("pty-output-") + connectionId;
}
/** @brief Channel carrying `TerminalError` payloads for a connection. */
inline string errorChannel(const string& connectionId) {
  return string("pty-error-") + connectionId;
}
/** @brief Channel carrying a `TerminalClosed` payload once the process ends.
 */
inline string closedChannel(const string& connectionId) {
  return string("pty-closed-") + connectionId;
}

/** @brief Completion of `TerminalBackend::openConnection`. */
struct OpenResult {
  string connectionId;
  string error;

  bool ok() const { return !connectionId.empty() && error.empty(); }
};

/**
 * @brief Host side of a terminal connection: one shell process per id.
 *
 * All methods return immediately.  `openConnection` reports its result
 * through the callback on a later control-loop iteration; output, error and
 * termination are emitted on the channels named above.
 */
class TerminalBackend {
 public:
  typedef std::function<void(const OpenResult&)> OpenCallback;

  virtual ~TerminalBackend() {}

  /** @brief Spawns a shell sized and configured from `config`. */
  virtual void openConnection(const ConnectionConfig& config,
                              OpenCallback callback) = 0;
  /** @brief Sends bytes to the shell.  Throws std::runtime_error. */
  virtual void write(const string& connectionId, const string& data) = 0;
  /** @brief Applies a new window size.  Throws std::runtime_error. */
  virtual void resize(const string& connectionId, int rows, int cols) = 0;
  /** @brief Kills the shell and forgets the id.  Idempotent. */
  virtual void closeConnection(const string& connectionId) = 0;
};
}  // namespace mt

#endif  // __MT_TERMINAL_BACKEND_HPP__
