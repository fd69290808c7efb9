#ifndef __MT_CONNECTION_BRIDGE_HPP__
#define __MT_CONNECTION_BRIDGE_HPP__

#include "Headers.hpp"
#include "TerminalBackend.hpp"

namespace mt {
/**
 * @brief Owns the session <-> backend connection plumbing.
 *
 * `write` and `resize` never throw back into the input path: backend
 * failures are logged and counted, and once a connection fails
 * `softErrorThreshold` times in a row the soft error handler is told.
 * `close` is idempotent.
 */
class ConnectionBridge {
 public:
  typedef std::function<void(const OpenResult&)> OpenCallback;
  typedef std::function<void(const string& connectionId, const string& error)>
      SoftErrorHandler;

  ConnectionBridge(shared_ptr<TerminalBackend> _backend,
                   int _softErrorThreshold = 3);

  /**
   * @brief Asks the backend for a new connection for `sessionId`.  The
   * callback runs later on the control loop with the id or an error.
   */
  void open(const string& sessionId, const optional<string>& directory,
            const optional<string>& shell, int rows, int cols,
            OpenCallback callback);
  /** @brief Forwards input.  Failures are logged, never thrown. */
  void write(const string& connectionId, const string& data);
  /** @brief Forwards a window size.  Failures are logged, never thrown. */
  void resize(const string& connectionId, int rows, int cols);
  /** @brief Closes a connection.  Unknown or closed ids are ignored. */
  void close(const string& connectionId);

  bool isOpen(const string& connectionId) const {
    return openConnections.find(connectionId) != openConnections.end();
  }
  int numOpen() const { return int(openConnections.size()); }
  /** @brief Consecutive write/resize failures for a connection. */
  int failureCount(const string& connectionId) const;
  void setSoftErrorHandler(SoftErrorHandler handler) {
    softErrorHandler = handler;
  }

 protected:
  void recordFailure(const string& connectionId, const string& what);
  void recordSuccess(const string& connectionId);

  shared_ptr<TerminalBackend> backend;
  int softErrorThreshold;
  SoftErrorHandler softErrorHandler;
  /** @brief Connection id -> owning session id. */
  map<string, string> openConnections;
  /** @brief Ids that were closed, so a second close never reaches the
   * backend. */
  set<string> closed;
  map<string, int> failures;
  shared_ptr<bool> alive;
};
}  // namespace mt

#endif  // __MT_CONNECTION_BRIDGE_HPP__
