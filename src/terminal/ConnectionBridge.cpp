#include "ConnectionBridge.hpp"

namespace mt {
ConnectionBridge::ConnectionBridge(shared_ptr<TerminalBackend> _backend,
                                   int _softErrorThreshold)
    : backend(_backend),
      softErrorThreshold(_softErrorThreshold),
      alive(new bool(true)) {}

void ConnectionBridge::open(const string& sessionId,
                            const optional<string>& directory,
                            const optional<string>& shell, int rows, int cols,
                            OpenCallback callback) {
  ConnectionConfig config;
  if (directory && !directory->empty()) {
    config.set_working_directory(*directory);
  }
  if (shell && !shell->empty()) {
    config.set_shell(*shell);
  }
  config.set_rows(rows);
  config.set_cols(cols);
  LOG(INFO) << "Opening connection for " << sessionId << " (" << rows << "x"
            << cols << ")";
  weak_ptr<bool> weakAlive = alive;
  try {
    backend->openConnection(config, [this, weakAlive, sessionId,
                                     callback](const OpenResult& result) {
      if (weakAlive.expired()) {
        return;
      }
      if (result.ok()) {
        openConnections[result.connectionId] = sessionId;
        closed.erase(result.connectionId);
        LOG(INFO) << "Connection " << result.connectionId << " opened for "
                  << sessionId;
      } else {
        LOG(WARNING) << "Could not open a connection for " << sessionId
                     << ": " << result.error;
      }
      callback(result);
    });
  } catch (const std::runtime_error& ex) {
    STERROR << "Backend refused to open a connection: " << ex.what();
    OpenResult result;
    result.error = ex.what();
    callback(result);
  }
}

void ConnectionBridge::write(const string& connectionId, const string& data) {
  if (!isOpen(connectionId)) {
    VLOG(1) << "Dropping " << data.length() << " bytes for closed connection "
            << connectionId;
    return;
  }
  try {
    backend->write(connectionId, data);
    recordSuccess(connectionId);
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Failed to write to terminal " << connectionId << ": "
               << ex.what();
    recordFailure(connectionId, ex.what());
  }
}

void ConnectionBridge::resize(const string& connectionId, int rows, int cols) {
  if (!isOpen(connectionId)) {
    VLOG(1) << "Dropping resize for closed connection " << connectionId;
    return;
  }
  try {
    backend->resize(connectionId, rows, cols);
    recordSuccess(connectionId);
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Failed to resize terminal " << connectionId << ": "
               << ex.what();
    recordFailure(connectionId, ex.what());
  }
}

void ConnectionBridge::close(const string& connectionId) {
  if (closed.find(connectionId) != closed.end()) {
    return;  // Already closed
  }
  closed.insert(connectionId);
  openConnections.erase(connectionId);
  failures.erase(connectionId);
  LOG(INFO) << "Closing connection " << connectionId;
  try {
    backend->closeConnection(connectionId);
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Failed to close terminal " << connectionId << ": "
               << ex.what();
  }
}

int ConnectionBridge::failureCount(const string& connectionId) const {
  auto it = failures.find(connectionId);
  if (it == failures.end()) {
    return 0;
  }
  return it->second;
}

void ConnectionBridge::recordFailure(const string& connectionId,
                                     const string& what) {
  int count = ++failures[connectionId];
  if (count == softErrorThreshold && softErrorHandler) {
    LOG(WARNING) << "Connection " << connectionId << " failed " << count
                 << " times in a row";
    softErrorHandler(connectionId, what);
  }
}

void ConnectionBridge::recordSuccess(const string& connectionId) {
  failures.erase(connectionId);
}
}  // namespace mt
