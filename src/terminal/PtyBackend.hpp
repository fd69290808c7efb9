#ifndef __MT_PTY_BACKEND_HPP__
#define __MT_PTY_BACKEND_HPP__

#include "EventBus.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "TerminalBackend.hpp"

namespace mt {
/**
 * @brief Runs each connection as a shell on its own pseudo-terminal.
 *
 * The master side of every pty is non-blocking and drained from a repeating
 * control-loop timer, so output is emitted on the bus from the loop thread.
 * The same timer flushes input the pty could not take yet and reaps exited
 * shells, so no call ever waits on a child.
 */
class PtyBackend : public TerminalBackend {
 public:
  PtyBackend(shared_ptr<EventLoop> _loop, shared_ptr<EventBus> _bus);
  virtual ~PtyBackend();

  virtual void openConnection(const ConnectionConfig& config,
                              OpenCallback callback);
  virtual void write(const string& connectionId, const string& data);
  virtual void resize(const string& connectionId, int rows, int cols);
  virtual void closeConnection(const string& connectionId);

  int numConnections() { return int(processes.size()); }
  bool hasConnection(const string& connectionId) {
    return processes.find(connectionId) != processes.end();
  }
  /** @brief Shells that were hung up but have not been reaped yet. */
  int numReaping() { return int(reaping.size()); }

  /** @brief $SHELL, else the first of zsh, bash, sh that exists. */
  static string defaultShell();

 protected:
  struct PtyProcess {
    string id;
    int masterFd;
    pid_t childPid;
    string pendingWrite;
  };

  struct Reaping {
    string id;
    pid_t childPid;
    TimePoint killDeadline;
    bool killed;
    // False after an explicit close, which is never reported
    bool report;
  };

  /** @brief Forks the shell.  Returns an error message on failure. */
  OpenResult spawn(const ConnectionConfig& config);
  /** @brief Drains every pty and emits output/termination events. */
  void poll();
  void schedulePoll();
  /** @brief Drains one pty.  Returns false once the process is gone. */
  bool drain(shared_ptr<PtyProcess> process);
  /** @brief Writes queued input, reporting a dead pty on the error channel. */
  void flush(shared_ptr<PtyProcess> process);
  /** @brief Releases the pty and queues the child for reaping. */
  void finish(const shared_ptr<PtyProcess>& process, bool hangup);
  /** @brief Collects exited children, escalating to SIGKILL when late. */
  void reap();

  shared_ptr<EventLoop> loop;
  shared_ptr<EventBus> bus;
  map<string, shared_ptr<PtyProcess>> processes;
  vector<Reaping> reaping;
  optional<EventLoop::TimerId> pollTimer;
  shared_ptr<bool> alive;
};
}  // namespace mt

#endif  // __MT_PTY_BACKEND_HPP__
