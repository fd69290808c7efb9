#include "PtyBackend.hpp"

#include "RawSocketUtils.hpp"

namespace mt {
namespace {
#define BUF_SIZE (16 * 1024)
// Upper bound on bytes drained from one pty per poll so a chatty shell
// cannot starve the others.
#define MAX_BYTES_PER_POLL (4 * BUF_SIZE)
const std::chrono::milliseconds POLL_INTERVAL(10);
// How long a shell gets to exit on its own before SIGKILL.
const std::chrono::milliseconds KILL_GRACE(50);
// Input the pty has not accepted yet, per connection.
#define MAX_PENDING_WRITE (4 * 1024 * 1024)

void setChildEnvironment(const ConnectionConfig& config, const string& shell) {
  setenv("TERM", "xterm-256color", 1);
  setenv("COLORTERM", "truecolor", 1);
  setenv("TERM_PROGRAM", "multiterm", 1);
  setenv("TERM_PROGRAM_VERSION", MT_VERSION, 1);
  setenv("SHELL", shell.c_str(), 1);
  setenv("FORCE_COLOR", "1", 1);
  setenv("CLICOLOR", "1", 1);
  setenv("CLICOLOR_FORCE", "1", 1);
  for (auto& it : config.environment()) {
    setenv(it.first.c_str(), it.second.c_str(), 1);
  }
}
}  // namespace

PtyBackend::PtyBackend(shared_ptr<EventLoop> _loop, shared_ptr<EventBus> _bus)
    : loop(_loop), bus(_bus), alive(new bool(true)) {}

PtyBackend::~PtyBackend() {
  vector<string> ids;
  for (auto& it : processes) {
    ids.push_back(it.first);
  }
  for (auto& id : ids) {
    closeConnection(id);
  }
  if (pollTimer) {
    loop->cancel(*pollTimer);
  }
  // Nobody is left to poll for the rest
  for (auto& r : reaping) {
    int status;
    pid_t rc = waitpid(r.childPid, &status, WNOHANG);
    if (rc == 0) {
      ::kill(r.childPid, SIGKILL);
      do {
        rc = waitpid(r.childPid, &status, 0);
      } while (rc < 0 && errno == EINTR);
    }
  }
}

string PtyBackend::defaultShell() {
  const char* envShell = ::getenv("SHELL");
  if (envShell && strlen(envShell)) {
    return string(envShell);
  }
  for (const char* candidate : {"/bin/zsh", "/bin/bash", "/bin/sh"}) {
    if (::access(candidate, X_OK) == 0) {
      return string(candidate);
    }
  }
  return "/bin/sh";
}

void PtyBackend::openConnection(const ConnectionConfig& config,
                                OpenCallback callback) {
  weak_ptr<bool> weakAlive = alive;
  loop->post([this, weakAlive, config, callback]() {
    if (weakAlive.expired()) {
      // Whoever asked went away with the backend
      return;
    }
    OpenResult result = spawn(config);
    if (result.ok()) {
      schedulePoll();
    }
    callback(result);
  });
}

OpenResult PtyBackend::spawn(const ConnectionConfig& config) {
  OpenResult result;
  string shell = config.has_shell() && !config.shell().empty()
                     ? config.shell()
                     : defaultShell();

  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(winsize));
  tmpwin.ws_row = config.rows() > 0 ? config.rows() : 24;
  tmpwin.ws_col = config.cols() > 0 ? config.cols() : 80;

  // The child reports a failed exec through this pipe.  A successful exec
  // closes the write end (O_CLOEXEC) and the parent reads EOF.
  int errorPipe[2];
  if (pipe2(errorPipe, O_CLOEXEC) == -1) {
    result.error = string("Could not create spawn pipe: ") + strerror(errno);
    return result;
  }

  int masterFd = -1;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &tmpwin);
  switch (pid) {
    case -1: {
      int localErrno = errno;
      ::close(errorPipe[0]);
      ::close(errorPipe[1]);
      result.error = string("Could not fork a terminal: ") +
                     strerror(localErrno);
      return result;
    }
    case 0: {
      ::close(errorPipe[0]);
      string directory = config.has_working_directory()
                             ? config.working_directory()
                             : string();
      if (directory.empty() || ::chdir(directory.c_str()) != 0) {
        // Best effort, the shell still starts in the inherited directory
        passwd* pwd = getpwuid(getuid());
        if (pwd != NULL && ::chdir(pwd->pw_dir) != 0) {
          perror("chdir");
        }
      }
      setChildEnvironment(config, shell);
      // bash remembers the inherited SIGCHLD disposition as the "original"
      // one, an ignored SIGCHLD would break popen() style code in the shell.
      signal(SIGCHLD, SIG_DFL);
      execl(shell.c_str(), shell.c_str(), (char*)NULL);
      int localErrno = errno;
      ssize_t ignored = ::write(errorPipe[1], &localErrno, sizeof(localErrno));
      (void)ignored;
      _exit(127);
    }
    default:
      break;
  }

  ::close(errorPipe[1]);
  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (rc < 0 && errno == EINTR);
  ::close(errorPipe[0]);
  if (rc == sizeof(childErrno)) {
    int status;
    waitpid(pid, &status, 0);
    ::close(masterFd);
    result.error = string("Could not start shell ") + shell + ": " +
                   strerror(childErrno);
    LOG(WARNING) << result.error;
    return result;
  }

  RawSocketUtils::setNonBlocking(masterFd);
  auto process = make_shared<PtyProcess>();
  process->id = sole::uuid4().str();
  process->masterFd = masterFd;
  process->childPid = pid;
#ifdef WITH_UTEMPTER
  {
    char buf[1024];
    sprintf(buf, "multiterm [%lld]", (long long)getpid());
    utempter_add_record(masterFd, buf);
  }
#endif
  processes.insert(make_pair(process->id, process));
  LOG(INFO) << "pty opened " << process->id << " fd " << masterFd << " pid "
            << pid << " shell " << shell;
  result.connectionId = process->id;
  return result;
}

void PtyBackend::write(const string& connectionId, const string& data) {
  auto it = processes.find(connectionId);
  if (it == processes.end()) {
    throw std::runtime_error("Unknown terminal connection: " + connectionId);
  }
  auto process = it->second;
  if (process->pendingWrite.empty()) {
    size_t written = RawSocketUtils::writeSome(process->masterFd,
                                               data.c_str(), data.length());
    if (written == data.length()) {
      return;
    }
    process->pendingWrite.append(data, written, string::npos);
  } else {
    if (process->pendingWrite.length() + data.length() > MAX_PENDING_WRITE) {
      throw std::runtime_error("Terminal input buffer is full: " +
                               connectionId);
    }
    process->pendingWrite.append(data);
  }
  VLOG(2) << "Queued " << process->pendingWrite.length() << " bytes for "
          << connectionId;
  schedulePoll();
}

void PtyBackend::resize(const string& connectionId, int rows, int cols) {
  auto it = processes.find(connectionId);
  if (it == processes.end()) {
    throw std::runtime_error("Unknown terminal connection: " + connectionId);
  }
  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(winsize));
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  if (ioctl(it->second->masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    throw std::runtime_error(string("Could not resize terminal: ") +
                             strerror(errno));
  }
  VLOG(1) << "Resized " << connectionId << " to " << rows << "x" << cols;
}

void PtyBackend::closeConnection(const string& connectionId) {
  auto it = processes.find(connectionId);
  if (it == processes.end()) {
    for (auto& r : reaping) {
      if (r.id == connectionId) {
        // Ended but not reaped yet, keep it quiet
        r.report = false;
      }
    }
    VLOG(1) << "Ignoring close of unknown connection " << connectionId;
    return;
  }
  auto process = it->second;
  processes.erase(it);
  LOG(INFO) << "Stopping terminal " << connectionId;
  finish(process, true);
}

void PtyBackend::schedulePoll() {
  if (pollTimer && loop->isPending(*pollTimer)) {
    return;
  }
  weak_ptr<bool> weakAlive = alive;
  pollTimer = loop->postDelayed(POLL_INTERVAL, [this, weakAlive]() {
    if (weakAlive.expired()) {
      return;
    }
    pollTimer.reset();
    poll();
    if (!processes.empty() || !reaping.empty()) {
      schedulePoll();
    }
  });
}

void PtyBackend::poll() {
  // Listeners may close other connections while we emit, so walk a copy
  // of the ids and look each one up again.
  vector<string> ids;
  for (auto& it : processes) {
    ids.push_back(it.first);
  }
  for (auto& id : ids) {
    auto it = processes.find(id);
    if (it == processes.end()) {
      continue;
    }
    flush(it->second);
    it = processes.find(id);
    if (it == processes.end()) {
      continue;
    }
    drain(it->second);
  }
  reap();
}

void PtyBackend::flush(shared_ptr<PtyProcess> process) {
  if (process->pendingWrite.empty()) {
    return;
  }
  try {
    const string& pending = process->pendingWrite;
    size_t written = RawSocketUtils::writeSome(
        process->masterFd, pending.c_str(), pending.length());
    process->pendingWrite.erase(0, written);
  } catch (const std::runtime_error& ex) {
    process->pendingWrite.clear();
    TerminalError error;
    error.set_error(string("Terminal write failed: ") + ex.what());
    STERROR << error.error();
    bus->emit(errorChannel(process->id), protoToString(error));
  }
}

bool PtyBackend::drain(shared_ptr<PtyProcess> process) {
  char b[BUF_SIZE];
  int total = 0;
  while (total < MAX_BYTES_PER_POLL) {
    ssize_t rc = ::read(process->masterFd, b, BUF_SIZE);
    if (rc > 0) {
      total += rc;
      TerminalOutput output;
      output.set_data(string(b, rc));
      VLOG(3) << "Read " << rc << " bytes from " << process->id;
      bus->emit(outputChannel(process->id), protoToString(output));
      if (processes.find(process->id) == processes.end()) {
        // A listener closed this connection
        return true;
      }
      continue;
    }
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    if (rc < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return true;
    }
    if (rc < 0 && errno != EIO) {
      // EIO is how Linux reports a hung-up slave, anything else is a
      // genuine read failure.
      TerminalError error;
      error.set_error(string("Terminal read failed: ") + strerror(errno));
      STERROR << error.error();
      bus->emit(errorChannel(process->id), protoToString(error));
    }
    LOG(INFO) << "Terminal session ended: " << process->id;
    // Forget the id before emitting so a listener closing it is a no-op
    processes.erase(process->id);
    finish(process, false);
    return false;
  }
  return true;
}

void PtyBackend::finish(const shared_ptr<PtyProcess>& process, bool hangup) {
#ifdef WITH_UTEMPTER
  utempter_remove_record(process->masterFd);
#endif
  ::close(process->masterFd);
  if (hangup) {
    ::kill(process->childPid, SIGHUP);
  }
  Reaping r;
  r.id = process->id;
  r.childPid = process->childPid;
  r.killDeadline = loop->now() + KILL_GRACE;
  r.killed = false;
  r.report = !hangup;
  reaping.push_back(r);
  reap();
  if (!reaping.empty()) {
    schedulePoll();
  }
}

void PtyBackend::reap() {
  TimePoint now = loop->now();
  vector<Reaping> running;
  vector<pair<Reaping, optional<int>>> ended;
  for (auto& r : reaping) {
    int status = 0;
    pid_t rc;
    do {
      rc = waitpid(r.childPid, &status, WNOHANG);
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) {
      if (!r.killed && now >= r.killDeadline) {
        LOG(INFO) << "Shell " << r.childPid << " is still running, killing it";
        ::kill(r.childPid, SIGKILL);
        r.killed = true;
      }
      running.push_back(r);
      continue;
    }
    optional<int> exitStatus;
    if (rc < 0) {
      STERROR << "Could not reap " << r.childPid << ": " << strerror(errno);
    } else if (WIFEXITED(status)) {
      exitStatus = WEXITSTATUS(status);
    }
    ended.push_back(make_pair(r, exitStatus));
  }
  reaping.swap(running);

  // Listeners may open or close connections, so emit only after the list
  // is consistent again.
  for (auto& it : ended) {
    if (!it.first.report) {
      VLOG(1) << "Reaped " << it.first.childPid;
      continue;
    }
    TerminalClosed closed;
    if (it.second) {
      closed.set_exit_status(*it.second);
    }
    bus->emit(closedChannel(it.first.id), protoToString(closed));
  }
}
}  // namespace mt
